/* structuredlog.h - Structured JSON logging for the NI package provider
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * Every entry carries the provider name, the host method and the package
 * or feed it concerns. Entries always land in a bounded memory history;
 * the provider configuration decides whether they also go to a JSON-lines
 * file or the console.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _STRUCTUREDLOG_H_
#define _STRUCTUREDLOG_H_

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <mutex>
#include <fstream>
#include <sstream>
#include <iostream>
#include <memory>
#include <iomanip>
#include <ctime>
#include <deque>

namespace NipkgProvider {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// Level names as written in nipkgprovider.conf. Unknown names map to INFO.
inline LogLevel logLevelFromString(const std::string& name) {
    if (name == "DEBUG" || name == "debug") return LogLevel::DEBUG;
    if (name == "WARN" || name == "warn" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR" || name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    LogLevel level = LogLevel::INFO;
    std::string message;

    std::string provider;           // "NIPKG"
    std::string method;             // InstallPackage, FindPackage, ...
    std::string package;
    std::string feed;

    std::string errorCode;          // OperationResult error code
    std::string rawStderr;          // nipkg stderr, when a command failed
    int exitCode = 0;

    std::chrono::milliseconds duration{0};
    std::map<std::string, std::string> fields;

    std::string toJson() const {
        std::ostringstream json;

        auto time = std::chrono::system_clock::to_time_t(timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()) % 1000;
        std::tm utc{};
        gmtime_r(&time, &utc);
        json << "{\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\""
             << ",\"level\":\"" << logLevelToString(level) << "\"";

        auto text = [&json](const char* key, const std::string& value, bool always) {
            if (always || !value.empty())
                json << ",\"" << key << "\":\"" << escapeJson(value) << "\"";
        };
        text("message", message, true);
        text("provider", provider, false);
        text("method", method, false);
        text("package", package, false);
        text("feed", feed, false);
        text("errorCode", errorCode, false);
        text("stderr", rawStderr, false);

        if (exitCode != 0)
            json << ",\"exitCode\":" << exitCode;
        if (duration.count() > 0)
            json << ",\"durationMs\":" << duration.count();
        for (const auto& [key, value] : fields)
            json << ",\"" << escapeJson(key) << "\":\"" << escapeJson(value) << "\"";

        json << "}";
        return json.str();
    }

    // "12:00:01 [WARN] [NIPKG] InstallPackage (ni-daqmx): message (15ms)"
    std::string toReadable() const {
        std::ostringstream line;
        auto time = std::chrono::system_clock::to_time_t(timestamp);
        std::tm local{};
        localtime_r(&time, &local);

        line << std::put_time(&local, "%H:%M:%S") << " [" << logLevelToString(level) << "]";
        if (!provider.empty()) line << " [" << provider << "]";
        if (!method.empty()) line << " " << method;
        if (!package.empty()) line << " (" << package << ")";
        line << ": " << message;
        if (duration.count() > 0) line << " (" << duration.count() << "ms)";
        return line.str();
    }

private:
    // Reference tokens carry NUL separators, so control characters are
    // always written as escapes.
    static std::string escapeJson(const std::string& s) {
        std::ostringstream escaped;
        for (char c : s) {
            unsigned char byte = static_cast<unsigned char>(c);
            if (c == '"' || c == '\\') {
                escaped << '\\' << c;
            } else if (c == '\n') {
                escaped << "\\n";
            } else if (c == '\r') {
                escaped << "\\r";
            } else if (c == '\t') {
                escaped << "\\t";
            } else if (byte < 0x20) {
                escaped << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(byte) << std::dec;
            } else {
                escaped << c;
            }
        }
        return escaped.str();
    }
};

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
};

// One JSON object per line, flushed as written so other processes can tail it
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path) : _file(path, std::ios::app) {}

    bool isOpen() const { return _file.is_open(); }

    void write(const LogEntry& entry) override {
        if (_file.is_open())
            _file << entry.toJson() << std::endl;
    }

private:
    std::ofstream _file;
};

class ConsoleSink : public LogSink {
public:
    void write(const LogEntry& entry) override {
        std::cerr << entry.toReadable() << std::endl;
    }
};

/**
 * MemorySink - The most recent entries, oldest dropped first
 */
class MemorySink : public LogSink {
public:
    explicit MemorySink(size_t capacity) : _capacity(capacity) {}

    void write(const LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(entry);
        if (_entries.size() > _capacity)
            _entries.pop_front();
    }

    std::vector<LogEntry> getEntries() const {
        return getEntriesFiltered(LogLevel::DEBUG);
    }

    // Entries at or above minLevel, restricted to one host method if given
    std::vector<LogEntry> getEntriesFiltered(LogLevel minLevel,
                                             const std::string& method = "") const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<LogEntry> result;
        for (const auto& entry : _entries) {
            if (entry.level >= minLevel && (method.empty() || entry.method == method))
                result.push_back(entry);
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
    }

private:
    size_t _capacity;
    std::deque<LogEntry> _entries;
    mutable std::mutex _mutex;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Logger - Process-wide logger
 *
 * The memory sink is permanent. The configured sinks (file, console) are
 * replaced as a set each time a provider applies its configuration, so a
 * host that creates several providers still writes each entry once.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setConfiguredSinks(std::vector<std::shared_ptr<LogSink>> sinks) {
        std::lock_guard<std::mutex> lock(_mutex);
        _configured = std::move(sinks);
    }

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(_mutex);
        _minLevel = level;
    }

    LogLevel getMinLevel() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _minLevel;
    }

    void log(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (entry.level < _minLevel) return;
        _memorySink->write(entry);
        for (auto& sink : _configured)
            sink->write(entry);
    }

    std::shared_ptr<MemorySink> getMemorySink() { return _memorySink; }

private:
    Logger() : _memorySink(std::make_shared<MemorySink>(1000)) {}

    mutable std::mutex _mutex;
    std::shared_ptr<MemorySink> _memorySink;
    std::vector<std::shared_ptr<LogSink>> _configured;
    LogLevel _minLevel = LogLevel::INFO;
};

// ============================================================================
// Log Builder
// ============================================================================

// LOG(LogLevel::WARN).method("InstallPackage").package(name).message(m).emit();
class LogBuilder {
public:
    explicit LogBuilder(LogLevel level) { _entry.level = level; }

    LogBuilder& message(const std::string& text) { _entry.message = text; return *this; }
    LogBuilder& provider(const std::string& name) { _entry.provider = name; return *this; }
    LogBuilder& method(const std::string& name) { _entry.method = name; return *this; }
    LogBuilder& package(const std::string& name) { _entry.package = name; return *this; }
    LogBuilder& feed(const std::string& name) { _entry.feed = name; return *this; }
    LogBuilder& errorCode(const std::string& code) { _entry.errorCode = code; return *this; }
    LogBuilder& stderrText(const std::string& text) { _entry.rawStderr = text; return *this; }
    LogBuilder& exitCode(int code) { _entry.exitCode = code; return *this; }
    LogBuilder& duration(std::chrono::milliseconds ms) { _entry.duration = ms; return *this; }

    LogBuilder& field(const std::string& key, const std::string& value) {
        _entry.fields[key] = value;
        return *this;
    }

    void emit() { Logger::instance().log(_entry); }

private:
    LogEntry _entry;
};

// ============================================================================
// Host Operation Timer
// ============================================================================

/**
 * ScopedLogTimer - One entry per host operation, written when it leaves scope
 *
 * A completed operation logs at DEBUG. After fail() it logs at WARN with
 * the failure text and error code.
 */
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& provider,
                   const std::string& method,
                   const std::string& package = "")
        : _provider(provider)
        , _method(method)
        , _package(package)
        , _start(std::chrono::steady_clock::now())
    {}

    ~ScopedLogTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - _start);
        bool failed = !_error.empty() || !_errorCode.empty();

        LogBuilder(failed ? LogLevel::WARN : LogLevel::DEBUG)
            .message(failed ? _method + " failed: " + _error : _method + " completed")
            .provider(_provider)
            .method(_method)
            .package(_package)
            .errorCode(_errorCode)
            .duration(elapsed)
            .emit();
    }

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

    void setPackage(const std::string& package) { _package = package; }

    void fail(const std::string& error, const std::string& code = "") {
        _error = error.empty() ? "unknown error" : error;
        _errorCode = code;
    }

private:
    std::string _provider;
    std::string _method;
    std::string _package;
    std::chrono::steady_clock::time_point _start;
    std::string _error;
    std::string _errorCode;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG(level) NipkgProvider::LogBuilder(level)

#define LOG_DEBUG(msg) LOG(NipkgProvider::LogLevel::DEBUG).message(msg).emit()
#define LOG_INFO(msg)  LOG(NipkgProvider::LogLevel::INFO).message(msg).emit()
#define LOG_WARN(msg)  LOG(NipkgProvider::LogLevel::WARN).message(msg).emit()

} // namespace NipkgProvider

#endif // _STRUCTUREDLOG_H_

// vim:ts=4:sw=4:et
