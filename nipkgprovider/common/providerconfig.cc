/* providerconfig.cc - Provider configuration file
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "providerconfig.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace NipkgProvider {

namespace {

void trim(std::string& s)
{
    size_t start = s.find_first_not_of(" \t");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos || end == std::string::npos) {
        s.clear();
        return;
    }
    s = s.substr(start, end - start + 1);
}

bool parseBool(const std::string& value)
{
    return value == "true" || value == "1" || value == "yes";
}

bool parseInt(const std::string& key, const std::string& value, int& out)
{
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        LOG(LogLevel::WARN)
            .field("key", key)
            .field("value", value)
            .message("Ignoring non-numeric configuration value")
            .emit();
        return false;
    }
}

} // namespace

std::string ProviderConfig::getConfigDir()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.config";
    }

    return ".";
}

std::string ProviderConfig::getDefaultPath()
{
    const char* path = std::getenv("NIPKG_PROVIDER_CONFIG");
    if (path && *path) {
        return path;
    }
    return getConfigDir() + "/nipkgprovider.conf";
}

ProviderConfig ProviderConfig::load(const std::string& path)
{
    std::string configPath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(configPath);
    if (!file.is_open()) {
        LOG_DEBUG("No provider configuration at " + configPath + ", using defaults");
        return ProviderConfig();
    }

    return parse(file);
}

ProviderConfig ProviderConfig::parse(std::istream& in)
{
    ProviderConfig config;

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        if (key == "parent_activity_id") {
            parseInt(key, value, config.parentActivityId);
        } else if (key == "disable_file_agent") {
            config.disableFileAgent = parseBool(value);
        } else if (key == "nipkg_path") {
            if (!value.empty()) config.nipkgPath = value;
        } else if (key == "command_timeout_ms") {
            int timeout = 0;
            if (parseInt(key, value, timeout) && timeout > 0) {
                config.commandTimeoutMs = timeout;
            }
        } else if (key == "log_level") {
            config.logLevel = logLevelFromString(value);
        } else if (key == "log_file") {
            config.logFile = value;
        } else if (key == "log_console") {
            config.logConsole = parseBool(value);
        } else {
            LOG(LogLevel::WARN)
                .field("key", key)
                .message("Unknown configuration key")
                .emit();
        }
    }

    return config;
}

void ProviderConfig::applyLogging() const
{
    std::vector<std::shared_ptr<LogSink>> sinks;

    if (!logFile.empty()) {
        auto sink = std::make_shared<FileSink>(logFile);
        if (sink->isOpen()) {
            sinks.push_back(sink);
        } else {
            LOG_WARN("Cannot open log file " + logFile);
        }
    }

    if (logConsole) {
        sinks.push_back(std::make_shared<ConsoleSink>());
    }

    auto& logger = Logger::instance();
    logger.setMinLevel(logLevel);
    logger.setConfiguredSinks(std::move(sinks));
}

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
