/* nipkgcliclient.cc - PackageClient backed by the nipkg command line tool
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "nipkgcliclient.h"
#include "structuredlog.h"

#include <apt-pkg/tagfile.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <regex>
#include <sstream>
#include <system_error>
#include <thread>
#include <sys/wait.h>
#include <signal.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

namespace NipkgProvider {

namespace {

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trimmed(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ============================================================================
// Child Process Execution
// ============================================================================

struct CommandOutcome {
    int exitCode = -1;
    bool timedOut = false;
    std::string spawnError;
    std::string callbackError;
    std::string stderrText;
};

using LineCallback = std::function<void(const std::string&)>;

// A throwing callback stops delivery but not the read loop, so the child
// is still drained and reaped.
void deliverLine(CommandOutcome& outcome, const LineCallback& onLine, const std::string& line)
{
    if (!onLine || !outcome.callbackError.empty()) return;
    try {
        onLine(line);
    } catch (const std::exception& e) {
        outcome.callbackError = e.what();
        if (outcome.callbackError.empty()) outcome.callbackError = "output callback failed";
    }
}

void drainLines(std::string& pending, CommandOutcome& outcome, const LineCallback& onLine)
{
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        deliverLine(outcome, onLine, line);
    }
}

CommandOutcome runProcess(const std::vector<std::string>& argv,
                          int timeoutMs,
                          const LineCallback& onLine)
{
    CommandOutcome outcome;

    int stdoutPipe[2], stderrPipe[2];
    if (pipe(stdoutPipe) < 0) {
        outcome.spawnError = "Failed to create pipes";
        return outcome;
    }
    if (pipe(stderrPipe) < 0) {
        close(stdoutPipe[0]); close(stdoutPipe[1]);
        outcome.spawnError = "Failed to create pipes";
        return outcome;
    }

    // Built before fork: the child may only call async-signal-safe functions
    std::vector<char*> cargv;
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(stdoutPipe[0]); close(stdoutPipe[1]);
        close(stderrPipe[0]); close(stderrPipe[1]);
        outcome.spawnError = "Fork failed";
        return outcome;
    }

    if (pid == 0) {
        close(stdoutPipe[0]);
        close(stderrPipe[0]);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        close(stdoutPipe[1]);
        close(stderrPipe[1]);

        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    close(stdoutPipe[1]);
    close(stderrPipe[1]);

    fcntl(stdoutPipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderrPipe[0], F_SETFL, O_NONBLOCK);

    bool stdoutOpen = true;
    bool stderrOpen = true;
    std::string pending;
    char buffer[4096];

    auto startTime = std::chrono::steady_clock::now();

    while (stdoutOpen || stderrOpen) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();

        if (elapsed >= timeoutMs) {
            kill(pid, SIGKILL);
            outcome.timedOut = true;
            break;
        }

        struct pollfd fds[2];
        int fdCount = 0;
        if (stdoutOpen) {
            fds[fdCount].fd = stdoutPipe[0];
            fds[fdCount].events = POLLIN;
            fds[fdCount].revents = 0;
            fdCount++;
        }
        if (stderrOpen) {
            fds[fdCount].fd = stderrPipe[0];
            fds[fdCount].events = POLLIN;
            fds[fdCount].revents = 0;
            fdCount++;
        }

        int remainingMs = static_cast<int>(timeoutMs - elapsed);
        int ret = poll(fds, fdCount, std::min(remainingMs, 100));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < fdCount; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            bool isStdout = fds[i].fd == stdoutPipe[0];
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));

            if (n > 0) {
                if (isStdout) {
                    pending.append(buffer, n);
                    drainLines(pending, outcome, onLine);
                } else {
                    outcome.stderrText.append(buffer, n);
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                if (isStdout) stdoutOpen = false;
                else stderrOpen = false;
            }
        }
    }

    if (!pending.empty() && !outcome.timedOut) {
        if (pending.back() == '\r') pending.pop_back();
        deliverLine(outcome, onLine, pending);
    }

    close(stdoutPipe[0]);
    close(stderrPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (!outcome.timedOut) {
        if (WIFEXITED(status)) {
            outcome.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.exitCode = 128 + WTERMSIG(status);
        }
    }

    return outcome;
}

OperationResult toResult(const std::string& verb, const CommandOutcome& outcome)
{
    if (!outcome.spawnError.empty()) {
        return OperationResult::Failure(outcome.spawnError, "SPAWN_FAILED", "", -1);
    }

    if (outcome.timedOut) {
        return OperationResult::Failure(
            "nipkg " + verb + " timed out", "TIMEOUT", outcome.stderrText, -1);
    }

    if (!outcome.callbackError.empty()) {
        return OperationResult::Failure(
            "nipkg " + verb + " output was not consumed: " + outcome.callbackError,
            "CALLBACK_FAILED", outcome.stderrText, outcome.exitCode);
    }

    if (outcome.exitCode == 127) {
        return OperationResult::Failure(
            "nipkg is not installed or not on PATH", "NOT_FOUND",
            outcome.stderrText, outcome.exitCode);
    }

    if (outcome.exitCode != 0) {
        std::string message;
        std::istringstream err(outcome.stderrText);
        std::string line;
        while (std::getline(err, line)) {
            line = trimmed(line);
            if (!line.empty()) {
                message = line;
                break;
            }
        }
        if (message.empty()) {
            message = "nipkg " + verb + " exited with code " +
                      std::to_string(outcome.exitCode);
        }
        return OperationResult::Failure(
            message, "EXIT_" + std::to_string(outcome.exitCode),
            outcome.stderrText, outcome.exitCode);
    }

    return OperationResult::Success("nipkg " + verb + " completed");
}

// ============================================================================
// Command Request
// ============================================================================

/**
 * CommandRequest - One nipkg invocation running on its own thread
 */
class CommandRequest : public ClientRequest {
public:
    CommandRequest(std::string verb,
                   std::vector<std::string> argv,
                   int timeoutMs,
                   std::function<void(const std::string&)> onLine,
                   std::function<void()> onFinish)
        : _verb(std::move(verb))
        , _argv(std::move(argv))
        , _timeoutMs(timeoutMs)
        , _onLine(std::move(onLine))
        , _onFinish(std::move(onFinish))
    {
        _worker = std::thread(&CommandRequest::run, this);
    }

    ~CommandRequest() override {
        std::lock_guard<std::mutex> lock(_joinMutex);
        if (_worker.joinable()) {
            _worker.join();
        }
    }

    OperationResult waitUntilComplete() override {
        {
            std::lock_guard<std::mutex> lock(_joinMutex);
            if (_worker.joinable()) {
                _worker.join();
            }
        }
        return getErrorInfo();
    }

    bool isComplete() const override {
        return _complete.load();
    }

    OperationResult getErrorInfo() const override {
        if (!_complete.load()) {
            return OperationResult::Failure("nipkg " + _verb + " is still running", "PENDING");
        }
        std::lock_guard<std::mutex> lock(_resultMutex);
        return _result;
    }

private:
    void run() {
        LOG(LogLevel::DEBUG)
            .method(_verb)
            .field("command", joinArgs())
            .message("Starting nipkg command")
            .emit();

        auto startTime = std::chrono::steady_clock::now();
        CommandOutcome outcome = runProcess(_argv, _timeoutMs, _onLine);

        if (_onFinish && outcome.spawnError.empty() && !outcome.timedOut &&
            outcome.callbackError.empty()) {
            try {
                _onFinish();
            } catch (const std::exception& e) {
                outcome.callbackError = e.what();
                if (outcome.callbackError.empty()) outcome.callbackError = "finish callback failed";
            }
        }

        OperationResult result = toResult(_verb, outcome);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);

        if (!result.success) {
            LOG(LogLevel::WARN)
                .method(_verb)
                .errorCode(result.errorCode)
                .exitCode(result.exitCode)
                .stderrText(result.rawStderr)
                .duration(result.duration)
                .message(result.message)
                .emit();
        }

        {
            std::lock_guard<std::mutex> lock(_resultMutex);
            _result = result;
        }
        _complete.store(true);
    }

    std::string joinArgs() const {
        std::string joined;
        for (const auto& arg : _argv) {
            if (!joined.empty()) joined += ' ';
            joined += arg;
        }
        return joined;
    }

    std::string _verb;
    std::vector<std::string> _argv;
    int _timeoutMs;
    std::function<void(const std::string&)> _onLine;
    std::function<void()> _onFinish;

    std::thread _worker;
    std::mutex _joinMutex;
    mutable std::mutex _resultMutex;
    std::atomic<bool> _complete{false};
    OperationResult _result;
};

} // namespace

// ============================================================================
// Stanza Parser
// ============================================================================

void StanzaParser::feedLine(const std::string& line)
{
    if (trimmed(line).empty()) {
        flushStanza();
        return;
    }
    _stanza += line;
    _stanza += '\n';
}

void StanzaParser::finish()
{
    flushStanza();
}

void StanzaParser::flushStanza()
{
    if (_stanza.empty()) return;

    // pkgTagSection points into the buffer, which must end in a blank line
    std::string text;
    text.swap(_stanza);
    text += '\n';

    pkgTagSection section;
    if (!section.Scan(text.c_str(), text.size())) {
        LOG(LogLevel::DEBUG)
            .field("stanza", text)
            .message("Skipping malformed package stanza")
            .emit();
        return;
    }

    PackageMetadata pkg;
    pkg.packageName = section.FindS("Package");
    if (pkg.packageName.empty()) return;

    pkg.version = section.FindS("Version");
    pkg.description = section.FindS("Description");
    pkg.summary = pkg.description.substr(0, pkg.description.find('\n'));
    pkg.displayName = section.FindS("DisplayName");
    if (pkg.displayName.empty()) {
        pkg.displayName = section.FindS("XB-DisplayName");
    }
    pkg.section = section.FindS("Section");
    pkg.maintainer = section.FindS("Maintainer");
    pkg.homepage = section.FindS("Homepage");
    pkg.architecture = section.FindS("Architecture");
    pkg.feed = section.FindS("Feed");

    _count++;
    if (_onPackage) {
        _onPackage(pkg);
    }
}

// ============================================================================
// Constructor
// ============================================================================

NipkgCliClient::NipkgCliClient(const std::string& executable, int timeoutMs)
    : _executable(executable)
    , _timeoutMs(timeoutMs > 0 ? timeoutMs : 1800000)
{
}

// ============================================================================
// Session & Configuration
// ============================================================================

ClientRequestPtr NipkgCliClient::initializeSession(
    const std::string& applicationName,
    const std::string& applicationVersion)
{
    LOG(LogLevel::DEBUG)
        .field("application", applicationName)
        .field("version", applicationVersion)
        .message("Initializing nipkg session")
        .emit();

    return startCommand("--version", {});
}

ClientRequestPtr NipkgCliClient::setConfiguration(
    const std::string& attributeName,
    const std::string& attributeValue)
{
    return startCommand("config-set", {attributeName + "=" + attributeValue});
}

// ============================================================================
// Feeds
// ============================================================================

ClientRequestPtr NipkgCliClient::getFeedConfigurations(FeedCallback onFeed)
{
    return startCommand("feed-list", {},
        [onFeed](const std::string& line) {
            auto feed = parseFeedLine(line);
            if (feed && onFeed) {
                onFeed(*feed);
            }
        });
}

ClientRequestPtr NipkgCliClient::addFeedConfiguration(
    const std::string& uri,
    const std::string& name)
{
    return startCommand("feed-add", {"--name=" + name, uri});
}

ClientRequestPtr NipkgCliClient::removeFeedConfiguration(const std::string& name)
{
    return startCommand("feed-remove", {name});
}

ClientRequestPtr NipkgCliClient::updateFeed(const std::string& name)
{
    return startCommand("update", {name});
}

// ============================================================================
// Package Discovery
// ============================================================================

ClientRequestPtr NipkgCliClient::getAvailablePackages(
    const std::vector<std::string>& feedNames,
    MetadataCallback onPackage)
{
    std::vector<std::string> feeds;
    for (const auto& name : feedNames) {
        feeds.push_back(toLower(name));
    }

    // Stanzas without a Feed field cannot be attributed and are kept
    auto parser = std::make_shared<StanzaParser>(
        [feeds, onPackage](const PackageMetadata& pkg) {
            if (!feeds.empty() && !pkg.feed.empty() &&
                std::find(feeds.begin(), feeds.end(), toLower(pkg.feed)) == feeds.end()) {
                return;
            }
            if (onPackage) {
                onPackage(pkg);
            }
        });

    return startCommand("info", {"*"},
        [parser](const std::string& line) { parser->feedLine(line); },
        [parser]() { parser->finish(); });
}

ClientRequestPtr NipkgCliClient::getInstalledPackages(MetadataCallback onPackage)
{
    auto parser = std::make_shared<StanzaParser>(std::move(onPackage));

    return startCommand("info-installed", {"*"},
        [parser](const std::string& line) { parser->feedLine(line); },
        [parser]() { parser->finish(); });
}

// ============================================================================
// Transactions
// ============================================================================

ClientRequestPtr NipkgCliClient::downloadPackage(
    const std::vector<std::string>& packageNames,
    const std::string& location,
    ProgressCallback onProgress)
{
    std::vector<std::string> args = {"--destination=" + location};
    args.insert(args.end(), packageNames.begin(), packageNames.end());
    return startCommand("download", args, progressLineHandler(std::move(onProgress)));
}

ClientRequestPtr NipkgCliClient::installPackages(
    const std::vector<std::string>& packageNames,
    unsigned flags,
    ProgressCallback onProgress)
{
    std::vector<std::string> args = {"-y"};
    if (flags & ACCEPT_LICENSES) {
        args.push_back("--accept-eulas");
    }
    args.insert(args.end(), packageNames.begin(), packageNames.end());
    return startCommand("install", args, progressLineHandler(std::move(onProgress)));
}

ClientRequestPtr NipkgCliClient::removePackages(
    const std::vector<std::string>& packageNames,
    unsigned flags,
    ProgressCallback onProgress)
{
    // License acceptance only applies to installs
    (void)flags;

    std::vector<std::string> args = {"-y"};
    args.insert(args.end(), packageNames.begin(), packageNames.end());
    return startCommand("remove", args, progressLineHandler(std::move(onProgress)));
}

// ============================================================================
// Output Parsing
// ============================================================================

std::optional<FeedConfiguration> NipkgCliClient::parseFeedLine(const std::string& line)
{
    std::istringstream stream(line);
    std::string name, uri, state;

    if (!(stream >> name >> uri)) {
        return std::nullopt;
    }
    if (name[0] == '#') {
        return std::nullopt;
    }

    FeedConfiguration feed(name, uri, true);
    if (stream >> state && toLower(state) == "disabled") {
        feed.enabled = false;
    }
    return feed;
}

std::optional<ProgressEvent> NipkgCliClient::parseProgressLine(const std::string& line)
{
    static const std::regex progressRegex(
        "^\\s*([A-Za-z][A-Za-z_]*)\\s+([0-9]{1,3})%\\s*(.*)$");

    std::smatch match;
    if (!std::regex_match(line, match, progressRegex)) {
        return std::nullopt;
    }

    int percent = std::min(std::stoi(match[2].str()), 100);
    return ProgressEvent(match[1].str(), percent, trimmed(match[3].str()));
}

std::vector<PackageMetadata> NipkgCliClient::parsePackageInfo(const std::string& output)
{
    std::vector<PackageMetadata> packages;
    StanzaParser parser([&packages](const PackageMetadata& pkg) {
        packages.push_back(pkg);
    });

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        parser.feedLine(line);
    }
    parser.finish();

    return packages;
}

std::vector<std::string> NipkgCliClient::buildArguments(
    const std::string& executable,
    const std::string& verb,
    const std::vector<std::string>& args)
{
    std::vector<std::string> argv = {executable, verb};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

// ============================================================================
// Private Helpers
// ============================================================================

ClientRequestPtr NipkgCliClient::startCommand(
    const std::string& verb,
    const std::vector<std::string>& args,
    LineHandler onLine,
    FinishHandler onFinish)
{
    try {
        return std::make_unique<CommandRequest>(
            verb, buildArguments(_executable, verb, args), _timeoutMs,
            std::move(onLine), std::move(onFinish));
    } catch (const std::system_error& e) {
        // Thread creation failed
        return std::make_unique<CompletedRequest>(
            OperationResult::Failure(std::string("Cannot start nipkg ") + verb + ": " + e.what(),
                                     "SPAWN_FAILED", "", -1));
    }
}

NipkgCliClient::LineHandler NipkgCliClient::progressLineHandler(ProgressCallback onProgress)
{
    return [onProgress](const std::string& line) {
        auto event = parseProgressLine(line);
        if (!event) {
            if (!trimmed(line).empty()) {
                LOG(LogLevel::DEBUG).message("nipkg: " + line).emit();
            }
            return;
        }
        if (onProgress) {
            onProgress(*event);
        }
    };
}

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
