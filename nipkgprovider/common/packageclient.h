/* packageclient.h - Abstract interface for the NI package client
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

/*
 * Vendor Client Abstraction Layer
 * ===============================
 *
 * The provider never installs, removes or resolves anything itself. All of
 * that work is done by the NI package client behind this interface:
 *
 *   PackageClient (interface)
 *       ├── NipkgCliClient  - Drives the nipkg command line tool
 *       └── (tests)         - Scripted clients for the provider tests
 *
 * Every call starts a request and returns a ClientRequest handle right away.
 * The caller blocks in waitUntilComplete(). Results and progress are pushed
 * through the callback passed to that one call, possibly from another
 * thread, and always before waitUntilComplete() returns.
 */

#ifndef _PACKAGECLIENT_H_
#define _PACKAGECLIENT_H_

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <mutex>

namespace NipkgProvider {

// ============================================================================
// Operation Result
// ============================================================================

/**
 * OperationResult - Outcome of a client request or a provider operation
 *
 * A failed result is an explicit value; nothing in the client or provider
 * reports failure by throwing.
 */
struct OperationResult {
    bool success = false;
    std::string message;            // Human-readable message
    std::string errorCode;          // Client error code, if any
    std::string rawStderr;          // Client diagnostic output
    int exitCode = 0;

    std::chrono::milliseconds duration{0};

    static OperationResult Success(const std::string& msg = "") {
        OperationResult r;
        r.success = true;
        r.message = msg;
        return r;
    }

    static OperationResult Failure(const std::string& msg,
                                   const std::string& code = "",
                                   const std::string& stderr_ = "",
                                   int exit = 1) {
        OperationResult r;
        r.success = false;
        r.message = msg;
        r.errorCode = code;
        r.rawStderr = stderr_;
        r.exitCode = exit;
        return r;
    }
};

// ============================================================================
// Client Data Types
// ============================================================================

struct FeedConfiguration {
    std::string name;
    std::string uri;
    bool enabled = true;

    FeedConfiguration() = default;
    FeedConfiguration(const std::string& _name, const std::string& _uri, bool _enabled = true)
        : name(_name), uri(_uri), enabled(_enabled)
    {}
};

/**
 * PackageMetadata - One package as described by a feed or the installed set
 */
struct PackageMetadata {
    std::string packageName;        // Unique package name (ni-daqmx)
    std::string displayName;        // Localized display name, may be empty
    std::string version;
    std::string summary;            // First line of the description
    std::string description;        // Full description text

    std::string section;
    std::string maintainer;
    std::string homepage;
    std::string architecture;
    std::string feed;               // Feed the package was listed from

    PackageMetadata() = default;
    PackageMetadata(const std::string& _name,
                    const std::string& _version,
                    const std::string& _summary = "")
        : packageName(_name), version(_version), summary(_summary)
    {}

    const std::string& getDisplayName() const {
        return displayName.empty() ? packageName : displayName;
    }
};

/**
 * ProgressEvent - One progress notification from a running transaction
 */
struct ProgressEvent {
    std::string actionCode;         // Phase of the transaction (Downloading, Installing, ...)
    int percentageCompleted = 0;    // 0..100 within the phase
    std::string argument;           // Free-form text, usually a package or file name

    ProgressEvent() = default;
    ProgressEvent(const std::string& action, int percent, const std::string& arg)
        : actionCode(action), percentageCompleted(percent), argument(arg)
    {}
};

enum TransactionFlags : unsigned {
    TRANSACTION_NONE = 0,
    ACCEPT_LICENSES = 1u << 0
};

using FeedCallback = std::function<void(const FeedConfiguration& feed)>;
using MetadataCallback = std::function<void(const PackageMetadata& package)>;
using ProgressCallback = std::function<void(const ProgressEvent& event)>;

// ============================================================================
// Client Request Handle
// ============================================================================

class ClientRequest {
public:
    virtual ~ClientRequest() = default;

    /**
     * Block until the request has finished.
     *
     * @return Final status of the request. Calling it again returns the
     *         same status without waiting.
     */
    virtual OperationResult waitUntilComplete() = 0;

    virtual bool isComplete() const = 0;

    /**
     * Status of a completed request, or a failure if it is still running
     */
    virtual OperationResult getErrorInfo() const = 0;
};

using ClientRequestPtr = std::unique_ptr<ClientRequest>;

/**
 * CompletedRequest - Handle for requests that finished before returning
 *
 * Used for requests that fail to start and by clients that do their work
 * synchronously.
 */
class CompletedRequest : public ClientRequest {
public:
    explicit CompletedRequest(OperationResult result) : _result(std::move(result)) {}

    OperationResult waitUntilComplete() override { return _result; }
    bool isComplete() const override { return true; }
    OperationResult getErrorInfo() const override { return _result; }

private:
    OperationResult _result;
};

// ============================================================================
// Package Client Interface
// ============================================================================

/**
 * PackageClient - The NI package management engine as seen by the provider
 *
 * Thread Safety:
 *   One request at a time. Callbacks may run on a client thread, but never
 *   after the request's waitUntilComplete() has returned.
 */
class PackageClient {
public:
    virtual ~PackageClient() = default;

    // ========================================================================
    // Session & Configuration
    // ========================================================================

    virtual ClientRequestPtr initializeSession(
        const std::string& applicationName,
        const std::string& applicationVersion) = 0;

    virtual ClientRequestPtr setConfiguration(
        const std::string& attributeName,
        const std::string& attributeValue) = 0;

    // ========================================================================
    // Feeds
    // ========================================================================

    virtual ClientRequestPtr getFeedConfigurations(FeedCallback onFeed) = 0;

    virtual ClientRequestPtr addFeedConfiguration(
        const std::string& uri,
        const std::string& name) = 0;

    virtual ClientRequestPtr removeFeedConfiguration(const std::string& name) = 0;

    virtual ClientRequestPtr updateFeed(const std::string& name) = 0;

    // ========================================================================
    // Package Discovery
    // ========================================================================

    /**
     * List packages available from the given feeds (all feeds if empty)
     */
    virtual ClientRequestPtr getAvailablePackages(
        const std::vector<std::string>& feedNames,
        MetadataCallback onPackage) = 0;

    virtual ClientRequestPtr getInstalledPackages(MetadataCallback onPackage) = 0;

    // ========================================================================
    // Transactions
    // ========================================================================

    virtual ClientRequestPtr downloadPackage(
        const std::vector<std::string>& packageNames,
        const std::string& location,
        ProgressCallback onProgress) = 0;

    virtual ClientRequestPtr installPackages(
        const std::vector<std::string>& packageNames,
        unsigned flags,
        ProgressCallback onProgress) = 0;

    virtual ClientRequestPtr removePackages(
        const std::vector<std::string>& packageNames,
        unsigned flags,
        ProgressCallback onProgress) = 0;
};

// ============================================================================
// Collected Results
// ============================================================================

/**
 * Collected - Items delivered by one request, plus the request's status
 *
 * status.success with an empty items vector means "nothing found", which is
 * distinct from a failed request.
 */
template <typename T>
struct Collected {
    OperationResult status;
    std::vector<T> items;
};

// Wait for a request, treating a null handle as a failure to start
OperationResult waitForRequest(ClientRequestPtr request, const std::string& what);

Collected<FeedConfiguration> collectFeedConfigurations(PackageClient& client);

Collected<PackageMetadata> collectAvailablePackages(
    PackageClient& client,
    const std::vector<std::string>& feedNames);

Collected<PackageMetadata> collectInstalledPackages(PackageClient& client);

} // namespace NipkgProvider

#endif // _PACKAGECLIENT_H_

// vim:ts=4:sw=4:et
