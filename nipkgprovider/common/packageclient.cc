/* packageclient.cc - Per-call result collection for package client requests
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "packageclient.h"
#include "structuredlog.h"

namespace NipkgProvider {

namespace {

// Owns the items pushed by one request. The client may call add() from its
// own thread while the caller is blocked in waitUntilComplete().
template <typename T>
class Collector {
public:
    void add(const T& item) {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.push_back(item);
    }

    std::vector<T> take() {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::move(_items);
    }

private:
    std::mutex _mutex;
    std::vector<T> _items;
};

} // namespace

OperationResult waitForRequest(ClientRequestPtr request, const std::string& what)
{
    if (!request) {
        return OperationResult::Failure(what + " could not be started", "NO_REQUEST");
    }

    auto startTime = std::chrono::steady_clock::now();
    OperationResult result = request->waitUntilComplete();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    if (!result.success) {
        LOG(LogLevel::DEBUG)
            .message(what + " failed: " + result.message)
            .errorCode(result.errorCode)
            .stderrText(result.rawStderr)
            .exitCode(result.exitCode)
            .duration(result.duration)
            .emit();
    }

    return result;
}

Collected<FeedConfiguration> collectFeedConfigurations(PackageClient& client)
{
    Collector<FeedConfiguration> collector;
    Collected<FeedConfiguration> collected;

    collected.status = waitForRequest(
        client.getFeedConfigurations(
            [&collector](const FeedConfiguration& feed) { collector.add(feed); }),
        "GetFeedConfigurations");
    collected.items = collector.take();

    return collected;
}

Collected<PackageMetadata> collectAvailablePackages(
    PackageClient& client,
    const std::vector<std::string>& feedNames)
{
    Collector<PackageMetadata> collector;
    Collected<PackageMetadata> collected;

    collected.status = waitForRequest(
        client.getAvailablePackages(
            feedNames,
            [&collector](const PackageMetadata& pkg) { collector.add(pkg); }),
        "GetAvailablePackages");
    collected.items = collector.take();

    return collected;
}

Collected<PackageMetadata> collectInstalledPackages(PackageClient& client)
{
    Collector<PackageMetadata> collector;
    Collected<PackageMetadata> collected;

    collected.status = waitForRequest(
        client.getInstalledPackages(
            [&collector](const PackageMetadata& pkg) { collector.add(pkg); }),
        "GetInstalledPackages");
    collected.items = collector.take();

    return collected;
}

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
