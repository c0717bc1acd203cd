/* nipkgprovider.cc - NI Package Manager provider for the package host
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "nipkgprovider.h"
#include "nipkgcliclient.h"
#include "versionfilter.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace NipkgProvider {

namespace {

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string quoteArgs(const std::vector<std::string>& args)
{
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ",";
        joined += "'" + arg + "'";
    }
    return joined;
}

std::string callingMessage(const std::string& method, const std::vector<std::string>& args = {})
{
    std::string msg = std::string("Calling '") + NipkgConstants::PACKAGE_PROVIDER_NAME +
                      "::" + method + "'";
    if (!args.empty()) {
        msg += " " + quoteArgs(args);
    }
    return msg;
}

} // namespace

// ============================================================================
// Constructors
// ============================================================================

NipkgPackageProvider::NipkgPackageProvider()
    : _config(ProviderConfig::load())
{
    _config.applyLogging();
    _client = std::make_unique<NipkgCliClient>(_config.nipkgPath, _config.commandTimeoutMs);
}

NipkgPackageProvider::NipkgPackageProvider(std::unique_ptr<PackageClient> client,
                                           const ProviderConfig& config)
    : _client(std::move(client))
    , _config(config)
{
    if (!_client) {
        _client = std::make_unique<NipkgCliClient>(_config.nipkgPath, _config.commandTimeoutMs);
    }
}

// ============================================================================
// Setup & Capabilities
// ============================================================================

OperationResult NipkgPackageProvider::initializeProvider(HostRequest& request)
{
    const std::string method = "InitializeProvider";
    return guarded(method, request, [&]() {
        debug(request, method, callingMessage(method));
        ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method);

        OperationResult result = waitForRequest(
            _client->initializeSession(NipkgConstants::PACKAGE_PROVIDER_NAME,
                                       NipkgConstants::PROVIDER_VERSION),
            "InitializeSession");
        if (!result.success) {
            reportFailure(request, timer, "Cannot start a package manager session", result);
            return result;
        }

        result = setConfiguration(NipkgConstants::DISABLE_FILE_AGENT_ATTRIBUTE,
                                  _config.disableFileAgent ? "true" : "false");
        if (!result.success) {
            reportFailure(request, timer, "Cannot configure the package manager", result);
            return result;
        }

        auto feeds = getSource(request.getSources());
        if (!feeds.status.success) {
            reportFailure(request, timer, "Cannot list feeds", feeds.status);
            return feeds.status;
        }

        for (const auto& feed : feeds.items) {
            result = waitForRequest(_client->updateFeed(feed.name), "UpdateFeed");
            if (!result.success) {
                reportFailure(request, timer, "Cannot update feed '" + feed.name + "'", result);
                return result;
            }
        }

        return OperationResult::Success("Provider initialized");
    });
}

std::map<std::string, std::vector<std::string>> NipkgPackageProvider::getFeatureMap()
{
    return {
        { NipkgConstants::FEATURE_SUPPORTED_EXTENSIONS, { NipkgConstants::NIPKG_FILE_EXTENSION } },
        { NipkgConstants::FEATURE_SUPPORTED_SCHEMES, { "http", "https", "file" } },
        // Zip local file header, end of central directory, spanned archive
        { NipkgConstants::FEATURE_MAGIC_SIGNATURES, { "504b0304", "504b0506", "504b0708" } },
    };
}

void NipkgPackageProvider::getFeatures(HostRequest& request)
{
    const std::string method = "GetFeatures";
    guarded(method, request, [&]() {
        debug(request, method, callingMessage(method));
        for (const auto& [name, values] : getFeatureMap()) {
            if (!request.yieldFeature(name, values)) {
                break;
            }
        }
        return OperationResult::Success();
    });
}

void NipkgPackageProvider::getDynamicOptions(const std::string& category, HostRequest& request)
{
    const std::string method = "GetDynamicOptions";

    // The provider defines no dynamic options in any category
    static const std::set<std::string> knownCategories = {
        "install", "provider", "source", "package"
    };

    guarded(method, request, [&]() {
        debug(request, method, callingMessage(method, {category}));
        if (knownCategories.count(toLower(category)) == 0) {
            debug(request, method,
                  std::string("Unknown category for '") + NipkgConstants::PACKAGE_PROVIDER_NAME +
                  "::GetDynamicOptions': " + category);
        }
        return OperationResult::Success();
    });
}

// ============================================================================
// Package Sources
// ============================================================================

OperationResult NipkgPackageProvider::resolvePackageSources(HostRequest& request)
{
    const std::string method = "ResolvePackageSources";
    return guarded(method, request, [&]() {
        debug(request, method, callingMessage(method));
        ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method);

        auto feeds = getSource(request.getSources());
        if (!feeds.status.success) {
            reportFailure(request, timer, "Cannot list feeds", feeds.status);
            return feeds.status;
        }

        for (const auto& feed : feeds.items) {
            if (!request.yieldPackageSource(toLower(feed.name), feed.uri,
                                            false, feed.enabled, false)) {
                break;
            }
        }

        return OperationResult::Success();
    });
}

OperationResult NipkgPackageProvider::addPackageSource(
    const std::string& name,
    const std::string& location,
    bool trusted,
    HostRequest& request)
{
    const std::string method = "AddPackageSource";
    return guarded(method, request, [&]() {
        debug(request, method,
              std::string("Entering ") + NipkgConstants::PACKAGE_PROVIDER_NAME +
              " source add -n=" + name + " -s'" + location +
              "' (we don't support trusted = '" + (trusted ? "True" : "False") + "')");
        ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method);

        std::string feedName = toLower(name.empty() ? location : name);
        std::string feedUri = location.empty() ? name : location;

        if (feedName.empty()) {
            OperationResult result = OperationResult::Failure(
                "A package source needs a name or a location", "INVALID_SOURCE");
            reportFailure(request, timer, "Cannot add package source", result);
            return result;
        }

        OperationResult result = waitForRequest(
            _client->addFeedConfiguration(feedUri, feedName), "AddFeedConfiguration");
        if (!result.success) {
            reportFailure(request, timer, "Cannot add feed '" + feedName + "'", result);
            return result;
        }

        result = waitForRequest(_client->updateFeed(feedName), "UpdateFeed");
        if (!result.success) {
            reportFailure(request, timer, "Cannot update feed '" + feedName + "'", result);
            return result;
        }

        LOG(LogLevel::INFO)
            .provider(NipkgConstants::PACKAGE_PROVIDER_NAME)
            .method(method)
            .feed(feedName)
            .field("uri", feedUri)
            .message("Feed added")
            .emit();

        return OperationResult::Success("Added feed " + feedName);
    });
}

OperationResult NipkgPackageProvider::removePackageSource(
    const std::string& name,
    HostRequest& request)
{
    const std::string method = "RemovePackageSource";
    return guarded(method, request, [&]() {
        debug(request, method,
              std::string("Entering ") + NipkgConstants::PACKAGE_PROVIDER_NAME +
              " source remove -n=" + name);
        ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method);

        std::string feedName = toLower(name);
        OperationResult result = waitForRequest(
            _client->removeFeedConfiguration(feedName), "RemoveFeedConfiguration");
        if (!result.success) {
            reportFailure(request, timer, "Cannot remove feed '" + feedName + "'", result);
            return result;
        }

        return OperationResult::Success("Removed feed " + feedName);
    });
}

// ============================================================================
// Package Discovery
// ============================================================================

OperationResult NipkgPackageProvider::findPackage(
    const std::string& name,
    const std::string& requiredVersion,
    const std::string& minimumVersion,
    const std::string& maximumVersion,
    int batchId,
    HostRequest& request)
{
    const std::string method = "FindPackage";
    return guarded(method, request, [&]() {
        debug(request, method,
              callingMessage(method, {name, requiredVersion, minimumVersion, maximumVersion,
                                      std::to_string(batchId)}));
        ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method, name);

        std::vector<std::string> requestedSources = request.getSources();
        auto feeds = getSource(requestedSources);
        if (!feeds.status.success) {
            reportFailure(request, timer, "Cannot list feeds", feeds.status);
            return feeds.status;
        }

        if (!requestedSources.empty() && feeds.items.empty()) {
            debug(request, method, "No registered feed matches the requested sources");
            return OperationResult::Success("No matching feeds");
        }

        std::vector<std::string> feedNames;
        for (const auto& feed : feeds.items) {
            feedNames.push_back(feed.name);
        }

        auto available = collectAvailablePackages(*_client, feedNames);
        if (!available.status.success) {
            // Whatever arrived before the failure is still yielded below
            reportFailure(request, timer, "Cannot list available packages", available.status);
        }

        std::string wanted = toLower(name);
        VersionFilter filter(requiredVersion, minimumVersion, maximumVersion);
        int yielded = 0;

        for (const auto& pkg : available.items) {
            if (!wanted.empty() &&
                toLower(pkg.getDisplayName()) != wanted &&
                toLower(pkg.packageName) != wanted) {
                continue;
            }
            if (!filter.matches(pkg.version)) {
                continue;
            }
            yielded++;
            if (!request.yieldSoftwareIdentity(makeSoftwareIdentity(pkg))) {
                break;
            }
        }

        LOG(LogLevel::DEBUG)
            .provider(NipkgConstants::PACKAGE_PROVIDER_NAME)
            .method(method)
            .package(name)
            .field("available", std::to_string(available.items.size()))
            .field("yielded", std::to_string(yielded))
            .message("Search finished")
            .emit();

        return available.status;
    });
}

OperationResult NipkgPackageProvider::getInstalledPackages(
    const std::string& name,
    const std::string& requiredVersion,
    const std::string& minimumVersion,
    const std::string& maximumVersion,
    HostRequest& request)
{
    const std::string method = "GetInstalledPackages";
    return guarded(method, request, [&]() {
        debug(request, method,
              callingMessage(method, {name, requiredVersion, minimumVersion, maximumVersion}));
        ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method, name);

        auto installed = collectInstalledPackages(*_client);
        if (!installed.status.success) {
            reportFailure(request, timer, "Cannot list installed packages", installed.status);
        }

        VersionFilter filter(requiredVersion, minimumVersion, maximumVersion);

        // Installed names are matched exactly, unlike findPackage
        for (const auto& pkg : installed.items) {
            if (!name.empty() && name != pkg.packageName && name != pkg.getDisplayName()) {
                continue;
            }
            if (!filter.matches(pkg.version)) {
                continue;
            }
            if (!request.yieldSoftwareIdentity(makeSoftwareIdentity(pkg))) {
                break;
            }
        }

        return installed.status;
    });
}

// ============================================================================
// Package Operations
// ============================================================================

OperationResult NipkgPackageProvider::downloadPackage(
    const std::string& fastPackageReference,
    const std::string& location,
    HostRequest& request)
{
    return guarded("DownloadPackage", request, [&]() {
        debug(request, "DownloadPackage",
              callingMessage("DownloadPackage",
                             {describeReference(fastPackageReference), location}));
        return runTransaction(Transaction::DOWNLOAD, fastPackageReference, location, request);
    });
}

OperationResult NipkgPackageProvider::installPackage(
    const std::string& fastPackageReference,
    HostRequest& request)
{
    return guarded("InstallPackage", request, [&]() {
        debug(request, "InstallPackage",
              callingMessage("InstallPackage", {describeReference(fastPackageReference)}));
        return runTransaction(Transaction::INSTALL, fastPackageReference, "", request);
    });
}

OperationResult NipkgPackageProvider::uninstallPackage(
    const std::string& fastPackageReference,
    HostRequest& request)
{
    return guarded("UninstallPackage", request, [&]() {
        debug(request, "UninstallPackage",
              callingMessage("UninstallPackage", {describeReference(fastPackageReference)}));
        return runTransaction(Transaction::UNINSTALL, fastPackageReference, "", request);
    });
}

OperationResult NipkgPackageProvider::runTransaction(
    Transaction transaction,
    const std::string& fastPackageReference,
    const std::string& location,
    HostRequest& request)
{
    std::string method;
    std::string verb;
    ProgressAdapter::Mode mode = ProgressAdapter::Mode::ROTATING;

    switch (transaction) {
        case Transaction::DOWNLOAD:
            method = "DownloadPackage";
            verb = NipkgConstants::DOWNLOAD_TEXT;
            mode = ProgressAdapter::Mode::FLAT;
            break;
        case Transaction::INSTALL:
            method = "InstallPackage";
            verb = NipkgConstants::INSTALL_TEXT;
            break;
        case Transaction::UNINSTALL:
            method = "UninstallPackage";
            verb = NipkgConstants::UNINSTALL_TEXT;
            break;
    }

    ScopedLogTimer timer(NipkgConstants::PACKAGE_PROVIDER_NAME, method);

    PackageReference reference;
    try {
        reference = PackageReference::decode(fastPackageReference);
    } catch (const std::out_of_range& e) {
        OperationResult result = OperationResult::Failure(
            std::string("Invalid package reference: ") + e.what(), "INVALID_REFERENCE");
        reportFailure(request, timer,
                      verb + " '" + describeReference(fastPackageReference) + "' failed", result);
        return result;
    }
    timer.setPackage(reference.name);

    ProgressAdapter adapter(request, mode, _config.parentActivityId, verb, reference.name);
    adapter.begin();

    ClientRequestPtr clientRequest;
    std::vector<std::string> packageNames = { reference.name };

    switch (transaction) {
        case Transaction::DOWNLOAD:
            clientRequest = _client->downloadPackage(packageNames, location, adapter.callback());
            break;
        case Transaction::INSTALL:
            clientRequest = _client->installPackages(packageNames, ACCEPT_LICENSES,
                                                     adapter.callback());
            break;
        case Transaction::UNINSTALL:
            clientRequest = _client->removePackages(packageNames, ACCEPT_LICENSES,
                                                    adapter.callback());
            break;
    }

    // The request is destroyed inside waitForRequest, so no progress event
    // can reach the adapter after this point
    OperationResult result = waitForRequest(std::move(clientRequest), method);
    adapter.finish(result.success);

    if (!result.success) {
        reportFailure(request, timer, verb + " " + reference.name + " failed", result);
    }

    SoftwareIdentity identity;
    identity.fastPackageReference = fastPackageReference;
    identity.name = reference.name;
    identity.version = reference.version;
    identity.versionScheme = NipkgConstants::VERSION_SCHEME;
    identity.summary = reference.summary;
    identity.source = NipkgConstants::PACKAGE_SOURCE;
    identity.searchKey = reference.name;
    identity.fullPath = transaction == Transaction::DOWNLOAD ? location : "";
    identity.packageFileName = reference.name + NipkgConstants::NIPKG_FILE_EXTENSION;
    request.yieldSoftwareIdentity(identity);

    return result;
}

// ============================================================================
// Helpers
// ============================================================================

SoftwareIdentity NipkgPackageProvider::makeSoftwareIdentity(const PackageMetadata& pkg)
{
    SoftwareIdentity identity;
    identity.fastPackageReference = encodePackageReference(pkg.packageName, pkg.version,
                                                           pkg.summary);
    identity.name = pkg.packageName;
    identity.version = pkg.version;
    identity.versionScheme = NipkgConstants::VERSION_SCHEME;
    identity.summary = pkg.summary;
    identity.source = NipkgConstants::PACKAGE_SOURCE;
    identity.searchKey = pkg.packageName;
    identity.packageFileName = pkg.packageName + NipkgConstants::NIPKG_FILE_EXTENSION;
    return identity;
}

std::string NipkgPackageProvider::describeReference(const std::string& fastPackageReference)
{
    std::string printable = fastPackageReference;
    std::replace(printable.begin(), printable.end(), PackageReference::SEPARATOR, '|');
    return printable;
}

Collected<FeedConfiguration> NipkgPackageProvider::getSource(const std::vector<std::string>& names)
{
    auto all = collectFeedConfigurations(*_client);
    if (!all.status.success || names.empty()) {
        return all;
    }

    std::vector<std::string> wanted;
    for (const auto& name : names) {
        wanted.push_back(toLower(name));
    }

    Collected<FeedConfiguration> selected;
    selected.status = all.status;
    for (const auto& feed : all.items) {
        std::string feedName = toLower(feed.name);
        std::string feedUri = toLower(feed.uri);
        bool matches = std::any_of(wanted.begin(), wanted.end(),
            [&](const std::string& w) { return w == feedName || w == feedUri; });
        if (matches) {
            selected.items.push_back(feed);
        }
    }
    return selected;
}

OperationResult NipkgPackageProvider::setConfiguration(const std::string& attributeName,
                                                       const std::string& attributeValue)
{
    return waitForRequest(_client->setConfiguration(attributeName, attributeValue),
                          "SetConfiguration");
}

void NipkgPackageProvider::debug(HostRequest& request,
                                 const std::string& method,
                                 const std::string& message)
{
    request.debug(message);
    LOG(LogLevel::DEBUG)
        .provider(NipkgConstants::PACKAGE_PROVIDER_NAME)
        .method(method)
        .message(message)
        .emit();
}

void NipkgPackageProvider::reportFailure(HostRequest& request,
                                         ScopedLogTimer& timer,
                                         const std::string& what,
                                         const OperationResult& result)
{
    std::string message = what + ": " + result.message;
    request.warning(message);
    timer.fail(message, result.errorCode);
}

void NipkgPackageProvider::onUnhandledException(const std::string& method,
                                                const std::exception& e,
                                                HostRequest& request)
{
    std::string message = std::string("Unexpected exception thrown in '") +
                          NipkgConstants::PACKAGE_PROVIDER_NAME + "::" + method +
                          "' -- " + e.what();

    LOG(LogLevel::ERROR)
        .provider(NipkgConstants::PACKAGE_PROVIDER_NAME)
        .method(method)
        .errorCode("UNHANDLED_EXCEPTION")
        .message(message)
        .emit();

    try {
        request.warning(message);
    } catch (const std::exception& nested) {
        LOG(LogLevel::ERROR)
            .provider(NipkgConstants::PACKAGE_PROVIDER_NAME)
            .method(method)
            .message(std::string("Host rejected the failure report: ") + nested.what())
            .emit();
    }
}

REGISTER_PACKAGE_PROVIDER(NipkgConstants::REGISTRY_NAME, NipkgPackageProvider)

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
