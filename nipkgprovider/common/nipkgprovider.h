/* nipkgprovider.h - NI Package Manager provider for the package host
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This file implements the PackageProvider interface on top of a
 * PackageClient. Every host operation is one blocking client request
 * whose results are translated into host yields and progress activities.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _NIPKGPROVIDER_H_
#define _NIPKGPROVIDER_H_

#include "packageprovider.h"
#include "packagereference.h"
#include "progressadapter.h"
#include "providerconfig.h"
#include "structuredlog.h"

#include <exception>

namespace NipkgProvider {

namespace NipkgConstants {
    constexpr const char* PACKAGE_PROVIDER_NAME = "NIPKG";
    constexpr const char* REGISTRY_NAME = "nipkg";
    constexpr const char* PROVIDER_VERSION = "1.0.0.0";
    constexpr const char* VERSION_SCHEME = "MultiPartNumeric";
    constexpr const char* PACKAGE_SOURCE = "NI Package Manager";
    constexpr const char* NIPKG_FILE_EXTENSION = ".nipkg";

    constexpr const char* INSTALL_TEXT = "Installing";
    constexpr const char* UNINSTALL_TEXT = "Uninstalling";
    constexpr const char* DOWNLOAD_TEXT = "Downloading";

    constexpr const char* DISABLE_FILE_AGENT_ATTRIBUTE = "nipkg.disablefileagent";

    // Feature names understood by the host
    constexpr const char* FEATURE_SUPPORTED_EXTENSIONS = "supported-extensions";
    constexpr const char* FEATURE_SUPPORTED_SCHEMES = "supported-schemes";
    constexpr const char* FEATURE_MAGIC_SIGNATURES = "magic-signatures";
}

/**
 * NipkgPackageProvider - PackageProvider for .nipkg packages
 *
 * Owns its PackageClient. Progress state lives in a ProgressAdapter on the
 * stack of each install/uninstall/download call, so nothing about one
 * operation outlives it.
 */
class NipkgPackageProvider : public PackageProvider {
public:
    // Loads the configuration file and drives the nipkg command line tool
    NipkgPackageProvider();

    NipkgPackageProvider(std::unique_ptr<PackageClient> client,
                         const ProviderConfig& config);

    ~NipkgPackageProvider() override = default;

    // ========================================================================
    // Provider Identity
    // ========================================================================

    std::string getPackageProviderName() const override {
        return NipkgConstants::PACKAGE_PROVIDER_NAME;
    }
    std::string getProviderVersion() const override {
        return NipkgConstants::PROVIDER_VERSION;
    }

    // ========================================================================
    // Setup & Capabilities
    // ========================================================================

    OperationResult initializeProvider(HostRequest& request) override;

    void getFeatures(HostRequest& request) override;

    void getDynamicOptions(const std::string& category, HostRequest& request) override;

    // ========================================================================
    // Package Sources
    // ========================================================================

    OperationResult resolvePackageSources(HostRequest& request) override;

    OperationResult addPackageSource(
        const std::string& name,
        const std::string& location,
        bool trusted,
        HostRequest& request) override;

    OperationResult removePackageSource(
        const std::string& name,
        HostRequest& request) override;

    // ========================================================================
    // Package Discovery
    // ========================================================================

    OperationResult findPackage(
        const std::string& name,
        const std::string& requiredVersion,
        const std::string& minimumVersion,
        const std::string& maximumVersion,
        int batchId,
        HostRequest& request) override;

    OperationResult getInstalledPackages(
        const std::string& name,
        const std::string& requiredVersion,
        const std::string& minimumVersion,
        const std::string& maximumVersion,
        HostRequest& request) override;

    // ========================================================================
    // Package Operations
    // ========================================================================

    OperationResult downloadPackage(
        const std::string& fastPackageReference,
        const std::string& location,
        HostRequest& request) override;

    OperationResult installPackage(
        const std::string& fastPackageReference,
        HostRequest& request) override;

    OperationResult uninstallPackage(
        const std::string& fastPackageReference,
        HostRequest& request) override;

    // ========================================================================
    // Helpers
    // ========================================================================

    const ProviderConfig& getConfig() const { return _config; }

    static std::map<std::string, std::vector<std::string>> getFeatureMap();

    // Identity record for a package listed by the client
    static SoftwareIdentity makeSoftwareIdentity(const PackageMetadata& pkg);

    // Token with separators made visible, for diagnostics
    static std::string describeReference(const std::string& fastPackageReference);

private:
    enum class Transaction {
        DOWNLOAD,
        INSTALL,
        UNINSTALL
    };

    /**
     * Feed configurations matching the given names or URIs
     * (case-insensitive). All feeds when names is empty.
     */
    Collected<FeedConfiguration> getSource(const std::vector<std::string>& names);

    OperationResult runTransaction(Transaction transaction,
                                   const std::string& fastPackageReference,
                                   const std::string& location,
                                   HostRequest& request);

    OperationResult setConfiguration(const std::string& attributeName,
                                     const std::string& attributeValue);

    void debug(HostRequest& request, const std::string& method, const std::string& message);

    void reportFailure(HostRequest& request,
                       ScopedLogTimer& timer,
                       const std::string& what,
                       const OperationResult& result);

    void onUnhandledException(const std::string& method,
                              const std::exception& e,
                              HostRequest& request);

    // Run an operation body; an exception becomes a logged failure
    template <typename Body>
    OperationResult guarded(const std::string& method, HostRequest& request, Body&& body) {
        try {
            return body();
        } catch (const std::exception& e) {
            onUnhandledException(method, e, request);
            return OperationResult::Failure(e.what(), "UNHANDLED_EXCEPTION");
        }
    }

    std::unique_ptr<PackageClient> _client;
    ProviderConfig _config;
};

} // namespace NipkgProvider

#endif // _NIPKGPROVIDER_H_

// vim:ts=4:sw=4:et
