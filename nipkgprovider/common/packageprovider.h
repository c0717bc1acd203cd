/* packageprovider.h - Host-facing package provider interface
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This file defines the operations a package management host invokes on a
 * provider, and the registry the host uses to create providers by name.
 *
 * To add a provider:
 *   1. Implement PackageProvider
 *   2. REGISTER_PACKAGE_PROVIDER("name", ProviderClass) in its source file
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _PACKAGEPROVIDER_H_
#define _PACKAGEPROVIDER_H_

#include "hostrequest.h"
#include "packageclient.h"

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <map>
#include <mutex>

namespace NipkgProvider {

// ============================================================================
// Package Provider Interface
// ============================================================================

/**
 * PackageProvider - Operations the host calls on a provider
 *
 * The host calls one operation at a time and waits for it to return.
 * Results go back through the HostRequest; the returned OperationResult
 * tells a direct caller whether the underlying client work failed.
 *
 * Error Handling:
 *   Operations must not throw. Failures are reported on the request's
 *   diagnostic channel and in the returned OperationResult.
 */
class PackageProvider {
public:
    virtual ~PackageProvider() = default;

    // ========================================================================
    // Provider Identity
    // ========================================================================

    virtual std::string getPackageProviderName() const = 0;
    virtual std::string getProviderVersion() const = 0;

    // ========================================================================
    // Setup & Capabilities
    // ========================================================================

    virtual OperationResult initializeProvider(HostRequest& request) = 0;

    virtual void getFeatures(HostRequest& request) = 0;

    virtual void getDynamicOptions(const std::string& category, HostRequest& request) = 0;

    // ========================================================================
    // Package Sources
    // ========================================================================

    virtual OperationResult resolvePackageSources(HostRequest& request) = 0;

    virtual OperationResult addPackageSource(
        const std::string& name,
        const std::string& location,
        bool trusted,
        HostRequest& request) = 0;

    virtual OperationResult removePackageSource(
        const std::string& name,
        HostRequest& request) = 0;

    // ========================================================================
    // Package Discovery
    // ========================================================================

    virtual OperationResult findPackage(
        const std::string& name,
        const std::string& requiredVersion,
        const std::string& minimumVersion,
        const std::string& maximumVersion,
        int batchId,
        HostRequest& request) = 0;

    virtual OperationResult getInstalledPackages(
        const std::string& name,
        const std::string& requiredVersion,
        const std::string& minimumVersion,
        const std::string& maximumVersion,
        HostRequest& request) = 0;

    // ========================================================================
    // Package Operations
    // ========================================================================

    virtual OperationResult downloadPackage(
        const std::string& fastPackageReference,
        const std::string& location,
        HostRequest& request) = 0;

    virtual OperationResult installPackage(
        const std::string& fastPackageReference,
        HostRequest& request) = 0;

    virtual OperationResult uninstallPackage(
        const std::string& fastPackageReference,
        HostRequest& request) = 0;
};

using ProviderFactory = std::function<std::unique_ptr<PackageProvider>()>;

// ============================================================================
// Provider Registry
// ============================================================================

/**
 * ProviderRegistry - Process-wide table of provider factories
 *
 * Names are matched exactly. Registering a name twice replaces the factory.
 */
class ProviderRegistry {
public:
    static ProviderRegistry& instance() {
        static ProviderRegistry registry;
        return registry;
    }

    void registerProvider(const std::string& name, ProviderFactory factory) {
        std::lock_guard<std::mutex> lock(_mutex);
        _factories[name] = std::move(factory);
    }

    void unregisterProvider(const std::string& name) {
        std::lock_guard<std::mutex> lock(_mutex);
        _factories.erase(name);
    }

    // nullptr if no factory is registered under name
    std::unique_ptr<PackageProvider> createProvider(const std::string& name) {
        ProviderFactory factory;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _factories.find(name);
            if (it == _factories.end() || !it->second) {
                return nullptr;
            }
            factory = it->second;
        }
        return factory();
    }

    bool hasProvider(const std::string& name) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _factories.find(name) != _factories.end();
    }

    std::vector<std::string> getRegisteredNames() const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<std::string> names;
        for (const auto& [name, _] : _factories) {
            names.push_back(name);
        }
        return names;
    }

private:
    ProviderRegistry() = default;
    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    mutable std::mutex _mutex;
    std::map<std::string, ProviderFactory> _factories;
};

/**
 * REGISTER_PACKAGE_PROVIDER - Register a provider at static initialization
 *
 * Usage (in the provider's .cc file):
 *   REGISTER_PACKAGE_PROVIDER("nipkg", NipkgPackageProvider)
 */
#define REGISTER_PACKAGE_PROVIDER(name, ProviderClass) \
    namespace { \
        struct ProviderClass##Registrar { \
            ProviderClass##Registrar() { \
                NipkgProvider::ProviderRegistry::instance().registerProvider( \
                    name, \
                    []() -> std::unique_ptr<NipkgProvider::PackageProvider> { \
                        return std::make_unique<ProviderClass>(); \
                    } \
                ); \
            } \
        } g_##ProviderClass##Registrar; \
    }

} // namespace NipkgProvider

#endif // _PACKAGEPROVIDER_H_

// vim:ts=4:sw=4:et
