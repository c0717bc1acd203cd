/* hostrequest.h - Callbacks the package management host offers a provider
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * Every host operation receives a HostRequest. Results are not returned
 * from the operation; they are yielded back through this object one at a
 * time, and progress is reported as nested activities.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _HOSTREQUEST_H_
#define _HOSTREQUEST_H_

#include <string>
#include <vector>

namespace NipkgProvider {

// ============================================================================
// Software Identity
// ============================================================================

/**
 * SoftwareIdentity - One package record yielded to the host
 *
 * fastPackageReference is the token the host passes back on later
 * install, uninstall and download calls.
 */
struct SoftwareIdentity {
    std::string fastPackageReference;
    std::string name;
    std::string version;
    std::string versionScheme;
    std::string summary;
    std::string source;
    std::string searchKey;
    std::string fullPath;
    std::string packageFileName;
};

// ============================================================================
// Activity Reporting
// ============================================================================

/**
 * ActivityReporter - The host's nested progress protocol
 *
 * Every activity returned by startProgress() must be completed exactly once.
 * Activity ids are non-zero.
 */
class ActivityReporter {
public:
    virtual ~ActivityReporter() = default;

    virtual int startProgress(int parentActivityId, const std::string& label) = 0;
    virtual bool progress(int activityId, int percent, const std::string& message) = 0;
    virtual bool completeProgress(int activityId, bool success) = 0;
};

// ============================================================================
// Host Request
// ============================================================================

class HostRequest : public ActivityReporter {
public:
    ~HostRequest() override = default;

    // Diagnostic channel
    virtual void debug(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;

    // Source names or locations the user passed with -Source, if any
    virtual std::vector<std::string> getSources() const = 0;

    // Yield methods return false when the host wants no more results
    virtual bool yieldFeature(const std::string& name,
                              const std::vector<std::string>& values) = 0;

    virtual bool yieldPackageSource(const std::string& name,
                                    const std::string& location,
                                    bool isTrusted,
                                    bool isRegistered,
                                    bool isValidated) = 0;

    virtual bool yieldSoftwareIdentity(const SoftwareIdentity& identity) = 0;
};

} // namespace NipkgProvider

#endif // _HOSTREQUEST_H_

// vim:ts=4:sw=4:et
