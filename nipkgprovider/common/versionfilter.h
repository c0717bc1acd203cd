/* versionfilter.h - Required/minimum/maximum version matching
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * NI packages follow Debian version rules (epoch:upstream-revision), so
 * versions are compared with libapt-pkg's Debian versioning system.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _VERSIONFILTER_H_
#define _VERSIONFILTER_H_

#include <string>

namespace NipkgProvider {

// <0, 0, >0 like strcmp
int compareVersions(const std::string& a, const std::string& b);

/**
 * VersionFilter - Version bounds passed with a host find request
 *
 * A non-empty requiredVersion overrides both bounds. Empty bounds are open.
 */
struct VersionFilter {
    std::string requiredVersion;
    std::string minimumVersion;
    std::string maximumVersion;

    VersionFilter() = default;
    VersionFilter(const std::string& required,
                  const std::string& minimum,
                  const std::string& maximum)
        : requiredVersion(required), minimumVersion(minimum), maximumVersion(maximum)
    {}

    bool isEmpty() const {
        return requiredVersion.empty() && minimumVersion.empty() && maximumVersion.empty();
    }

    bool matches(const std::string& version) const;
};

} // namespace NipkgProvider

#endif // _VERSIONFILTER_H_

// vim:ts=4:sw=4:et
