/* versionfilter.cc - Required/minimum/maximum version matching
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "versionfilter.h"

#include <apt-pkg/debversion.h>

namespace NipkgProvider {

int compareVersions(const std::string& a, const std::string& b)
{
    return debVS.CmpVersion(a, b);
}

bool VersionFilter::matches(const std::string& version) const
{
    if (!requiredVersion.empty()) {
        return compareVersions(version, requiredVersion) == 0;
    }

    if (!minimumVersion.empty() && compareVersions(version, minimumVersion) < 0) {
        return false;
    }

    if (!maximumVersion.empty() && compareVersions(version, maximumVersion) > 0) {
        return false;
    }

    return true;
}

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
