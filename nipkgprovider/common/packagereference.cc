/* packagereference.cc - Package reference token encoding and decoding
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "packagereference.h"

#include <stdexcept>

namespace NipkgProvider {

constexpr char PackageReference::SEPARATOR;
constexpr size_t PackageReference::FIELD_COUNT;

std::string PackageReference::encode() const
{
    std::string token;
    token.reserve(name.size() + version.size() + summary.size() + 2);
    token += name;
    token += SEPARATOR;
    token += version;
    token += SEPARATOR;
    token += summary;
    return token;
}

std::vector<std::string> PackageReference::split(const std::string& token)
{
    std::vector<std::string> fields;
    size_t start = 0;

    while (true) {
        size_t pos = token.find(SEPARATOR, start);
        if (pos == std::string::npos) {
            fields.push_back(token.substr(start));
            break;
        }
        fields.push_back(token.substr(start, pos - start));
        start = pos + 1;
    }

    return fields;
}

PackageReference PackageReference::decode(const std::string& token)
{
    auto fields = split(token);
    if (fields.size() < FIELD_COUNT) {
        throw std::out_of_range(
            "package reference has " + std::to_string(fields.size()) +
            " field(s), expected " + std::to_string(FIELD_COUNT));
    }
    return PackageReference(fields[0], fields[1], fields[2]);
}

std::optional<PackageReference> PackageReference::tryDecode(const std::string& token)
{
    auto fields = split(token);
    if (fields.size() < FIELD_COUNT) {
        return std::nullopt;
    }
    return PackageReference(fields[0], fields[1], fields[2]);
}

std::optional<PackageReference> PackageReference::decodeStrict(const std::string& token)
{
    auto fields = split(token);
    if (fields.size() != FIELD_COUNT || fields[0].empty()) {
        return std::nullopt;
    }
    return PackageReference(fields[0], fields[1], fields[2]);
}

// ============================================================================
// Field accessors
// ============================================================================

std::string encodePackageReference(const std::string& name,
                                   const std::string& version,
                                   const std::string& summary)
{
    return PackageReference(name, version, summary).encode();
}

std::string packageNameFromReference(const std::string& token)
{
    return PackageReference::decode(token).name;
}

std::string packageVersionFromReference(const std::string& token)
{
    return PackageReference::decode(token).version;
}

std::string packageSummaryFromReference(const std::string& token)
{
    return PackageReference::decode(token).summary;
}

} // namespace NipkgProvider

// vim:ts=4:sw=4:et
