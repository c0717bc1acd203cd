/* packagereference.h - Package reference tokens exchanged with the host
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * The host hands a single opaque string back to the provider on install,
 * uninstall and download requests. The provider packs the package name,
 * version and summary into that string, separated by a NUL byte.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _PACKAGEREFERENCE_H_
#define _PACKAGEREFERENCE_H_

#include <string>
#include <vector>
#include <optional>

namespace NipkgProvider {

/**
 * PackageReference - Decoded form of a package reference token
 *
 * Token layout: name SEP version SEP summary, with SEP == '\0'.
 * Fields are never validated on encode; a field containing the separator
 * produces a token that decodes to different fields.
 */
struct PackageReference {
    static constexpr char SEPARATOR = '\0';
    static constexpr size_t FIELD_COUNT = 3;

    std::string name;
    std::string version;
    std::string summary;

    PackageReference() = default;
    PackageReference(const std::string& _name,
                     const std::string& _version,
                     const std::string& _summary)
        : name(_name), version(_version), summary(_summary)
    {}

    std::string encode() const;

    /**
     * Decode a token into its three leading fields.
     *
     * @throws std::out_of_range if the token has fewer than three fields
     */
    static PackageReference decode(const std::string& token);

    // Same as decode(), but returns nullopt instead of throwing
    static std::optional<PackageReference> tryDecode(const std::string& token);

    /**
     * Strict decode: the token must have exactly three fields.
     *
     * Tokens built from a field that contained the separator are rejected
     * here, while decode() returns the misparsed leading fields.
     */
    static std::optional<PackageReference> decodeStrict(const std::string& token);

    // Split on the separator, keeping empty fields
    static std::vector<std::string> split(const std::string& token);

    bool operator==(const PackageReference& other) const {
        return name == other.name && version == other.version &&
               summary == other.summary;
    }
    bool operator!=(const PackageReference& other) const {
        return !(*this == other);
    }
};

// Field accessors. Each throws std::out_of_range on a short token.
std::string encodePackageReference(const std::string& name,
                                   const std::string& version,
                                   const std::string& summary);
std::string packageNameFromReference(const std::string& token);
std::string packageVersionFromReference(const std::string& token);
std::string packageSummaryFromReference(const std::string& token);

} // namespace NipkgProvider

#endif // _PACKAGEREFERENCE_H_

// vim:ts=4:sw=4:et
