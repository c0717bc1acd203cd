/* nipkgcliclient.h - PackageClient backed by the nipkg command line tool
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * Each request runs one nipkg command on a worker thread. Standard output
 * is streamed line by line into the request's callback: feed lines, package
 * stanzas or progress lines depending on the command.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _NIPKGCLICLIENT_H_
#define _NIPKGCLICLIENT_H_

#include "packageclient.h"

#include <optional>

namespace NipkgProvider {

/**
 * StanzaParser - Incremental reader for nipkg info output
 *
 * nipkg prints Debian control stanzas separated by blank lines. Lines are
 * buffered until a stanza ends, then the stanza is parsed with libapt-pkg's
 * pkgTagSection. Stanzas without a Package field are skipped.
 */
class StanzaParser {
public:
    explicit StanzaParser(MetadataCallback onPackage) : _onPackage(std::move(onPackage)) {}

    void feedLine(const std::string& line);
    void finish();

    int getPackageCount() const { return _count; }

private:
    void flushStanza();

    MetadataCallback _onPackage;
    std::string _stanza;
    int _count = 0;
};

class NipkgCliClient : public PackageClient {
public:
    explicit NipkgCliClient(const std::string& executable = "nipkg",
                            int timeoutMs = 1800000);
    ~NipkgCliClient() override = default;

    const std::string& getExecutable() const { return _executable; }

    // ========================================================================
    // PackageClient
    // ========================================================================

    ClientRequestPtr initializeSession(
        const std::string& applicationName,
        const std::string& applicationVersion) override;

    ClientRequestPtr setConfiguration(
        const std::string& attributeName,
        const std::string& attributeValue) override;

    ClientRequestPtr getFeedConfigurations(FeedCallback onFeed) override;

    ClientRequestPtr addFeedConfiguration(
        const std::string& uri,
        const std::string& name) override;

    ClientRequestPtr removeFeedConfiguration(const std::string& name) override;

    ClientRequestPtr updateFeed(const std::string& name) override;

    ClientRequestPtr getAvailablePackages(
        const std::vector<std::string>& feedNames,
        MetadataCallback onPackage) override;

    ClientRequestPtr getInstalledPackages(MetadataCallback onPackage) override;

    ClientRequestPtr downloadPackage(
        const std::vector<std::string>& packageNames,
        const std::string& location,
        ProgressCallback onProgress) override;

    ClientRequestPtr installPackages(
        const std::vector<std::string>& packageNames,
        unsigned flags,
        ProgressCallback onProgress) override;

    ClientRequestPtr removePackages(
        const std::vector<std::string>& packageNames,
        unsigned flags,
        ProgressCallback onProgress) override;

    // ========================================================================
    // Output Parsing
    // ========================================================================

    // "<name> <uri> [disabled]"; nullopt for blank or malformed lines
    static std::optional<FeedConfiguration> parseFeedLine(const std::string& line);

    // "<ActionCode> <percent>% <argument>"
    static std::optional<ProgressEvent> parseProgressLine(const std::string& line);

    static std::vector<PackageMetadata> parsePackageInfo(const std::string& output);

    static std::vector<std::string> buildArguments(
        const std::string& executable,
        const std::string& verb,
        const std::vector<std::string>& args);

private:
    using LineHandler = std::function<void(const std::string& line)>;
    using FinishHandler = std::function<void()>;

    ClientRequestPtr startCommand(const std::string& verb,
                                  const std::vector<std::string>& args,
                                  LineHandler onLine = nullptr,
                                  FinishHandler onFinish = nullptr);

    static LineHandler progressLineHandler(ProgressCallback onProgress);

    std::string _executable;
    int _timeoutMs;
};

} // namespace NipkgProvider

#endif // _NIPKGCLICLIENT_H_

// vim:ts=4:sw=4:et
