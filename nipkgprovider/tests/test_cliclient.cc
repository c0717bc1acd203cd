/* test_cliclient.cc - Tests for the nipkg command line client
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * Output parsers are tested directly. The process tests run the client
 * against a small shell script standing in for nipkg.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "testsupport.h"
#include "nipkgcliclient.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using namespace std;
using namespace NipkgProvider;

namespace {

const char* FAKE_NIPKG_SCRIPT =
    "#!/bin/sh\n"
    "case \"$1\" in\n"
    "  --version) echo 20.5.0 ;;\n"
    "  feed-list)\n"
    "    echo 'ni-main https://download.ni.com/main'\n"
    "    echo ''\n"
    "    echo 'old file:///opt/old disabled'\n"
    "    ;;\n"
    "  info)\n"
    "    printf 'Package: ni-daqmx\\nVersion: 20.1.0\\nFeed: ni-main\\nDescription: DAQ driver\\n\\n'\n"
    "    printf 'Package: ni-old\\nVersion: 1.0\\nFeed: old\\nDescription: Old\\n\\n'\n"
    "    printf 'Package: ni-local\\nVersion: 2.0\\nDescription: No feed\\n'\n"
    "    ;;\n"
    "  install)\n"
    "    echo 'Downloading 50% ni-daqmx'\n"
    "    echo 'resolving dependencies'\n"
    "    echo 'Installing 100% ni-daqmx'\n"
    "    ;;\n"
    "  remove)\n"
    "    echo 'package is locked' >&2\n"
    "    exit 3\n"
    "    ;;\n"
    "  update) sleep 5 ;;\n"
    "esac\n"
    "exit 0\n";

// Writes the fake nipkg script to a temporary file, removed on destruction
class FakeNipkg {
public:
    FakeNipkg() {
        char path[] = "/tmp/fake-nipkg-XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) {
            throw std::runtime_error("cannot create fake nipkg script");
        }
        close(fd);
        _path = path;

        std::ofstream script(_path);
        script << FAKE_NIPKG_SCRIPT;
        script.close();
        chmod(_path.c_str(), 0755);
    }

    ~FakeNipkg() {
        std::remove(_path.c_str());
    }

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

} // namespace

// ============================================================================
// Feed Lines
// ============================================================================

TEST(parse_feed_line_enabled)
{
    auto feed = NipkgCliClient::parseFeedLine("ni-main   https://download.ni.com/main");
    ASSERT_TRUE(feed.has_value());
    ASSERT_EQ(feed->name, "ni-main");
    ASSERT_EQ(feed->uri, "https://download.ni.com/main");
    ASSERT_TRUE(feed->enabled);
}

TEST(parse_feed_line_disabled)
{
    auto feed = NipkgCliClient::parseFeedLine("old file:///opt/old Disabled");
    ASSERT_TRUE(feed.has_value());
    ASSERT_FALSE(feed->enabled);
}

TEST(parse_feed_line_rejects_junk)
{
    ASSERT_FALSE(NipkgCliClient::parseFeedLine("").has_value());
    ASSERT_FALSE(NipkgCliClient::parseFeedLine("   ").has_value());
    ASSERT_FALSE(NipkgCliClient::parseFeedLine("lonely").has_value());
    ASSERT_FALSE(NipkgCliClient::parseFeedLine("# name uri").has_value());
}

// ============================================================================
// Progress Lines
// ============================================================================

TEST(parse_progress_line)
{
    auto event = NipkgCliClient::parseProgressLine("Installing 42% ni-daqmx 20.1.0");
    ASSERT_TRUE(event.has_value());
    ASSERT_EQ(event->actionCode, "Installing");
    ASSERT_EQ(event->percentageCompleted, 42);
    ASSERT_EQ(event->argument, "ni-daqmx 20.1.0");
}

TEST(parse_progress_line_without_argument)
{
    auto event = NipkgCliClient::parseProgressLine("  Verifying 100%");
    ASSERT_TRUE(event.has_value());
    ASSERT_EQ(event->actionCode, "Verifying");
    ASSERT_EQ(event->percentageCompleted, 100);
    ASSERT_TRUE(event->argument.empty());
}

TEST(parse_progress_line_caps_percent)
{
    auto event = NipkgCliClient::parseProgressLine("Downloading 250% big.nipkg");
    ASSERT_TRUE(event.has_value());
    ASSERT_EQ(event->percentageCompleted, 100);
}

TEST(parse_progress_line_rejects_other_output)
{
    ASSERT_FALSE(NipkgCliClient::parseProgressLine("").has_value());
    ASSERT_FALSE(NipkgCliClient::parseProgressLine("resolving dependencies").has_value());
    ASSERT_FALSE(NipkgCliClient::parseProgressLine("Installing ni-daqmx").has_value());
    ASSERT_FALSE(NipkgCliClient::parseProgressLine("42% done").has_value());
}

// ============================================================================
// Package Stanzas
// ============================================================================

TEST(parse_package_info_stanzas)
{
    string output =
        "Package: ni-daqmx\n"
        "Version: 20.1.0\n"
        "XB-DisplayName: NI-DAQmx\n"
        "Section: Drivers\n"
        "Maintainer: National Instruments\n"
        "Architecture: windows_x64\n"
        "Feed: ni-main\n"
        "Description: NI-DAQmx driver\n"
        " Supports data acquisition devices.\n"
        " .\n"
        " Second paragraph.\n"
        "\n"
        "package: ni-visa\n"
        "version: 21.0\n";

    auto packages = NipkgCliClient::parsePackageInfo(output);

    ASSERT_EQ(packages.size(), size_t(2));
    ASSERT_EQ(packages[0].packageName, "ni-daqmx");
    ASSERT_EQ(packages[0].version, "20.1.0");
    ASSERT_EQ(packages[0].displayName, "NI-DAQmx");
    ASSERT_EQ(packages[0].section, "Drivers");
    ASSERT_EQ(packages[0].maintainer, "National Instruments");
    ASSERT_EQ(packages[0].architecture, "windows_x64");
    ASSERT_EQ(packages[0].feed, "ni-main");
    ASSERT_EQ(packages[0].summary, "NI-DAQmx driver");
    ASSERT_TRUE(packages[0].description.find("\n Supports data acquisition devices.")
                != string::npos);
    ASSERT_TRUE(packages[0].description.find("Second paragraph.") != string::npos);

    ASSERT_EQ(packages[1].packageName, "ni-visa");
    ASSERT_EQ(packages[1].getDisplayName(), "ni-visa");
    ASSERT_TRUE(packages[1].summary.empty());
}

TEST(parse_package_info_skips_stanza_without_package)
{
    auto packages = NipkgCliClient::parsePackageInfo(
        "Version: 1.0\nDescription: orphan\n\n\n\nPackage: real\r\nVersion: 2.0\r\n");

    ASSERT_EQ(packages.size(), size_t(1));
    ASSERT_EQ(packages[0].packageName, "real");
    ASSERT_EQ(packages[0].version, "2.0");
}

TEST(stanza_parser_counts_packages)
{
    int delivered = 0;
    StanzaParser parser([&delivered](const PackageMetadata&) { delivered++; });

    parser.feedLine("Package: a");
    parser.feedLine("");
    parser.feedLine("Package: b");
    ASSERT_EQ(delivered, 1);

    parser.finish();
    ASSERT_EQ(delivered, 2);
    ASSERT_EQ(parser.getPackageCount(), 2);
}

TEST(parse_package_info_display_name_fallback)
{
    auto packages = NipkgCliClient::parsePackageInfo(
        "Package: ni-visa\nDisplayName: NI-VISA\nXB-DisplayName: ignored\n\n"
        "Package: ni-488\nXB-DisplayName: NI-488.2\nHomepage: http://www.ni.com\n");

    ASSERT_EQ(packages.size(), size_t(2));
    ASSERT_EQ(packages[0].displayName, "NI-VISA");
    ASSERT_EQ(packages[1].displayName, "NI-488.2");
    ASSERT_EQ(packages[1].homepage, "http://www.ni.com");
}

// ============================================================================
// Command Lines
// ============================================================================

TEST(build_arguments)
{
    auto argv = NipkgCliClient::buildArguments("/usr/bin/nipkg", "install",
                                               {"-y", "--accept-eulas", "ni-daqmx"});
    vector<string> expected = {"/usr/bin/nipkg", "install", "-y", "--accept-eulas", "ni-daqmx"};
    ASSERT_TRUE(argv == expected);

    argv = NipkgCliClient::buildArguments("nipkg", "feed-list", {});
    ASSERT_EQ(argv.size(), size_t(2));
}

// ============================================================================
// Process Execution
// ============================================================================

TEST(missing_executable_is_not_found)
{
    NipkgCliClient client("/nonexistent/bin/nipkg", 10000);

    OperationResult result = waitForRequest(client.initializeSession("NIPKG", "1.0.0.0"),
                                            "InitializeSession");

    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errorCode, "NOT_FOUND");
    ASSERT_EQ(result.exitCode, 127);
}

TEST(feed_list_from_process)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    auto feeds = collectFeedConfigurations(client);

    ASSERT_TRUE(feeds.status.success);
    ASSERT_EQ(feeds.items.size(), size_t(2));
    ASSERT_EQ(feeds.items[0].name, "ni-main");
    ASSERT_TRUE(feeds.items[0].enabled);
    ASSERT_EQ(feeds.items[1].name, "old");
    ASSERT_FALSE(feeds.items[1].enabled);
}

TEST(available_packages_filtered_by_feed)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    auto all = collectAvailablePackages(client, {});
    ASSERT_TRUE(all.status.success);
    ASSERT_EQ(all.items.size(), size_t(3));

    auto mainFeed = collectAvailablePackages(client, {"NI-Main"});
    ASSERT_EQ(mainFeed.items.size(), size_t(2));
    ASSERT_EQ(mainFeed.items[0].packageName, "ni-daqmx");
    ASSERT_EQ(mainFeed.items[1].packageName, "ni-local");
}

TEST(install_streams_progress)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    vector<ProgressEvent> events;
    OperationResult result = waitForRequest(
        client.installPackages({"ni-daqmx"}, ACCEPT_LICENSES,
                               [&events](const ProgressEvent& ev) { events.push_back(ev); }),
        "InstallPackages");

    ASSERT_TRUE(result.success);
    ASSERT_EQ(events.size(), size_t(2));
    ASSERT_EQ(events[0].actionCode, "Downloading");
    ASSERT_EQ(events[0].percentageCompleted, 50);
    ASSERT_EQ(events[1].actionCode, "Installing");
    ASSERT_EQ(events[1].argument, "ni-daqmx");
}

TEST(nonzero_exit_reports_stderr)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    OperationResult result = waitForRequest(
        client.removePackages({"ni-daqmx"}, TRANSACTION_NONE, nullptr), "RemovePackages");

    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errorCode, "EXIT_3");
    ASSERT_EQ(result.exitCode, 3);
    ASSERT_EQ(result.message, "package is locked");
    ASSERT_TRUE(result.rawStderr.find("package is locked") != string::npos);
}

TEST(slow_command_times_out)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 300);

    OperationResult result = waitForRequest(client.updateFeed("ni-main"), "UpdateFeed");

    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errorCode, "TIMEOUT");
}

TEST(request_reports_completion)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    ClientRequestPtr request = client.initializeSession("NIPKG", "1.0.0.0");
    OperationResult first = request->waitUntilComplete();
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(request->isComplete());
    ASSERT_TRUE(request->getErrorInfo().success);
    ASSERT_TRUE(request->waitUntilComplete().success);
}

TEST(throwing_package_callback_fails_request)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    int seen = 0;
    OperationResult result = waitForRequest(
        client.getAvailablePackages({}, [&seen](const PackageMetadata&) {
            seen++;
            throw std::runtime_error("catalog full");
        }),
        "GetAvailablePackages");

    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errorCode, "CALLBACK_FAILED");
    ASSERT_TRUE(result.message.find("catalog full") != string::npos);
    ASSERT_EQ(seen, 1);
}

TEST(throwing_progress_callback_fails_request)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    OperationResult result = waitForRequest(
        client.installPackages({"ni-daqmx"}, TRANSACTION_NONE,
                               [](const ProgressEvent&) { throw std::runtime_error("host gone"); }),
        "InstallPackages");

    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errorCode, "CALLBACK_FAILED");
    ASSERT_EQ(result.exitCode, 0);
}

TEST(feed_filter_accepts_non_ascii_names)
{
    FakeNipkg fake;
    NipkgCliClient client(fake.path(), 10000);

    auto packages = collectAvailablePackages(client, {"\xC3\x9C" "bersicht", "OLD"});

    ASSERT_TRUE(packages.status.success);
    ASSERT_EQ(packages.items.size(), size_t(2));
    ASSERT_EQ(packages.items[0].packageName, "ni-old");
    ASSERT_EQ(packages.items[1].packageName, "ni-local");
}

TEST(null_request_is_a_failure)
{
    OperationResult result = waitForRequest(nullptr, "Nothing");
    ASSERT_FALSE(result.success);
    ASSERT_EQ(result.errorCode, "NO_REQUEST");
}

TEST_MAIN("nipkg Command Line Client Tests")

// vim:ts=4:sw=4:et
