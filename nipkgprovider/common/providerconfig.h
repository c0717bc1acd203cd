/* providerconfig.h - Provider configuration file
 *
 * Copyright (c) 2024 NipkgProvider Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _PROVIDERCONFIG_H_
#define _PROVIDERCONFIG_H_

#include "structuredlog.h"

#include <string>
#include <istream>

namespace NipkgProvider {

/**
 * ProviderConfig - Settings read from nipkgprovider.conf
 *
 * File format, one setting per line:
 *
 *   # comment
 *   parent_activity_id=0
 *   disable_file_agent=false
 *   nipkg_path=/usr/bin/nipkg
 *   command_timeout_ms=1800000
 *   log_level=INFO
 *   log_file=/var/log/nipkgprovider.log
 *   log_console=false
 *
 * A missing file leaves every setting at its default.
 */
struct ProviderConfig {
    int parentActivityId = 0;
    bool disableFileAgent = false;
    std::string nipkgPath = "nipkg";
    int commandTimeoutMs = 1800000;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    bool logConsole = false;

    // $NIPKG_PROVIDER_CONFIG, else the user config directory
    static std::string getDefaultPath();
    static std::string getConfigDir();

    // Returns defaults when the file cannot be opened
    static ProviderConfig load(const std::string& path = "");
    static ProviderConfig parse(std::istream& in);

    // Apply log level, file sink and console sink to the global logger
    void applyLogging() const;
};

} // namespace NipkgProvider

#endif // _PROVIDERCONFIG_H_

// vim:ts=4:sw=4:et
