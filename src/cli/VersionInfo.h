/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <iostream>

/**
 * @file VersionInfo.h
 * @brief Centralized version information
 *
 * @author elfscope Project
 * @date 2025
 */

/**
 * @class VersionInfo
 * @brief Single source of truth for application name, version and build stamp
 *
 * ## Usage:
 * ```cpp
 * VersionInfo::showVersion();
 * std::string version = VersionInfo::getVersionString();
 * ```
 */
class VersionInfo {
public:
    /// @brief Application version string
    static constexpr const char* VERSION = "1.0.0";

    /// @brief Copyright notice
    static constexpr const char* COPYRIGHT = "Copyright (c) 2025 - Licensed under Mozilla Public License 2.0";

    /// @brief License URL
    static constexpr const char* LICENSE_URL = "https://mozilla.org/MPL/2.0/";

    /// @brief Application name
    static constexpr const char* APP_NAME = "elfscope";

    /// @brief One-line description used in --help
    static constexpr const char* DESCRIPTION =
        "elfscope - nested file and virtual memory region trees of ELF binaries";

    /**
     * @brief Get formatted version string
     * @return "elfscope v<VERSION>"
     */
    static const char* getVersionString();

    /**
     * @brief Print version, copyright and build stamp
     * @param out Destination stream
     */
    static void showVersion(std::ostream& out = std::cout);
};
