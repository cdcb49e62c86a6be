/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "VersionInfo.h"
#include <string>

/// @brief Build date macro (set by build system)
#ifndef BUILD_DATE
#define BUILD_DATE "unknown"
#endif

/// @brief Build time macro (set by build system)
#ifndef BUILD_TIME
#define BUILD_TIME "unknown"
#endif

const char* VersionInfo::getVersionString() {
    static const std::string version_string = std::string(APP_NAME) + " v" + VERSION;
    return version_string.c_str();
}

void VersionInfo::showVersion(std::ostream& out) {
    out << getVersionString() << "\n";
    out << COPYRIGHT << "\n";
    out << "Build Date: " << BUILD_DATE << "\n";
    out << "Build Time: " << BUILD_TIME << "\n";
    out << "\n";
    out << "License: " << LICENSE_URL << std::endl;
}
