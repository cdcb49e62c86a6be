/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ElfRegionParser.h"
#include "RegionStructures.h"

/**
 * @brief Outcome of loading one input
 */
struct LoadResult {
    std::string source;                 ///< Path as given, or the self-executable path
    std::optional<BinaryLayout> layout; ///< Set when loading and parsing succeeded
    std::string error;                  ///< Failure message when layout is empty

    bool ok() const { return layout.has_value(); }
};

/**
 * @class BinaryLoader
 * @brief Acquires binaries from disk and runs them through ElfRegionParser
 *
 * File bytes come from FileAccessStrategy (read or memory-mapped depending on
 * Config::mmapThreshold). The strategy object lives until the parse returns,
 * after which the layout no longer refers to the bytes.
 *
 * Acquisition failures are raised as ElfScopeExceptions::ElfFileError, parse
 * failures as the parser's ElfParsingError subclasses.
 */
class BinaryLoader {
public:
    /// Path of the running executable on Linux
    static constexpr const char* SELF_EXECUTABLE_PATH = "/proc/self/exe";

    explicit BinaryLoader(const Config& config = Config{});

    /**
     * @brief Load and parse one file
     * @param path File to load; the layout is named after its last path component
     */
    BinaryLayout loadFile(const std::string& path) const;

    /**
     * @brief Load and parse the running executable
     */
    BinaryLayout loadSelf() const;

    /**
     * @brief Load several inputs, in parallel when there is more than one
     *
     * Failures do not stop the other inputs; each is reported in its
     * LoadResult. Results keep the input order, with the running executable
     * last when include_self is set.
     */
    std::vector<LoadResult> loadAll(const std::vector<std::string>& paths, bool include_self) const;

    /**
     * @brief Name shown for a path: its last component, or the path itself
     */
    static std::string displayName(const std::string& path);

private:
    BinaryLayout loadFrom(const std::string& path, const std::string& display_name) const;
    LoadResult loadCaptured(const std::string& path, bool is_self) const;

    Config config_;
};
