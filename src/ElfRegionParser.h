/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "RegionStructures.h"

/**
 * @brief Tunable defaults shared by the parser, the loader and the CLI
 */
namespace ElfScopeDefaults {
/** @brief Memory mapping threshold - files at or above this size are mapped instead of read */
constexpr size_t DEFAULT_MMAP_THRESHOLD = 10 * 1024 * 1024;  // 10MB

/** @brief Root region names of the two trees */
constexpr const char* FILE_ROOT_NAME = "ELF file";
constexpr const char* VIRTUAL_ROOT_NAME = "Virtual memory";
}  // namespace ElfScopeDefaults

struct Config {
    std::vector<std::string> inputFiles;
    bool loadSelf = false;          ///< Also load the running executable (/proc/self/exe)
    std::string format = "text";    ///< Output format ("text", "json")
    std::string space = "both";     ///< Trees to print ("file", "virtual", "both")
    bool showNotes = false;         ///< Print region notes in text output
    uint32_t maxDepth = 0;          ///< Depth limit below the root (0 = unlimited)
    int verbosity = 0;
    size_t threadCount = 0;  ///< Number of worker threads for multi-file loads (0 = auto-detect)
    size_t mmapThreshold =
        ElfScopeDefaults::DEFAULT_MMAP_THRESHOLD;  ///< Memory mapping threshold for large files
};

/**
 * @class ElfRegionParser
 * @brief Entry point turning an in-memory ELF image into file and virtual region trees
 *
 * ## Pipeline:
 * 1. ElfHeaderParser validates the signature and decodes the fixed header
 * 2. RegionExtractor produces flat region lists for both spaces
 * 3. RegionTreeBuilder nests each list into a tree
 *
 * Parsing is one synchronous pass. The input buffer is never modified and no
 * state is shared between calls, so separate parser instances may run on
 * separate threads.
 *
 * ## Usage Example:
 * ```cpp
 * ElfRegionParser parser;
 * BinaryLayout layout = parser.parse("a.out", bytes);
 * for (const auto& region : layout.fileSpace.root().children) {
 *     std::cout << region.name << "\n";
 * }
 * ```
 *
 * @throws ElfScopeExceptions::ElfParsingError subclasses on fatal input errors;
 *         no partial layout is ever returned
 */
class ElfRegionParser {
public:
    explicit ElfRegionParser(const Config& config = Config{});

    /**
     * @brief Parse a binary held in memory
     * @param display_name Name carried into the layout and error context
     * @param data Start of the image (may be null only when size is 0)
     * @param size Image length in bytes
     * @return Both region trees of the binary
     */
    BinaryLayout parse(const std::string& display_name, const uint8_t* data, size_t size) const;

    BinaryLayout parse(const std::string& display_name, const std::vector<uint8_t>& bytes) const;

private:
    Config config_;
};
