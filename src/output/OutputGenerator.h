/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>
#include "../ElfRegionParser.h"
#include "RegionStructures.h"

/**
 * @class OutputGenerator
 * @brief Prints region trees as indented text or JSON
 *
 * The generator only reads layouts; it never changes a tree.
 *
 * ## Supported Output Formats:
 * - **Text**: one heading per tree, then one line per region indented by depth
 *   ```
 *   hello: file space (16384 bytes)
 *   [0x0, 0x4000) ELF file (SyntheticRoot)
 *     [0x0, 0x40) ELF Header (Header)
 *   ```
 * - **JSON**: an array with one object per binary
 *   ```json
 *   [
 *     {
 *       "name": "hello",
 *       "fileSpace": { "totalSize": 16384, "root": { "name": "ELF file", ... } },
 *       "virtualSpace": { ... }
 *     }
 *   ]
 *   ```
 *
 * Config::space selects which trees are printed, Config::maxDepth limits the
 * depth below the root (0 = unlimited) and Config::showNotes adds notes to
 * text output. JSON always carries notes.
 *
 * ## Usage Example:
 * ```cpp
 * OutputGenerator generator(config);
 * generator.generate(layouts);
 * ```
 */
class OutputGenerator {
public:
    /**
     * @param config Output options (format, space, showNotes, maxDepth)
     * @param out Destination stream, stdout by default
     */
    explicit OutputGenerator(const Config& config, std::ostream& out = std::cout);

    /**
     * @brief Print layouts in the configured format
     */
    void generate(const std::vector<BinaryLayout>& layouts) const;

    void generateTextOutput(const std::vector<BinaryLayout>& layouts) const;

    void generateJsonOutput(const std::vector<BinaryLayout>& layouts) const;

    /**
     * @brief Escape a string for use inside JSON quotes
     */
    static std::string escapeJson(const std::string& value);

private:
    bool includeFileSpace() const;
    bool includeVirtualSpace() const;
    bool depthAllowed(size_t depth) const;

    void writeTextTree(const std::string& binary_name,
                       const std::string& space_name,
                       const RegionTree& tree) const;
    void writeTextRegion(const Region& region, size_t depth) const;

    void writeJsonTree(const RegionTree& tree, size_t indent) const;
    void writeJsonRegion(const Region& region, size_t depth, size_t indent) const;

    Config config_;
    std::ostream& out_;
};
