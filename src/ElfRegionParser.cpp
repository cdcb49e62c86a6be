/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfRegionParser.h"

#include <iostream>
#include <utility>
#include "ElfHeaderParser.h"
#include "ElfMemoryValidator.h"
#include "ElfNames.h"
#include "RegionExtractor.h"
#include "RegionTreeBuilder.h"

ElfRegionParser::ElfRegionParser(const Config& config) : config_(config) {}

BinaryLayout ElfRegionParser::parse(const std::string& display_name,
                                    const std::vector<uint8_t>& bytes) const {
    return parse(display_name, bytes.data(), bytes.size());
}

BinaryLayout ElfRegionParser::parse(const std::string& display_name,
                                    const uint8_t* data,
                                    size_t size) const {
    ElfScopeUtils::ElfMemoryValidator validator(data, size, display_name);
    ElfHeaderInfo header = ElfHeaderParser::parse(validator);

    if (config_.verbosity > 1) {
        std::cerr << display_name << ": " << ElfNames::elfClassName(header.elfClass) << " "
                  << ElfNames::dataEncodingName(header.dataEncoding) << ", "
                  << ElfNames::machineName(header.machine) << "\n"
                  << "  program headers: " << header.programHeaderCount << " at "
                  << ElfNames::formatHex(header.programHeaderOffset) << " (entry size "
                  << header.programHeaderEntrySize << ")\n"
                  << "  section headers: " << header.sectionHeaderCount << " at "
                  << ElfNames::formatHex(header.sectionHeaderOffset) << " (entry size "
                  << header.sectionHeaderEntrySize << "), name table index "
                  << header.sectionNameTableIndex << "\n";
    }

    RegionExtractor extractor(validator, header);
    ExtractedRegions extracted = extractor.extract();

    if (config_.verbosity > 1) {
        std::cerr << "  extracted " << extracted.fileRegions.size() << " file regions, "
                  << extracted.virtualRegions.size() << " virtual regions\n";
    }

    BinaryLayout layout;
    layout.name = display_name;
    layout.fileSpace = RegionTreeBuilder::build(
        std::move(extracted.fileRegions), size, ElfScopeDefaults::FILE_ROOT_NAME);
    layout.virtualSpace = RegionTreeBuilder::build(std::move(extracted.virtualRegions),
                                                   extracted.virtualTotalSize,
                                                   ElfScopeDefaults::VIRTUAL_ROOT_NAME);

    if (config_.verbosity > 0) {
        std::cerr << "Parsed " << display_name << ": " << layout.fileSpace.regionCount()
                  << " file regions (depth " << layout.fileSpace.depth() << "), "
                  << layout.virtualSpace.regionCount() << " virtual regions (depth "
                  << layout.virtualSpace.depth() << ")\n";
    }
    return layout;
}
