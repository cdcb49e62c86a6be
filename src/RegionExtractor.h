/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "ElfHeaderParser.h"
#include "ElfMemoryValidator.h"
#include "ElfRecordReader.h"
#include "RegionStructures.h"
#include "StringTableResolver.h"

/**
 * @brief Flat, possibly overlapping region lists for both address spaces
 */
struct ExtractedRegions {
    std::vector<Region> fileRegions;     ///< In extraction order
    std::vector<Region> virtualRegions;  ///< ALLOC sections in section index order
    uint64_t virtualTotalSize = 0;       ///< Highest end among virtualRegions, 0 if none
};

/**
 * @class RegionExtractor
 * @brief Walks the header and both tables to produce named byte ranges
 *
 * File space receives, in order: the ELF header, one region per program header
 * entry, one region per section header entry and one region per section whose
 * bytes are stored in the file. Virtual space receives one region per section
 * with SHF_ALLOC.
 *
 * Every header-controlled range is checked against the buffer before it is read
 * or turned into a region. The buffer itself is never modified.
 */
class RegionExtractor {
public:
    /**
     * @param validator Validator over the complete binary
     * @param header Header decoded by ElfHeaderParser from the same buffer
     */
    RegionExtractor(const ElfScopeUtils::ElfMemoryValidator& validator, const ElfHeaderInfo& header);

    /**
     * @brief Produce both flat region lists
     * @throws MalformedTableBoundsError if a table, the name table or a section
     *         range reaches outside the buffer
     */
    ExtractedRegions extract() const;

    static constexpr const char* WIDENED_NOTE = "zero-length range widened to 1 byte";
    static constexpr const char* END_OF_SPACE_NOTE = "zero-length range at end of space";

private:
    /// A section header together with its resolved name
    struct SectionEntry {
        SectionHeaderRecord record;
        ResolvedName name;
    };

    Region makeHeaderRegion() const;
    void extractProgramHeaders(std::vector<Region>& regions) const;
    std::vector<SectionHeaderRecord> readSectionHeaders() const;
    StringTableResolver makeNameResolver(const std::vector<SectionHeaderRecord>& records) const;
    void extractSections(ExtractedRegions& result) const;

    void addSectionNotes(Region& region,
                         const SectionEntry& section,
                         const std::vector<SectionEntry>& sections,
                         bool virtual_space) const;
    void addNameErrorNote(Region& region, const SectionEntry& section, size_t table_size) const;

    /**
     * @brief Widen [X, X) to [X, X+1) for display
     * @param space_end Exclusive end of the address space, the range is left
     *        zero-length when widening would pass it
     */
    static void widenZeroLength(Region& region, uint64_t space_end);

    static std::string sectionDisplayName(const SectionEntry& section);
    static std::string sectionReference(const std::vector<SectionEntry>& sections, uint64_t index);

    const ElfScopeUtils::ElfMemoryValidator& validator_;
    ElfHeaderInfo header_;
    ElfRecordReader reader_;
};
