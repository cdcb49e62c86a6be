/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include "ElfMemoryValidator.h"
#include "ElfStructures.h"

/**
 * @brief Decoded fixed fields of an ELF header, widened to 64 bits
 *
 * Counts and the name table index already have extended numbering applied, so
 * callers never look at section 0 themselves.
 */
struct ElfHeaderInfo {
    ElfClass elfClass = ElfClass::ELFCLASS64;
    ElfData dataEncoding = ElfData::ELFDATA2LSB;
    uint16_t objectType = 0;
    uint16_t machine = 0;
    uint64_t entry = 0;
    uint16_t headerSize = 0;  ///< e_ehsize

    uint64_t programHeaderOffset = 0;
    uint64_t programHeaderCount = 0;
    uint16_t programHeaderEntrySize = 0;

    uint64_t sectionHeaderOffset = 0;
    uint64_t sectionHeaderCount = 0;
    uint16_t sectionHeaderEntrySize = 0;

    uint32_t sectionNameTableIndex = 0;  ///< 0 (SHN_UNDEF) when the file has no name table

    bool is32Bit() const { return elfClass == ElfClass::ELFCLASS32; }
    bool isLittleEndian() const { return dataEncoding == ElfData::ELFDATA2LSB; }
};

/**
 * @class ElfHeaderParser
 * @brief Validates the ELF signature and decodes the fixed header
 *
 * Decoding is a pure function of the buffer. Failures are reported as
 * BadMagicError, TruncatedHeaderError, UnsupportedEncodingError or
 * MalformedTableBoundsError (header extent, or section 0 when extended
 * numbering needs it).
 */
class ElfHeaderParser {
public:
    /**
     * @brief Decode the header of the buffer behind validator
     * @param validator Validator over the complete binary
     * @return Decoded header fields
     */
    static ElfHeaderInfo parse(const ElfScopeUtils::ElfMemoryValidator& validator);

private:
    template<typename Ehdr>
    static void copyFields(const Ehdr& ehdr, ElfHeaderInfo& info);

    static void applyExtendedNumbering(const ElfScopeUtils::ElfMemoryValidator& validator,
                                       ElfHeaderInfo& info);
};
