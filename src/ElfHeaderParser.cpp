/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfHeaderParser.h"
#include "ElfRecordReader.h"

using namespace ElfScopeUtils;

ElfHeaderInfo ElfHeaderParser::parse(const ElfMemoryValidator& validator) {
    ElfClass elf_class = validator.validateIdentification();

    ElfHeaderInfo info;
    info.elfClass = elf_class;
    info.dataEncoding = static_cast<ElfData>(validator.getData()[ElfIdent::EI_DATA]);

    ElfRecordReader reader(validator, info.isLittleEndian());
    if (info.is32Bit()) {
        Elf32_Ehdr ehdr{};
        reader.readStruct(ElfIdent::EI_NIDENT, ehdr);
        copyFields(ehdr, info);
    } else {
        Elf64_Ehdr ehdr{};
        reader.readStruct(ElfIdent::EI_NIDENT, ehdr);
        copyFields(ehdr, info);
    }

    // e_ehsize is header-controlled; the header region must stay inside the file
    validator.validateRange(0, info.headerSize, "ELF header");

    applyExtendedNumbering(validator, info);
    return info;
}

template<typename Ehdr>
void ElfHeaderParser::copyFields(const Ehdr& ehdr, ElfHeaderInfo& info) {
    info.objectType = ehdr.e_type;
    info.machine = ehdr.e_machine;
    info.entry = ehdr.e_entry;
    info.headerSize = ehdr.e_ehsize;
    info.programHeaderOffset = ehdr.e_phoff;
    info.programHeaderCount = ehdr.e_phnum;
    info.programHeaderEntrySize = ehdr.e_phentsize;
    info.sectionHeaderOffset = ehdr.e_shoff;
    info.sectionHeaderCount = ehdr.e_shnum;
    info.sectionHeaderEntrySize = ehdr.e_shentsize;
    info.sectionNameTableIndex = ehdr.e_shstrndx;
}

void ElfHeaderParser::applyExtendedNumbering(const ElfMemoryValidator& validator,
                                             ElfHeaderInfo& info) {
    bool section_count_escaped = info.sectionHeaderCount == 0 && info.sectionHeaderOffset != 0;
    bool name_index_escaped = info.sectionNameTableIndex == ElfSpecialIndex::SHN_XINDEX;
    bool segment_count_escaped = info.programHeaderCount == ElfSpecialIndex::PN_XNUM;

    if (!section_count_escaped && !name_index_escaped && !segment_count_escaped) {
        return;
    }
    if (info.sectionHeaderOffset == 0) {
        // No section 0 to consult, the escape values stay as they are and the
        // table checks in the extractor reject them
        return;
    }

    uint64_t record_size = info.is32Bit() ? ElfIdent::ELF32_SHDR_SIZE : ElfIdent::ELF64_SHDR_SIZE;
    validator.validateEntrySize(
        info.sectionHeaderOffset, info.sectionHeaderEntrySize, record_size, "section header table");
    validator.validateRange(info.sectionHeaderOffset, info.sectionHeaderEntrySize, "section header 0");

    ElfRecordReader reader(validator, info.isLittleEndian());
    SectionHeaderRecord first = reader.readSectionHeader(info.sectionHeaderOffset, info.is32Bit());

    if (section_count_escaped) {
        info.sectionHeaderCount = first.sh_size;
    }
    if (name_index_escaped) {
        info.sectionNameTableIndex = first.sh_link;
    }
    if (segment_count_escaped) {
        info.programHeaderCount = first.sh_info;
    }
}
