/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "RegionExtractor.h"

#include <algorithm>
#include <limits>
#include "ElfExceptions.h"
#include "ElfNames.h"

using namespace ElfScopeUtils;
using ElfScopeExceptions::MalformedTableBoundsError;

RegionExtractor::RegionExtractor(const ElfMemoryValidator& validator, const ElfHeaderInfo& header)
    : validator_(validator), header_(header), reader_(validator, header.isLittleEndian()) {}

ExtractedRegions RegionExtractor::extract() const {
    ExtractedRegions result;
    result.fileRegions.push_back(makeHeaderRegion());
    extractProgramHeaders(result.fileRegions);
    extractSections(result);
    return result;
}

Region RegionExtractor::makeHeaderRegion() const {
    Region region("ELF Header", 0, header_.headerSize, RegionKind::Header);
    region.addNote("class", ElfNames::elfClassName(header_.elfClass));
    region.addNote("data", ElfNames::dataEncodingName(header_.dataEncoding));
    region.addNote("type", ElfNames::objectTypeName(header_.objectType));
    region.addNote("machine", ElfNames::machineName(header_.machine));
    region.addNote("entry point", ElfNames::formatHex(header_.entry));
    region.addNote("program header count", std::to_string(header_.programHeaderCount));
    region.addNote("section header count", std::to_string(header_.sectionHeaderCount));
    widenZeroLength(region, validator_.getSize());
    return region;
}

void RegionExtractor::extractProgramHeaders(std::vector<Region>& regions) const {
    if (header_.programHeaderCount == 0) {
        return;
    }

    const uint64_t record_size =
        header_.is32Bit() ? ElfIdent::ELF32_PHDR_SIZE : ElfIdent::ELF64_PHDR_SIZE;
    validator_.validateEntrySize(header_.programHeaderOffset,
                                 header_.programHeaderEntrySize,
                                 record_size,
                                 "program header table");
    validator_.validateTable(header_.programHeaderOffset,
                             header_.programHeaderCount,
                             header_.programHeaderEntrySize,
                             "program header table");

    for (uint64_t i = 0; i < header_.programHeaderCount; ++i) {
        // Cannot overflow, validateTable checked the whole table extent
        uint64_t entry_start = header_.programHeaderOffset + i * header_.programHeaderEntrySize;
        ProgramHeaderRecord phdr = reader_.readProgramHeader(entry_start, header_.is32Bit());

        Region region("Program Header Segment #" + std::to_string(i),
                      entry_start,
                      entry_start + header_.programHeaderEntrySize,
                      RegionKind::ProgramHeaderEntry);
        region.addNote("type", ElfNames::segmentTypeName(phdr.p_type));
        region.addNote("flags", ElfNames::segmentFlagsName(phdr.p_flags));
        region.addNote("offset", ElfNames::formatHex(phdr.p_offset));
        region.addNote("virtual address", ElfNames::formatHex(phdr.p_vaddr));
        region.addNote("physical address", ElfNames::formatHex(phdr.p_paddr));
        region.addNote("file size", ElfNames::formatHex(phdr.p_filesz));
        region.addNote("memory size", ElfNames::formatHex(phdr.p_memsz));
        region.addNote("alignment", ElfNames::formatHex(phdr.p_align));
        regions.push_back(std::move(region));
    }
}

std::vector<SectionHeaderRecord> RegionExtractor::readSectionHeaders() const {
    std::vector<SectionHeaderRecord> records;
    if (header_.sectionHeaderCount == 0) {
        return records;
    }

    const uint64_t record_size =
        header_.is32Bit() ? ElfIdent::ELF32_SHDR_SIZE : ElfIdent::ELF64_SHDR_SIZE;
    validator_.validateEntrySize(header_.sectionHeaderOffset,
                                 header_.sectionHeaderEntrySize,
                                 record_size,
                                 "section header table");
    validator_.validateTable(header_.sectionHeaderOffset,
                             header_.sectionHeaderCount,
                             header_.sectionHeaderEntrySize,
                             "section header table");

    // The table fits into the buffer, so the count is bounded by its size
    records.reserve(static_cast<size_t>(header_.sectionHeaderCount));
    for (uint64_t i = 0; i < header_.sectionHeaderCount; ++i) {
        uint64_t entry_start = header_.sectionHeaderOffset + i * header_.sectionHeaderEntrySize;
        records.push_back(reader_.readSectionHeader(entry_start, header_.is32Bit()));
    }
    return records;
}

StringTableResolver RegionExtractor::makeNameResolver(
    const std::vector<SectionHeaderRecord>& records) const {
    const uint64_t index = header_.sectionNameTableIndex;
    if (index == ElfSpecialIndex::SHN_UNDEF) {
        return StringTableResolver::absent();
    }
    if (index >= records.size()) {
        throw MalformedTableBoundsError(
            "section name string table",
            header_.sectionHeaderOffset + index * header_.sectionHeaderEntrySize,
            header_.sectionHeaderEntrySize,
            validator_.getSize(),
            "section name string table index " + std::to_string(index) +
                " is outside the section header table (" + std::to_string(records.size()) +
                " entries)");
    }

    const SectionHeaderRecord& table = records[index];
    if (table.sh_type == static_cast<uint32_t>(SectionType::SHT_NOBITS)) {
        return StringTableResolver::absent();
    }
    validator_.validateRange(table.sh_offset, table.sh_size, "section name string table");
    return StringTableResolver(validator_.getData() + table.sh_offset,
                               static_cast<size_t>(table.sh_size));
}

void RegionExtractor::extractSections(ExtractedRegions& result) const {
    std::vector<SectionHeaderRecord> records = readSectionHeaders();
    StringTableResolver names = makeNameResolver(records);
    if (records.empty()) {
        return;
    }

    std::vector<SectionEntry> sections;
    sections.reserve(records.size());
    for (const auto& record : records) {
        sections.push_back(SectionEntry{record, names.resolve(record.sh_name)});
    }

    const uint64_t buffer_size = validator_.getSize();

    // Section header entries come before any section contents
    for (size_t i = 0; i < sections.size(); ++i) {
        const SectionEntry& section = sections[i];
        uint64_t entry_start = header_.sectionHeaderOffset + i * header_.sectionHeaderEntrySize;

        std::string region_name = section.name.name.empty()
                                      ? "ELF Section Header #" + std::to_string(i)
                                      : "ELF Section Header for " + section.name.name;
        Region region(std::move(region_name),
                      entry_start,
                      entry_start + header_.sectionHeaderEntrySize,
                      RegionKind::SectionHeaderEntry);
        region.addNote("index", std::to_string(i));
        region.addNote("section", sectionDisplayName(section));
        addNameErrorNote(region, section, names.size());
        result.fileRegions.push_back(std::move(region));
    }

    for (const SectionEntry& section : sections) {
        const SectionHeaderRecord& shdr = section.record;
        if (shdr.sh_type == static_cast<uint32_t>(SectionType::SHT_NULL) ||
            shdr.sh_type == static_cast<uint32_t>(SectionType::SHT_NOBITS)) {
            continue;
        }

        validator_.validateRange(
            shdr.sh_offset, shdr.sh_size, "contents of section '" + sectionDisplayName(section) + "'");

        Region region(sectionDisplayName(section),
                      shdr.sh_offset,
                      shdr.sh_offset + shdr.sh_size,
                      RegionKind::SectionContent);
        addSectionNotes(region, section, sections, false);
        addNameErrorNote(region, section, names.size());
        widenZeroLength(region, buffer_size);
        result.fileRegions.push_back(std::move(region));
    }

    for (const SectionEntry& section : sections) {
        const SectionHeaderRecord& shdr = section.record;
        if ((shdr.sh_flags & static_cast<uint64_t>(SectionFlags::SHF_ALLOC)) == 0) {
            continue;
        }

        uint64_t end = 0;
        if (!SafeArithmetic::checkedAdd(shdr.sh_addr, shdr.sh_size, end)) {
            throw MalformedTableBoundsError(
                "address range of section '" + sectionDisplayName(section) + "'",
                shdr.sh_addr,
                shdr.sh_size,
                buffer_size,
                "address range of section '" + sectionDisplayName(section) +
                    "' overflows the 64-bit address space");
        }

        Region region(sectionDisplayName(section), shdr.sh_addr, end, RegionKind::SectionContent);
        addSectionNotes(region, section, sections, true);
        addNameErrorNote(region, section, names.size());
        widenZeroLength(region, std::numeric_limits<uint64_t>::max());
        result.virtualTotalSize = std::max(result.virtualTotalSize, region.end);
        result.virtualRegions.push_back(std::move(region));
    }
}

void RegionExtractor::addSectionNotes(Region& region,
                                      const SectionEntry& section,
                                      const std::vector<SectionEntry>& sections,
                                      bool virtual_space) const {
    const SectionHeaderRecord& shdr = section.record;
    region.addNote("type", ElfNames::sectionTypeName(shdr.sh_type, header_.machine));
    region.addNote("flags", ElfNames::sectionFlagsName(shdr.sh_flags));
    region.addNote("address", ElfNames::formatHex(shdr.sh_addr));
    if (virtual_space) {
        region.addNote("file offset", ElfNames::formatHex(shdr.sh_offset));
    }
    region.addNote("size", ElfNames::formatHex(shdr.sh_size));
    region.addNote("alignment", ElfNames::formatHex(shdr.sh_addralign));
    if (shdr.sh_entsize != 0) {
        region.addNote("entry size", ElfNames::formatHex(shdr.sh_entsize));
    }
    if (ElfNames::hasLinkedSection(shdr.sh_type)) {
        region.addNote("linked section", sectionReference(sections, shdr.sh_link));
    }
    if (ElfNames::isRelocationSection(shdr.sh_type) &&
        (shdr.sh_flags & static_cast<uint64_t>(SectionFlags::SHF_INFO_LINK)) != 0) {
        region.addNote("applies to", sectionReference(sections, shdr.sh_info));
    }
}

void RegionExtractor::addNameErrorNote(Region& region,
                                       const SectionEntry& section,
                                       size_t table_size) const {
    if (section.name.valid) {
        return;
    }
    region.addNote("name error",
                   "name offset " + ElfNames::formatHex(section.record.sh_name) +
                       " lies outside the " + std::to_string(table_size) +
                       "-byte section name string table");
}

void RegionExtractor::widenZeroLength(Region& region, uint64_t space_end) {
    if (region.start != region.end) {
        return;
    }
    if (region.start >= space_end) {
        region.addNote("display", END_OF_SPACE_NOTE);
        return;
    }
    region.end = region.start + 1;
    region.addNote("display", WIDENED_NOTE);
}

std::string RegionExtractor::sectionDisplayName(const SectionEntry& section) {
    return section.name.name.empty() ? "Unnamed section" : section.name.name;
}

std::string RegionExtractor::sectionReference(const std::vector<SectionEntry>& sections,
                                              uint64_t index) {
    if (index >= sections.size()) {
        return "<invalid section index " + std::to_string(index) + ">";
    }
    return sectionDisplayName(sections[static_cast<size_t>(index)]);
}
