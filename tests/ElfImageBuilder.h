/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file ElfImageBuilder.h
 * @brief Synthesizes small ELF images for the test suites
 *
 * Layout of a built image:
 * 1. ELF header
 * 2. Program header table (when segments were added)
 * 3. Contents of sections without an explicit offset, in insertion order
 * 4. Section name string table (.shstrtab)
 * 5. Section header table, 8-byte aligned
 *
 * Section 0 is always the NULL entry; added sections follow from index 1
 * and .shstrtab comes last.
 */

namespace elfscope_test {

constexpr uint32_t SHT_NULL = 0;
constexpr uint32_t SHT_PROGBITS = 1;
constexpr uint32_t SHT_SYMTAB = 2;
constexpr uint32_t SHT_STRTAB = 3;
constexpr uint32_t SHT_RELA = 4;
constexpr uint32_t SHT_NOBITS = 8;
constexpr uint32_t SHT_DYNSYM = 11;

constexpr uint64_t SHF_WRITE = 0x1;
constexpr uint64_t SHF_ALLOC = 0x2;
constexpr uint64_t SHF_EXECINSTR = 0x4;
constexpr uint64_t SHF_INFO_LINK = 0x40;

constexpr uint32_t PT_LOAD = 1;
constexpr uint32_t PF_X = 0x1;
constexpr uint32_t PF_R = 0x4;

constexpr uint16_t EM_X86_64 = 62;
constexpr uint16_t EM_ARM = 40;

struct TestSection {
    std::string name;
    uint32_t type = SHT_PROGBITS;
    uint64_t flags = 0;
    uint64_t addr = 0;
    uint64_t size = 0;            ///< Used when contents is empty
    std::vector<uint8_t> contents;
    std::optional<uint64_t> offset;      ///< Explicit sh_offset, no bytes are written for it
    std::optional<uint32_t> nameOffset;  ///< Explicit sh_name
    uint32_t link = 0;
    uint32_t info = 0;
    uint64_t addralign = 1;
    uint64_t entsize = 0;
};

struct TestSegment {
    uint32_t type = PT_LOAD;
    uint32_t flags = PF_R;
    uint64_t offset = 0;
    uint64_t vaddr = 0;
    uint64_t paddr = 0;
    uint64_t filesz = 0;
    uint64_t memsz = 0;
    uint64_t align = 0x1000;
};

struct BuiltImage {
    std::vector<uint8_t> bytes;
    uint64_t phoff = 0;
    uint64_t shoff = 0;
    uint16_t ehsize = 0;
    uint16_t shentsize = 0;  ///< Value of e_shentsize
    std::vector<uint64_t> sectionOffsets;  ///< sh_offset per section index, NULL included
    uint32_t shstrndx = 0;
};

class ElfImageBuilder {
public:
    explicit ElfImageBuilder(bool is64 = true, bool little_endian = true)
        : is64_(is64), little_(little_endian) {}

    ElfImageBuilder& machine(uint16_t value) {
        machine_ = value;
        return *this;
    }

    ElfImageBuilder& entry(uint64_t value) {
        entry_ = value;
        return *this;
    }

    ElfImageBuilder& addSection(const TestSection& section) {
        sections_.push_back(section);
        return *this;
    }

    ElfImageBuilder& addSegment(const TestSegment& segment) {
        segments_.push_back(segment);
        return *this;
    }

    /// Leave out .shstrtab and write e_shstrndx = 0
    ElfImageBuilder& withoutNameTable() {
        name_table_ = false;
        return *this;
    }

    /// Store section count, name table index and segment count in section 0
    ElfImageBuilder& useExtendedNumbering() {
        extended_ = true;
        return *this;
    }

    ElfImageBuilder& ehsize(uint16_t value) {
        ehsize_override_ = value;
        return *this;
    }

    /// Value written to e_shentsize; the table layout is unaffected
    ElfImageBuilder& shentsize(uint16_t value) {
        shentsize_override_ = value;
        return *this;
    }

    /// Value written to e_phentsize; the table layout is unaffected
    ElfImageBuilder& phentsize(uint16_t value) {
        phentsize_override_ = value;
        return *this;
    }

    ElfImageBuilder& shnum(uint16_t value) {
        shnum_override_ = value;
        return *this;
    }

    ElfImageBuilder& shstrndx(uint16_t value) {
        shstrndx_override_ = value;
        return *this;
    }

    ElfImageBuilder& shoff(uint64_t value) {
        shoff_override_ = value;
        return *this;
    }

    /// Drop trailing bytes after building
    ElfImageBuilder& truncateTo(size_t size) {
        truncate_ = size;
        return *this;
    }

    uint16_t headerSize() const { return is64_ ? 64 : 52; }
    uint16_t sectionHeaderSize() const { return is64_ ? 64 : 40; }
    uint16_t programHeaderSize() const { return is64_ ? 56 : 32; }

    BuiltImage build() const {
        BuiltImage image;
        std::vector<uint8_t>& out = image.bytes;

        image.ehsize = ehsize_override_ ? *ehsize_override_ : headerSize();
        out.resize(headerSize(), 0);

        // Program header table
        image.phoff = segments_.empty() ? 0 : out.size();
        out.resize(out.size() + segments_.size() * programHeaderSize(), 0);

        // Name table contents
        std::string names(1, '\0');
        std::vector<uint32_t> name_offsets;
        for (const auto& section : sections_) {
            name_offsets.push_back(static_cast<uint32_t>(names.size()));
            names += section.name;
            names += '\0';
        }
        uint32_t shstrtab_name = static_cast<uint32_t>(names.size());
        names += ".shstrtab";
        names += '\0';

        bool has_table = !sections_.empty() || name_table_;
        size_t section_count = has_table ? 1 + sections_.size() + (name_table_ ? 1 : 0) : 0;

        image.sectionOffsets.assign(section_count, 0);
        std::vector<uint64_t> sizes(section_count, 0);

        for (size_t i = 0; i < sections_.size(); ++i) {
            const TestSection& section = sections_[i];
            uint64_t size = section.contents.empty() ? section.size : section.contents.size();
            sizes[i + 1] = size;
            if (section.offset) {
                image.sectionOffsets[i + 1] = *section.offset;
                continue;
            }
            image.sectionOffsets[i + 1] = out.size();
            if (section.type == SHT_NOBITS) {
                continue;
            }
            if (section.contents.empty()) {
                out.resize(out.size() + size, 0);
            } else {
                out.insert(out.end(), section.contents.begin(), section.contents.end());
            }
        }

        if (name_table_) {
            image.shstrndx = static_cast<uint32_t>(section_count - 1);
            image.sectionOffsets[section_count - 1] = out.size();
            sizes[section_count - 1] = names.size();
            out.insert(out.end(), names.begin(), names.end());
        }

        // Entries are always laid out at the natural size; an override only
        // changes e_shentsize
        const uint16_t entry_size = sectionHeaderSize();
        image.shentsize = shentsize_override_ ? *shentsize_override_ : entry_size;
        if (has_table) {
            while (out.size() % 8 != 0) {
                out.push_back(0);
            }
            image.shoff = out.size();
            out.resize(out.size() + section_count * entry_size, 0);
        }

        // Section headers
        for (size_t i = 0; i < section_count; ++i) {
            size_t base = image.shoff + i * entry_size;
            if (i == 0) {
                if (extended_) {
                    writeSection(out, base, 0, SHT_NULL, 0, 0, 0, section_count,
                                 image.shstrndx, static_cast<uint32_t>(segments_.size()), 0, 0);
                }
                continue;
            }
            if (name_table_ && i == section_count - 1) {
                writeSection(out, base, shstrtab_name, SHT_STRTAB, 0, 0, image.sectionOffsets[i],
                             sizes[i], 0, 0, 1, 0);
                continue;
            }
            const TestSection& section = sections_[i - 1];
            uint32_t name = section.nameOffset ? *section.nameOffset
                                               : (name_table_ ? name_offsets[i - 1] : 0);
            writeSection(out, base, name, section.type, section.flags, section.addr,
                         image.sectionOffsets[i], sizes[i], section.link, section.info,
                         section.addralign, section.entsize);
        }

        // Program headers
        for (size_t i = 0; i < segments_.size(); ++i) {
            writeSegment(out, image.phoff + i * programHeaderSize(), segments_[i]);
        }

        // ELF header
        out[0] = 0x7f;
        out[1] = 'E';
        out[2] = 'L';
        out[3] = 'F';
        out[4] = is64_ ? 2 : 1;
        out[5] = little_ ? 1 : 2;
        out[6] = 1;

        uint64_t shoff = shoff_override_ ? *shoff_override_ : image.shoff;
        uint16_t shnum = static_cast<uint16_t>(section_count);
        uint16_t shstrndx = static_cast<uint16_t>(image.shstrndx);
        uint16_t phnum = static_cast<uint16_t>(segments_.size());
        if (extended_) {
            shnum = 0;
            shstrndx = 0xffff;
            phnum = 0xffff;
        }
        if (shnum_override_) {
            shnum = *shnum_override_;
        }
        if (shstrndx_override_) {
            shstrndx = *shstrndx_override_;
        }
        uint16_t phentsize = phentsize_override_
                                 ? *phentsize_override_
                                 : (segments_.empty() ? 0 : programHeaderSize());

        put(out, 16, 2, 2);  // e_type = EXEC
        put(out, 18, machine_, 2);
        put(out, 20, 1, 4);
        if (is64_) {
            put(out, 24, entry_, 8);
            put(out, 32, image.phoff, 8);
            put(out, 40, shoff, 8);
            put(out, 52, image.ehsize, 2);
            put(out, 54, phentsize, 2);
            put(out, 56, phnum, 2);
            put(out, 58, image.shentsize, 2);
            put(out, 60, shnum, 2);
            put(out, 62, shstrndx, 2);
        } else {
            put(out, 24, entry_, 4);
            put(out, 28, image.phoff, 4);
            put(out, 32, shoff, 4);
            put(out, 40, image.ehsize, 2);
            put(out, 42, phentsize, 2);
            put(out, 44, phnum, 2);
            put(out, 46, image.shentsize, 2);
            put(out, 48, shnum, 2);
            put(out, 50, shstrndx, 2);
        }

        if (truncate_ && *truncate_ < out.size()) {
            out.resize(*truncate_);
        }
        return image;
    }

private:
    void put(std::vector<uint8_t>& out, size_t offset, uint64_t value, size_t width) const {
        for (size_t i = 0; i < width; ++i) {
            size_t shift = little_ ? i : width - 1 - i;
            out[offset + i] = static_cast<uint8_t>(value >> (shift * 8));
        }
    }

    void writeSection(std::vector<uint8_t>& out, size_t base, uint32_t name, uint32_t type,
                      uint64_t flags, uint64_t addr, uint64_t offset, uint64_t size,
                      uint32_t link, uint32_t info, uint64_t addralign, uint64_t entsize) const {
        put(out, base, name, 4);
        put(out, base + 4, type, 4);
        if (is64_) {
            put(out, base + 8, flags, 8);
            put(out, base + 16, addr, 8);
            put(out, base + 24, offset, 8);
            put(out, base + 32, size, 8);
            put(out, base + 40, link, 4);
            put(out, base + 44, info, 4);
            put(out, base + 48, addralign, 8);
            put(out, base + 56, entsize, 8);
        } else {
            put(out, base + 8, flags, 4);
            put(out, base + 12, addr, 4);
            put(out, base + 16, offset, 4);
            put(out, base + 20, size, 4);
            put(out, base + 24, link, 4);
            put(out, base + 28, info, 4);
            put(out, base + 32, addralign, 4);
            put(out, base + 36, entsize, 4);
        }
    }

    void writeSegment(std::vector<uint8_t>& out, size_t base, const TestSegment& segment) const {
        put(out, base, segment.type, 4);
        if (is64_) {
            put(out, base + 4, segment.flags, 4);
            put(out, base + 8, segment.offset, 8);
            put(out, base + 16, segment.vaddr, 8);
            put(out, base + 24, segment.paddr, 8);
            put(out, base + 32, segment.filesz, 8);
            put(out, base + 40, segment.memsz, 8);
            put(out, base + 48, segment.align, 8);
        } else {
            put(out, base + 4, segment.offset, 4);
            put(out, base + 8, segment.vaddr, 4);
            put(out, base + 12, segment.paddr, 4);
            put(out, base + 16, segment.filesz, 4);
            put(out, base + 20, segment.memsz, 4);
            put(out, base + 24, segment.flags, 4);
            put(out, base + 28, segment.align, 4);
        }
    }

    bool is64_;
    bool little_;
    uint16_t machine_ = EM_X86_64;
    uint64_t entry_ = 0x1000;
    std::vector<TestSection> sections_;
    std::vector<TestSegment> segments_;
    bool name_table_ = true;
    bool extended_ = false;
    std::optional<uint16_t> ehsize_override_;
    std::optional<uint16_t> shentsize_override_;
    std::optional<uint16_t> phentsize_override_;
    std::optional<uint16_t> shnum_override_;
    std::optional<uint16_t> shstrndx_override_;
    std::optional<uint64_t> shoff_override_;
    std::optional<size_t> truncate_;
};

/// .text, .data and .bss with one LOAD segment, the layout most tests start from
inline ElfImageBuilder typicalImage(bool is64 = true, bool little_endian = true) {
    ElfImageBuilder builder(is64, little_endian);

    TestSection text;
    text.name = ".text";
    text.flags = SHF_ALLOC | SHF_EXECINSTR;
    text.addr = 0x1000;
    text.contents = std::vector<uint8_t>(16, 0x90);
    text.addralign = 16;

    TestSection data;
    data.name = ".data";
    data.flags = SHF_ALLOC | SHF_WRITE;
    data.addr = 0x2000;
    data.contents = {1, 2, 3, 4, 5, 6, 7, 8};
    data.addralign = 8;

    TestSection bss;
    bss.name = ".bss";
    bss.type = SHT_NOBITS;
    bss.flags = SHF_ALLOC | SHF_WRITE;
    bss.addr = 0x2008;
    bss.size = 0x20;
    bss.addralign = 8;

    TestSegment load;
    load.type = PT_LOAD;
    load.flags = PF_R | PF_X;
    load.vaddr = 0x1000;
    load.paddr = 0x1000;
    load.filesz = 0x10;
    load.memsz = 0x10;

    builder.addSection(text).addSection(data).addSection(bss).addSegment(load);
    return builder;
}

}  // namespace elfscope_test
