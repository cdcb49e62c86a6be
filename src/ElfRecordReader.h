/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include "ElfMemoryValidator.h"
#include "ElfStructures.h"

/**
 * @file ElfRecordReader.h
 * @brief Bounds-checked, byte-order aware reads of ELF records
 *
 * Every read goes through ElfMemoryValidator first, then swaps the value when
 * the file's encoding differs from the host's. Records are filled field by field
 * so 32-bit, 64-bit, LSB and MSB files share one decoding path.
 */
class ElfRecordReader {
public:
    /**
     * @param validator Validator over the buffer being parsed (must outlive the reader)
     * @param little_endian True if the file uses ELFDATA2LSB
     */
    ElfRecordReader(const ElfScopeUtils::ElfMemoryValidator& validator, bool little_endian)
        : validator_(validator), is_little_endian_(little_endian) {}

    /**
     * @brief Read a scalar at an absolute file offset
     * @throws MalformedTableBoundsError if the read is out of bounds
     */
    template<typename T>
    T readValue(uint64_t offset) const {
        T value = validator_.readValue<T>(offset, "record field");

        if ((is_little_endian_ && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__) ||
            (!is_little_endian_ && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)) {
            swapEndianness(&value, sizeof(T));
        }
        return value;
    }

    /**
     * @brief Fill a record starting at offset
     *
     * Header offsets are relative to the end of e_ident, so callers pass
     * EI_NIDENT for the ELF header and the entry start for table entries.
     */
    template<typename T>
    void readStruct(uint64_t offset, T& structure) const {
        // For complex structures, we need to read field by field to handle endianness
        if constexpr (std::is_same_v<T, Elf32_Ehdr>) {
            structure.e_type = readValue<uint16_t>(offset + 0);
            structure.e_machine = readValue<uint16_t>(offset + 2);
            structure.e_version = readValue<uint32_t>(offset + 4);
            structure.e_entry = readValue<uint32_t>(offset + 8);
            structure.e_phoff = readValue<uint32_t>(offset + 12);
            structure.e_shoff = readValue<uint32_t>(offset + 16);
            structure.e_flags = readValue<uint32_t>(offset + 20);
            structure.e_ehsize = readValue<uint16_t>(offset + 24);
            structure.e_phentsize = readValue<uint16_t>(offset + 26);
            structure.e_phnum = readValue<uint16_t>(offset + 28);
            structure.e_shentsize = readValue<uint16_t>(offset + 30);
            structure.e_shnum = readValue<uint16_t>(offset + 32);
            structure.e_shstrndx = readValue<uint16_t>(offset + 34);
        } else if constexpr (std::is_same_v<T, Elf64_Ehdr>) {
            structure.e_type = readValue<uint16_t>(offset + 0);
            structure.e_machine = readValue<uint16_t>(offset + 2);
            structure.e_version = readValue<uint32_t>(offset + 4);
            structure.e_entry = readValue<uint64_t>(offset + 8);
            structure.e_phoff = readValue<uint64_t>(offset + 16);
            structure.e_shoff = readValue<uint64_t>(offset + 24);
            structure.e_flags = readValue<uint32_t>(offset + 32);
            structure.e_ehsize = readValue<uint16_t>(offset + 36);
            structure.e_phentsize = readValue<uint16_t>(offset + 38);
            structure.e_phnum = readValue<uint16_t>(offset + 40);
            structure.e_shentsize = readValue<uint16_t>(offset + 42);
            structure.e_shnum = readValue<uint16_t>(offset + 44);
            structure.e_shstrndx = readValue<uint16_t>(offset + 46);
        } else if constexpr (std::is_same_v<T, Elf32_Shdr>) {
            structure.sh_name = readValue<uint32_t>(offset + 0);
            structure.sh_type = readValue<uint32_t>(offset + 4);
            structure.sh_flags = readValue<uint32_t>(offset + 8);
            structure.sh_addr = readValue<uint32_t>(offset + 12);
            structure.sh_offset = readValue<uint32_t>(offset + 16);
            structure.sh_size = readValue<uint32_t>(offset + 20);
            structure.sh_link = readValue<uint32_t>(offset + 24);
            structure.sh_info = readValue<uint32_t>(offset + 28);
            structure.sh_addralign = readValue<uint32_t>(offset + 32);
            structure.sh_entsize = readValue<uint32_t>(offset + 36);
        } else if constexpr (std::is_same_v<T, Elf64_Shdr>) {
            structure.sh_name = readValue<uint32_t>(offset + 0);
            structure.sh_type = readValue<uint32_t>(offset + 4);
            structure.sh_flags = readValue<uint64_t>(offset + 8);
            structure.sh_addr = readValue<uint64_t>(offset + 16);
            structure.sh_offset = readValue<uint64_t>(offset + 24);
            structure.sh_size = readValue<uint64_t>(offset + 32);
            structure.sh_link = readValue<uint32_t>(offset + 40);
            structure.sh_info = readValue<uint32_t>(offset + 44);
            structure.sh_addralign = readValue<uint64_t>(offset + 48);
            structure.sh_entsize = readValue<uint64_t>(offset + 56);
        } else if constexpr (std::is_same_v<T, Elf32_Phdr>) {
            structure.p_type = readValue<uint32_t>(offset + 0);
            structure.p_offset = readValue<uint32_t>(offset + 4);
            structure.p_vaddr = readValue<uint32_t>(offset + 8);
            structure.p_paddr = readValue<uint32_t>(offset + 12);
            structure.p_filesz = readValue<uint32_t>(offset + 16);
            structure.p_memsz = readValue<uint32_t>(offset + 20);
            structure.p_flags = readValue<uint32_t>(offset + 24);
            structure.p_align = readValue<uint32_t>(offset + 28);
        } else if constexpr (std::is_same_v<T, Elf64_Phdr>) {
            structure.p_type = readValue<uint32_t>(offset + 0);
            structure.p_flags = readValue<uint32_t>(offset + 4);
            structure.p_offset = readValue<uint64_t>(offset + 8);
            structure.p_vaddr = readValue<uint64_t>(offset + 16);
            structure.p_paddr = readValue<uint64_t>(offset + 24);
            structure.p_filesz = readValue<uint64_t>(offset + 32);
            structure.p_memsz = readValue<uint64_t>(offset + 40);
            structure.p_align = readValue<uint64_t>(offset + 48);
        } else {
            static_assert(!std::is_same_v<T, T>, "unsupported ELF record type");
        }
    }

    /**
     * @brief Read one section header entry and widen it to the class-neutral form
     */
    SectionHeaderRecord readSectionHeader(uint64_t offset, bool is_32bit) const {
        SectionHeaderRecord record;
        if (is_32bit) {
            Elf32_Shdr raw{};
            readStruct(offset, raw);
            widen(raw, record);
        } else {
            Elf64_Shdr raw{};
            readStruct(offset, raw);
            widen(raw, record);
        }
        return record;
    }

    /**
     * @brief Read one program header entry and widen it to the class-neutral form
     */
    ProgramHeaderRecord readProgramHeader(uint64_t offset, bool is_32bit) const {
        ProgramHeaderRecord record;
        if (is_32bit) {
            Elf32_Phdr raw{};
            readStruct(offset, raw);
            widen(raw, record);
        } else {
            Elf64_Phdr raw{};
            readStruct(offset, raw);
            widen(raw, record);
        }
        return record;
    }

    bool isLittleEndian() const { return is_little_endian_; }

private:
    template<typename Shdr>
    static void widen(const Shdr& raw, SectionHeaderRecord& record) {
        record.sh_name = raw.sh_name;
        record.sh_type = raw.sh_type;
        record.sh_flags = raw.sh_flags;
        record.sh_addr = raw.sh_addr;
        record.sh_offset = raw.sh_offset;
        record.sh_size = raw.sh_size;
        record.sh_link = raw.sh_link;
        record.sh_info = raw.sh_info;
        record.sh_addralign = raw.sh_addralign;
        record.sh_entsize = raw.sh_entsize;
    }

    template<typename Phdr>
    static void widen(const Phdr& raw, ProgramHeaderRecord& record) {
        record.p_type = raw.p_type;
        record.p_flags = raw.p_flags;
        record.p_offset = raw.p_offset;
        record.p_vaddr = raw.p_vaddr;
        record.p_paddr = raw.p_paddr;
        record.p_filesz = raw.p_filesz;
        record.p_memsz = raw.p_memsz;
        record.p_align = raw.p_align;
    }

    static void swapEndianness(void* data, size_t size) {
        uint8_t* bytes = reinterpret_cast<uint8_t*>(data);
        for (size_t i = 0; i < size / 2; ++i) {
            std::swap(bytes[i], bytes[size - 1 - i]);
        }
    }

    const ElfScopeUtils::ElfMemoryValidator& validator_;
    bool is_little_endian_;
};
