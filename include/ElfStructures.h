/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file ElfStructures.h
 * @brief Raw ELF container records and enumerations used by the region parser
 *
 * This file defines the on-disk ELF structures that elfscope decodes in order to
 * build its file-space and virtual-space region trees:
 *
 * ## Structure Categories:
 * 1. **Identification**: class and data-encoding values from e_ident
 * 2. **Header Records**: 32-bit and 64-bit ELF headers (without e_ident)
 * 3. **Table Records**: section headers and program headers for both classes
 * 4. **Decoding Enumerations**: section types, section flags, segment types and flags
 *
 * ## Design Philosophy:
 * - **Field Accurate**: record fields match the System V gABI layouts one to one
 * - **Class Neutral**: 32-bit and 64-bit variants are read field by field, so the
 *   in-memory layout never has to match the file layout
 * - **Byte Order Neutral**: records are filled through ElfRecordReader, which swaps
 *   foreign-endian values
 *
 * @note This header must not be included together with the system <elf.h>, which
 *       defines the same record names.
 * @see ElfRecordReader.h for how these records are filled from a buffer
 */

#pragma once

#include <cstddef>
#include <cstdint>

// ============================================================================
// ELF Identification
// ============================================================================

/**
 * @brief Layout constants of the e_ident block and fixed header sizes
 */
namespace ElfIdent {
constexpr size_t MAGIC_SIZE = 4;         ///< 0x7f 'E' 'L' 'F'
constexpr size_t EI_CLASS = 4;           ///< Offset of the class byte
constexpr size_t EI_DATA = 5;            ///< Offset of the data-encoding byte
constexpr size_t EI_VERSION = 6;         ///< Offset of the identification version byte
constexpr size_t EI_NIDENT = 16;         ///< Size of the identification block
constexpr size_t ELF32_EHDR_SIZE = 52;   ///< Full 32-bit header including e_ident
constexpr size_t ELF64_EHDR_SIZE = 64;   ///< Full 64-bit header including e_ident
constexpr size_t ELF32_SHDR_SIZE = 40;   ///< Minimum 32-bit section header entry
constexpr size_t ELF64_SHDR_SIZE = 64;   ///< Minimum 64-bit section header entry
constexpr size_t ELF32_PHDR_SIZE = 32;   ///< Minimum 32-bit program header entry
constexpr size_t ELF64_PHDR_SIZE = 56;   ///< Minimum 64-bit program header entry

constexpr uint8_t MAGIC[MAGIC_SIZE] = {0x7f, 'E', 'L', 'F'};
}  // namespace ElfIdent

/**
 * @brief ELF file class (32-bit vs 64-bit architecture)
 *
 * @note Value stored in EI_CLASS byte (offset 4) of ELF identification
 */
enum class ElfClass : uint8_t {
    ELFCLASS32 = 1,  ///< 32-bit objects
    ELFCLASS64 = 2   ///< 64-bit objects
};

/**
 * @brief ELF data encoding (byte order)
 *
 * @note Value stored in EI_DATA byte (offset 5) of ELF identification
 */
enum class ElfData : uint8_t {
    ELFDATA2LSB = 1,  ///< Little-endian (LSB first)
    ELFDATA2MSB = 2   ///< Big-endian (MSB first)
};

/**
 * @brief Special section indices and counts used by extended numbering
 *
 * When a file has more sections than fit into the 16-bit header fields, the
 * real values live in section header 0.
 */
namespace ElfSpecialIndex {
constexpr uint16_t SHN_UNDEF = 0;        ///< No section (no name string table)
constexpr uint16_t SHN_XINDEX = 0xffff;  ///< e_shstrndx escape, real index in sh_link of section 0
constexpr uint16_t PN_XNUM = 0xffff;     ///< e_phnum escape, real count in sh_info of section 0
}  // namespace ElfSpecialIndex

// ============================================================================
// ELF Header Records
// ============================================================================

/**
 * @brief 32-bit ELF header (fields after the 16-byte e_ident block)
 *
 * ## Binary Layout (offsets from file start):
 * ```
 * Offset | Field        | Size
 * -------|--------------|-----
 * 16     | e_type       | 2
 * 18     | e_machine    | 2
 * 20     | e_version    | 4
 * 24     | e_entry      | 4
 * 28     | e_phoff      | 4
 * 32     | e_shoff      | 4
 * 36     | e_flags      | 4
 * 40     | e_ehsize     | 2
 * 42     | e_phentsize  | 2
 * 44     | e_phnum      | 2
 * 46     | e_shentsize  | 2
 * 48     | e_shnum      | 2
 * 50     | e_shstrndx   | 2
 * ```
 */
struct Elf32_Ehdr {
    uint16_t e_type;       ///< Object file type (ET_EXEC, ET_DYN, etc.)
    uint16_t e_machine;    ///< Target architecture
    uint32_t e_version;    ///< ELF version
    uint32_t e_entry;      ///< Entry point virtual address
    uint32_t e_phoff;      ///< Program header table offset
    uint32_t e_shoff;      ///< Section header table offset
    uint32_t e_flags;      ///< Processor-specific flags
    uint16_t e_ehsize;     ///< ELF header size
    uint16_t e_phentsize;  ///< Program header entry size
    uint16_t e_phnum;      ///< Program header entry count
    uint16_t e_shentsize;  ///< Section header entry size
    uint16_t e_shnum;      ///< Section header entry count
    uint16_t e_shstrndx;   ///< Section header string table index
};

/**
 * @brief 64-bit ELF header
 * @note Same fields as the 32-bit version with 64-bit addresses and offsets
 */
struct Elf64_Ehdr {
    uint16_t e_type;
    uint16_t e_machine;
    uint32_t e_version;
    uint64_t e_entry;
    uint64_t e_phoff;
    uint64_t e_shoff;
    uint32_t e_flags;
    uint16_t e_ehsize;
    uint16_t e_phentsize;
    uint16_t e_phnum;
    uint16_t e_shentsize;
    uint16_t e_shnum;
    uint16_t e_shstrndx;
};

// ============================================================================
// ELF Table Records
// ============================================================================

/**
 * @brief 32-bit ELF section header
 */
struct Elf32_Shdr {
    uint32_t sh_name;       ///< Section name string table offset
    uint32_t sh_type;       ///< Section type (SHT_PROGBITS, SHT_NOBITS, etc.)
    uint32_t sh_flags;      ///< Section flags (SHF_ALLOC marks load-time residency)
    uint32_t sh_addr;       ///< Virtual address in memory
    uint32_t sh_offset;     ///< Offset in file
    uint32_t sh_size;       ///< Section size in bytes
    uint32_t sh_link;       ///< Link to related section
    uint32_t sh_info;       ///< Additional section information
    uint32_t sh_addralign;  ///< Alignment requirements
    uint32_t sh_entsize;    ///< Size of each entry (for tables)
};

/**
 * @brief 64-bit ELF section header
 */
struct Elf64_Shdr {
    uint32_t sh_name;
    uint32_t sh_type;
    uint64_t sh_flags;
    uint64_t sh_addr;
    uint64_t sh_offset;
    uint64_t sh_size;
    uint32_t sh_link;
    uint32_t sh_info;
    uint64_t sh_addralign;
    uint64_t sh_entsize;
};

/**
 * @brief 32-bit ELF program header
 */
struct Elf32_Phdr {
    uint32_t p_type;    ///< Segment type (PT_LOAD, PT_DYNAMIC, etc.)
    uint32_t p_offset;  ///< Offset from beginning of file
    uint32_t p_vaddr;   ///< Virtual address in memory
    uint32_t p_paddr;   ///< Physical address
    uint32_t p_filesz;  ///< Size of segment in file
    uint32_t p_memsz;   ///< Size of segment in memory
    uint32_t p_flags;   ///< Segment permissions
    uint32_t p_align;   ///< Alignment requirement
};

/**
 * @brief 64-bit ELF program header
 * @note p_flags moves before the address fields in the 64-bit layout
 */
struct Elf64_Phdr {
    uint32_t p_type;
    uint32_t p_flags;
    uint64_t p_offset;
    uint64_t p_vaddr;
    uint64_t p_paddr;
    uint64_t p_filesz;
    uint64_t p_memsz;
    uint64_t p_align;
};

/**
 * @brief Class-neutral section header used after decoding
 *
 * Both record widths are widened into this form so that region extraction runs
 * one code path for 32-bit and 64-bit files.
 */
struct SectionHeaderRecord {
    uint32_t sh_name = 0;
    uint32_t sh_type = 0;
    uint64_t sh_flags = 0;
    uint64_t sh_addr = 0;
    uint64_t sh_offset = 0;
    uint64_t sh_size = 0;
    uint32_t sh_link = 0;
    uint32_t sh_info = 0;
    uint64_t sh_addralign = 0;
    uint64_t sh_entsize = 0;
};

/**
 * @brief Class-neutral program header used after decoding
 */
struct ProgramHeaderRecord {
    uint32_t p_type = 0;
    uint32_t p_flags = 0;
    uint64_t p_offset = 0;
    uint64_t p_vaddr = 0;
    uint64_t p_paddr = 0;
    uint64_t p_filesz = 0;
    uint64_t p_memsz = 0;
    uint64_t p_align = 0;
};

// ============================================================================
// Decoding Enumerations
// ============================================================================

/**
 * @brief ELF object file types (e_type)
 */
enum class ElfObjectType : uint16_t {
    ET_NONE = 0,  ///< No file type
    ET_REL = 1,   ///< Relocatable object
    ET_EXEC = 2,  ///< Executable
    ET_DYN = 3,   ///< Shared object or position-independent executable
    ET_CORE = 4   ///< Core dump
};

/**
 * @brief ELF machine types with a display name
 */
enum class ElfMachine : uint16_t {
    EM_NONE = 0x00,
    EM_SPARC = 0x02,
    EM_386 = 0x03,
    EM_MIPS = 0x08,
    EM_PPC = 0x14,
    EM_PPC64 = 0x15,
    EM_S390 = 0x16,
    EM_ARM = 0x28,
    EM_X86_64 = 0x3E,
    EM_XTENSA = 0x5E,
    EM_AARCH64 = 0xB7,
    EM_RISCV = 0xF3,
    EM_LOONGARCH = 0x102
};

/**
 * @brief ELF section types
 *
 * ## Types that matter for region extraction:
 * - **SHT_NULL**: unused entry, never produces a content region
 * - **SHT_NOBITS**: occupies memory but no file bytes (.bss), virtual tree only
 * - **SHT_DYNAMIC / SHT_DYNSYM / SHT_REL / SHT_RELA ...**: carry a linked-section note
 */
enum class SectionType : uint32_t {
    SHT_NULL = 0,
    SHT_PROGBITS = 1,
    SHT_SYMTAB = 2,
    SHT_STRTAB = 3,
    SHT_RELA = 4,
    SHT_HASH = 5,
    SHT_DYNAMIC = 6,
    SHT_NOTE = 7,
    SHT_NOBITS = 8,
    SHT_REL = 9,
    SHT_SHLIB = 10,
    SHT_DYNSYM = 11,
    SHT_INIT_ARRAY = 14,
    SHT_FINI_ARRAY = 15,
    SHT_PREINIT_ARRAY = 16,
    SHT_GROUP = 17,
    SHT_SYMTAB_SHNDX = 18,
    SHT_RELR = 19,

    SHT_LOOS = 0x60000000,
    SHT_GNU_ATTRIBUTES = 0x6ffffff5,
    SHT_GNU_HASH = 0x6ffffff6,
    SHT_GNU_LIBLIST = 0x6ffffff7,
    SHT_GNU_verdef = 0x6ffffffd,
    SHT_GNU_verneed = 0x6ffffffe,
    SHT_GNU_versym = 0x6fffffff,
    SHT_HIOS = 0x6fffffff,

    SHT_LOPROC = 0x70000000,
    SHT_ARM_EXIDX = 0x70000001,
    SHT_ARM_ATTRIBUTES = 0x70000003,
    SHT_HIPROC = 0x7fffffff,

    SHT_LOUSER = 0x80000000,
    SHT_HIUSER = 0xffffffff
};

/**
 * @brief ELF section flags (sh_flags bits)
 */
enum class SectionFlags : uint64_t {
    SHF_WRITE = 0x1,
    SHF_ALLOC = 0x2,  ///< Section occupies memory during execution
    SHF_EXECINSTR = 0x4,
    SHF_MERGE = 0x10,
    SHF_STRINGS = 0x20,
    SHF_INFO_LINK = 0x40,  ///< sh_info holds a section index
    SHF_LINK_ORDER = 0x80,
    SHF_OS_NONCONFORMING = 0x100,
    SHF_GROUP = 0x200,
    SHF_TLS = 0x400,
    SHF_COMPRESSED = 0x800,
    SHF_GNU_RETAIN = 0x200000,
    SHF_EXCLUDE = 0x80000000
};

/**
 * @brief ELF program header types (segment types)
 */
enum class ElfSegmentType : uint32_t {
    PT_NULL = 0,
    PT_LOAD = 1,
    PT_DYNAMIC = 2,
    PT_INTERP = 3,
    PT_NOTE = 4,
    PT_SHLIB = 5,
    PT_PHDR = 6,
    PT_TLS = 7,

    PT_LOOS = 0x60000000,
    PT_GNU_EH_FRAME = 0x6474e550,
    PT_GNU_STACK = 0x6474e551,
    PT_GNU_RELRO = 0x6474e552,
    PT_GNU_PROPERTY = 0x6474e553,
    PT_HIOS = 0x6fffffff,

    PT_LOPROC = 0x70000000,
    PT_ARM_EXIDX = 0x70000001,
    PT_HIPROC = 0x7fffffff
};

/**
 * @brief ELF program header flags
 */
enum class ElfSegmentFlags : uint32_t {
    PF_X = 1,  ///< Execute permission
    PF_W = 2,  ///< Write permission
    PF_R = 4   ///< Read permission
};
