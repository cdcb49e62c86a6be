/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfNames.h"

#include <sstream>
#include <utility>

namespace ElfNames {

namespace {

// Processor-specific section types that share values across architectures
constexpr uint32_t SHT_X86_64_UNWIND = 0x70000001;
constexpr uint32_t SHT_RISCV_ATTRIBUTES = 0x70000003;

const std::pair<uint64_t, const char*> SECTION_FLAG_NAMES[] = {
    {static_cast<uint64_t>(SectionFlags::SHF_WRITE), "WRITE"},
    {static_cast<uint64_t>(SectionFlags::SHF_ALLOC), "ALLOC"},
    {static_cast<uint64_t>(SectionFlags::SHF_EXECINSTR), "EXECINSTR"},
    {static_cast<uint64_t>(SectionFlags::SHF_MERGE), "MERGE"},
    {static_cast<uint64_t>(SectionFlags::SHF_STRINGS), "STRINGS"},
    {static_cast<uint64_t>(SectionFlags::SHF_INFO_LINK), "INFO_LINK"},
    {static_cast<uint64_t>(SectionFlags::SHF_LINK_ORDER), "LINK_ORDER"},
    {static_cast<uint64_t>(SectionFlags::SHF_OS_NONCONFORMING), "OS_NONCONFORMING"},
    {static_cast<uint64_t>(SectionFlags::SHF_GROUP), "GROUP"},
    {static_cast<uint64_t>(SectionFlags::SHF_TLS), "TLS"},
    {static_cast<uint64_t>(SectionFlags::SHF_COMPRESSED), "COMPRESSED"},
    {static_cast<uint64_t>(SectionFlags::SHF_GNU_RETAIN), "GNU_RETAIN"},
    {static_cast<uint64_t>(SectionFlags::SHF_EXCLUDE), "EXCLUDE"},
};

std::string unknownValue(uint64_t value) {
    return "UNKNOWN (" + formatHex(value) + ")";
}

std::string rangeRelative(const char* base_name, uint64_t base, uint64_t value) {
    return std::string(base_name) + "+" + formatHex(value - base);
}

}  // namespace

std::string formatHex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

std::string elfClassName(ElfClass elf_class) {
    switch (elf_class) {
        case ElfClass::ELFCLASS32:
            return "ELF32";
        case ElfClass::ELFCLASS64:
            return "ELF64";
    }
    return unknownValue(static_cast<uint64_t>(elf_class));
}

std::string dataEncodingName(ElfData encoding) {
    switch (encoding) {
        case ElfData::ELFDATA2LSB:
            return "2's complement, little endian";
        case ElfData::ELFDATA2MSB:
            return "2's complement, big endian";
    }
    return unknownValue(static_cast<uint64_t>(encoding));
}

std::string objectTypeName(uint16_t type) {
    switch (static_cast<ElfObjectType>(type)) {
        case ElfObjectType::ET_NONE:
            return "NONE";
        case ElfObjectType::ET_REL:
            return "REL";
        case ElfObjectType::ET_EXEC:
            return "EXEC";
        case ElfObjectType::ET_DYN:
            return "DYN";
        case ElfObjectType::ET_CORE:
            return "CORE";
    }
    return unknownValue(type);
}

std::string machineName(uint16_t machine) {
    switch (static_cast<ElfMachine>(machine)) {
        case ElfMachine::EM_NONE:
            return "None";
        case ElfMachine::EM_SPARC:
            return "SPARC";
        case ElfMachine::EM_386:
            return "Intel 80386";
        case ElfMachine::EM_MIPS:
            return "MIPS";
        case ElfMachine::EM_PPC:
            return "PowerPC";
        case ElfMachine::EM_PPC64:
            return "PowerPC64";
        case ElfMachine::EM_S390:
            return "IBM S/390";
        case ElfMachine::EM_ARM:
            return "ARM";
        case ElfMachine::EM_X86_64:
            return "x86-64";
        case ElfMachine::EM_XTENSA:
            return "Xtensa";
        case ElfMachine::EM_AARCH64:
            return "AArch64";
        case ElfMachine::EM_RISCV:
            return "RISC-V";
        case ElfMachine::EM_LOONGARCH:
            return "LoongArch";
    }
    return unknownValue(machine);
}

std::string sectionTypeName(uint32_t type, uint16_t machine) {
    switch (static_cast<SectionType>(type)) {
        case SectionType::SHT_NULL:
            return "NULL";
        case SectionType::SHT_PROGBITS:
            return "PROGBITS";
        case SectionType::SHT_SYMTAB:
            return "SYMTAB";
        case SectionType::SHT_STRTAB:
            return "STRTAB";
        case SectionType::SHT_RELA:
            return "RELA";
        case SectionType::SHT_HASH:
            return "HASH";
        case SectionType::SHT_DYNAMIC:
            return "DYNAMIC";
        case SectionType::SHT_NOTE:
            return "NOTE";
        case SectionType::SHT_NOBITS:
            return "NOBITS";
        case SectionType::SHT_REL:
            return "REL";
        case SectionType::SHT_SHLIB:
            return "SHLIB";
        case SectionType::SHT_DYNSYM:
            return "DYNSYM";
        case SectionType::SHT_INIT_ARRAY:
            return "INIT_ARRAY";
        case SectionType::SHT_FINI_ARRAY:
            return "FINI_ARRAY";
        case SectionType::SHT_PREINIT_ARRAY:
            return "PREINIT_ARRAY";
        case SectionType::SHT_GROUP:
            return "GROUP";
        case SectionType::SHT_SYMTAB_SHNDX:
            return "SYMTAB_SHNDX";
        case SectionType::SHT_RELR:
            return "RELR";
        case SectionType::SHT_GNU_ATTRIBUTES:
            return "GNU_ATTRIBUTES";
        case SectionType::SHT_GNU_HASH:
            return "GNU_HASH";
        case SectionType::SHT_GNU_LIBLIST:
            return "GNU_LIBLIST";
        case SectionType::SHT_GNU_verdef:
            return "GNU_verdef";
        case SectionType::SHT_GNU_verneed:
            return "GNU_verneed";
        case SectionType::SHT_GNU_versym:
            return "GNU_versym";
        default:
            break;
    }

    const auto machine_type = static_cast<ElfMachine>(machine);
    if (machine_type == ElfMachine::EM_ARM) {
        if (type == static_cast<uint32_t>(SectionType::SHT_ARM_EXIDX)) {
            return "ARM_EXIDX";
        }
        if (type == static_cast<uint32_t>(SectionType::SHT_ARM_ATTRIBUTES)) {
            return "ARM_ATTRIBUTES";
        }
    } else if (machine_type == ElfMachine::EM_X86_64 && type == SHT_X86_64_UNWIND) {
        return "X86_64_UNWIND";
    } else if (machine_type == ElfMachine::EM_RISCV && type == SHT_RISCV_ATTRIBUTES) {
        return "RISCV_ATTRIBUTES";
    }

    const auto loos = static_cast<uint32_t>(SectionType::SHT_LOOS);
    const auto loproc = static_cast<uint32_t>(SectionType::SHT_LOPROC);
    const auto louser = static_cast<uint32_t>(SectionType::SHT_LOUSER);
    if (type >= louser) {
        return rangeRelative("LOUSER", louser, type);
    }
    if (type >= loproc && type <= static_cast<uint32_t>(SectionType::SHT_HIPROC)) {
        return rangeRelative("LOPROC", loproc, type);
    }
    if (type >= loos && type <= static_cast<uint32_t>(SectionType::SHT_HIOS)) {
        return rangeRelative("LOOS", loos, type);
    }
    return unknownValue(type);
}

std::string sectionFlagsName(uint64_t flags) {
    if (flags == 0) {
        return "NONE";
    }

    std::string result;
    uint64_t remaining = flags;
    for (const auto& entry : SECTION_FLAG_NAMES) {
        if ((flags & entry.first) != 0) {
            if (!result.empty()) {
                result += "|";
            }
            result += entry.second;
            remaining &= ~entry.first;
        }
    }
    if (remaining != 0) {
        if (!result.empty()) {
            result += "|";
        }
        result += formatHex(remaining);
    }
    return result;
}

std::string segmentTypeName(uint32_t type) {
    switch (static_cast<ElfSegmentType>(type)) {
        case ElfSegmentType::PT_NULL:
            return "NULL";
        case ElfSegmentType::PT_LOAD:
            return "LOAD";
        case ElfSegmentType::PT_DYNAMIC:
            return "DYNAMIC";
        case ElfSegmentType::PT_INTERP:
            return "INTERP";
        case ElfSegmentType::PT_NOTE:
            return "NOTE";
        case ElfSegmentType::PT_SHLIB:
            return "SHLIB";
        case ElfSegmentType::PT_PHDR:
            return "PHDR";
        case ElfSegmentType::PT_TLS:
            return "TLS";
        case ElfSegmentType::PT_GNU_EH_FRAME:
            return "GNU_EH_FRAME";
        case ElfSegmentType::PT_GNU_STACK:
            return "GNU_STACK";
        case ElfSegmentType::PT_GNU_RELRO:
            return "GNU_RELRO";
        case ElfSegmentType::PT_GNU_PROPERTY:
            return "GNU_PROPERTY";
        default:
            break;
    }

    const auto loos = static_cast<uint32_t>(ElfSegmentType::PT_LOOS);
    const auto loproc = static_cast<uint32_t>(ElfSegmentType::PT_LOPROC);
    if (type >= loproc && type <= static_cast<uint32_t>(ElfSegmentType::PT_HIPROC)) {
        return rangeRelative("LOPROC", loproc, type);
    }
    if (type >= loos && type <= static_cast<uint32_t>(ElfSegmentType::PT_HIOS)) {
        return rangeRelative("LOOS", loos, type);
    }
    return unknownValue(type);
}

std::string segmentFlagsName(uint32_t flags) {
    if (flags == 0) {
        return "NONE";
    }

    const std::pair<uint32_t, const char*> permissions[] = {
        {static_cast<uint32_t>(ElfSegmentFlags::PF_R), "R"},
        {static_cast<uint32_t>(ElfSegmentFlags::PF_W), "W"},
        {static_cast<uint32_t>(ElfSegmentFlags::PF_X), "X"},
    };

    std::string result;
    uint32_t remaining = flags;
    for (const auto& permission : permissions) {
        if ((flags & permission.first) != 0) {
            if (!result.empty()) {
                result += "|";
            }
            result += permission.second;
            remaining &= ~permission.first;
        }
    }
    if (remaining != 0) {
        if (!result.empty()) {
            result += "|";
        }
        result += formatHex(remaining);
    }
    return result;
}

bool hasLinkedSection(uint32_t type) {
    switch (static_cast<SectionType>(type)) {
        case SectionType::SHT_DYNAMIC:
        case SectionType::SHT_DYNSYM:
        case SectionType::SHT_HASH:
        case SectionType::SHT_GNU_HASH:
        case SectionType::SHT_REL:
        case SectionType::SHT_RELA:
        case SectionType::SHT_RELR:
        case SectionType::SHT_GNU_versym:
        case SectionType::SHT_GNU_verdef:
        case SectionType::SHT_GNU_verneed:
            return true;
        default:
            return false;
    }
}

bool isRelocationSection(uint32_t type) {
    return type == static_cast<uint32_t>(SectionType::SHT_REL) ||
           type == static_cast<uint32_t>(SectionType::SHT_RELA);
}

}  // namespace ElfNames
