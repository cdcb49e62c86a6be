/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <string>
#include "ElfStructures.h"

/**
 * @file ElfNames.h
 * @brief Display names for decoded ELF header values
 *
 * These strings end up in region notes. Values without a known name are still
 * rendered: OS, processor and user range values relative to their range base
 * (e.g. "LOOS+0x1"), everything else as "UNKNOWN (0x...)".
 */
namespace ElfNames {

/// Lowercase hexadecimal with 0x prefix and no padding
std::string formatHex(uint64_t value);

std::string elfClassName(ElfClass elf_class);
std::string dataEncodingName(ElfData encoding);
std::string objectTypeName(uint16_t type);
std::string machineName(uint16_t machine);

/**
 * @brief Decode a section type
 * @param machine e_machine of the file, selects processor-specific names
 */
std::string sectionTypeName(uint32_t type, uint16_t machine);

/// Set flag bits joined with '|', unknown remainder as hex, "NONE" for zero
std::string sectionFlagsName(uint64_t flags);

std::string segmentTypeName(uint32_t type);

/// Permission bits as "R|W|X" subset, "NONE" for zero
std::string segmentFlagsName(uint32_t flags);

/**
 * @brief Whether sections of this type reference another section through sh_link
 *
 * True for the dynamic linking and relocation types whose notes carry a
 * "linked section" entry.
 */
bool hasLinkedSection(uint32_t type);

/// REL and RELA sections, whose sh_info may name the section they patch
bool isRelocationSection(uint32_t type);

}  // namespace ElfNames
