/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfNames.h"

#include <gtest/gtest.h>

namespace {

constexpr uint16_t kX86_64 = 62;
constexpr uint16_t kArm = 40;

TEST(ElfNamesTest, FormatsHexWithoutPadding) {
  EXPECT_EQ(ElfNames::formatHex(0), "0x0");
  EXPECT_EQ(ElfNames::formatHex(0x1000), "0x1000");
  EXPECT_EQ(ElfNames::formatHex(0xDEADBEEF), "0xdeadbeef");
}

TEST(ElfNamesTest, DecodesIdentification) {
  EXPECT_EQ(ElfNames::elfClassName(ElfClass::ELFCLASS32), "ELF32");
  EXPECT_EQ(ElfNames::elfClassName(ElfClass::ELFCLASS64), "ELF64");
  EXPECT_EQ(ElfNames::dataEncodingName(ElfData::ELFDATA2LSB), "2's complement, little endian");
  EXPECT_EQ(ElfNames::dataEncodingName(ElfData::ELFDATA2MSB), "2's complement, big endian");
}

TEST(ElfNamesTest, DecodesObjectTypeAndMachine) {
  EXPECT_EQ(ElfNames::objectTypeName(2), "EXEC");
  EXPECT_EQ(ElfNames::objectTypeName(3), "DYN");
  EXPECT_EQ(ElfNames::objectTypeName(0x1234), "UNKNOWN (0x1234)");
  EXPECT_EQ(ElfNames::machineName(kX86_64), "x86-64");
  EXPECT_EQ(ElfNames::machineName(183), "AArch64");
  EXPECT_EQ(ElfNames::machineName(0xbeef), "UNKNOWN (0xbeef)");
}

TEST(ElfNamesTest, DecodesGenericSectionTypes) {
  EXPECT_EQ(ElfNames::sectionTypeName(0, kX86_64), "NULL");
  EXPECT_EQ(ElfNames::sectionTypeName(1, kX86_64), "PROGBITS");
  EXPECT_EQ(ElfNames::sectionTypeName(8, kX86_64), "NOBITS");
  EXPECT_EQ(ElfNames::sectionTypeName(0x6ffffff6, kX86_64), "GNU_HASH");
}

TEST(ElfNamesTest, ProcessorSpecificTypeDependsOnMachine) {
  EXPECT_EQ(ElfNames::sectionTypeName(0x70000001, kArm), "ARM_EXIDX");
  EXPECT_EQ(ElfNames::sectionTypeName(0x70000001, kX86_64), "X86_64_UNWIND");
  EXPECT_EQ(ElfNames::sectionTypeName(0x70000001, 0), "LOPROC+0x1");
}

TEST(ElfNamesTest, UnknownSectionTypesAreRangeRelative) {
  EXPECT_EQ(ElfNames::sectionTypeName(0x80000005, kX86_64), "LOUSER+0x5");
  EXPECT_EQ(ElfNames::sectionTypeName(0x60000010, kX86_64), "LOOS+0x10");
  EXPECT_EQ(ElfNames::sectionTypeName(0x100, kX86_64), "UNKNOWN (0x100)");
}

TEST(ElfNamesTest, DecodesSectionFlags) {
  EXPECT_EQ(ElfNames::sectionFlagsName(0), "NONE");
  EXPECT_EQ(ElfNames::sectionFlagsName(0x6), "ALLOC|EXECINSTR");
  EXPECT_EQ(ElfNames::sectionFlagsName(0x3), "WRITE|ALLOC");
  EXPECT_EQ(ElfNames::sectionFlagsName(0x2 | 0x1000000), "ALLOC|0x1000000");
}

TEST(ElfNamesTest, DecodesSegments) {
  EXPECT_EQ(ElfNames::segmentTypeName(1), "LOAD");
  EXPECT_EQ(ElfNames::segmentTypeName(0x6474e551), "GNU_STACK");
  EXPECT_EQ(ElfNames::segmentFlagsName(0), "NONE");
  EXPECT_EQ(ElfNames::segmentFlagsName(0x5), "R|X");
  EXPECT_EQ(ElfNames::segmentFlagsName(0x7), "R|W|X");
}

TEST(ElfNamesTest, ClassifiesLinkedSections) {
  EXPECT_TRUE(ElfNames::hasLinkedSection(11));   // DYNSYM
  EXPECT_TRUE(ElfNames::hasLinkedSection(4));    // RELA
  EXPECT_FALSE(ElfNames::hasLinkedSection(1));   // PROGBITS
  EXPECT_TRUE(ElfNames::isRelocationSection(9)); // REL
  EXPECT_FALSE(ElfNames::isRelocationSection(11));
}

}  // namespace
