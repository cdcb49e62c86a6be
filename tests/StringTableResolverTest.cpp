/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "StringTableResolver.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class StringTableResolverTest : public ::testing::Test {
protected:
  // "\0.text\0.data\0tail" without a final terminator
  const std::vector<uint8_t> blob_{0,   '.', 't', 'e', 'x', 't', 0,   '.', 'd',
                                   'a', 't', 'a', 0,   't', 'a', 'i', 'l'};
  StringTableResolver resolver_{blob_.data(), blob_.size()};
};

TEST_F(StringTableResolverTest, OffsetZeroIsEmptyName) {
  ResolvedName name = resolver_.resolve(0);
  EXPECT_EQ(name.name, "");
  EXPECT_TRUE(name.valid);
}

TEST_F(StringTableResolverTest, ResolvesUpToTerminator) {
  EXPECT_EQ(resolver_.resolve(1).name, ".text");
  EXPECT_EQ(resolver_.resolve(7).name, ".data");
}

TEST_F(StringTableResolverTest, ResolvesSuffixOfName) {
  EXPECT_EQ(resolver_.resolve(3).name, "ext");
}

TEST_F(StringTableResolverTest, MissingTerminatorRunsToEndOfTable) {
  ResolvedName name = resolver_.resolve(13);
  EXPECT_EQ(name.name, "tail");
  EXPECT_TRUE(name.valid);
}

TEST_F(StringTableResolverTest, OffsetAtEndIsEmptyName) {
  ResolvedName name = resolver_.resolve(blob_.size());
  EXPECT_EQ(name.name, "");
  EXPECT_TRUE(name.valid);
}

TEST_F(StringTableResolverTest, OffsetPastEndYieldsPlaceholder) {
  ResolvedName name = resolver_.resolve(blob_.size() + 1);
  EXPECT_EQ(name.name, StringTableResolver::INVALID_OFFSET_PLACEHOLDER);
  EXPECT_FALSE(name.valid);

  name = resolver_.resolve(0xffffffffffffffffULL);
  EXPECT_FALSE(name.valid);
}

TEST(StringTableResolverEmptyTest, EmptyTableResolvesOnlyOffsetZero) {
  StringTableResolver resolver;
  EXPECT_EQ(resolver.size(), 0u);
  EXPECT_EQ(resolver.resolve(0).name, "");
  EXPECT_TRUE(resolver.resolve(0).valid);
  EXPECT_FALSE(resolver.resolve(1).valid);
}

TEST(StringTableResolverEmptyTest, AbsentTableResolvesEveryOffsetToEmptyName) {
  StringTableResolver resolver = StringTableResolver::absent();
  EXPECT_TRUE(resolver.isAbsent());
  for (uint64_t offset : {0ULL, 1ULL, 0xbULL, 0xffffffffffffffffULL}) {
    ResolvedName name = resolver.resolve(offset);
    EXPECT_EQ(name.name, "");
    EXPECT_TRUE(name.valid);
  }
}

}  // namespace
