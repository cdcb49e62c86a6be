/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FileAccessStrategy.h"

#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>

namespace {

class FileAccessStrategyTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = ::testing::TempDir() + "file_access_payload.bin";
    payload_ = "0123456789abcdef";
    std::ofstream out(path_, std::ios::binary);
    out << payload_;
  }

  void TearDown() override { std::remove(path_.c_str()); }

  std::string path_;
  std::string payload_;
};

TEST_F(FileAccessStrategyTest, SmallFileIsReadIntoMemory) {
  auto file = FileAccessStrategy::create(path_, 1024);
  EXPECT_FALSE(file->isMemoryMapped());
  EXPECT_EQ(file->getStrategyName(), "In-memory");
  EXPECT_EQ(file->getMetrics().strategy_used, "In-memory");
  EXPECT_FALSE(file->getMetrics().fallback_used);
  EXPECT_GE(file->getMetrics().load_time.count(), 0);
  ASSERT_EQ(file->size(), payload_.size());
  EXPECT_EQ(std::memcmp(file->data(), payload_.data(), payload_.size()), 0);
}

TEST_F(FileAccessStrategyTest, FileAtThresholdIsMapped) {
  auto file = FileAccessStrategy::create(path_, payload_.size());
  EXPECT_TRUE(file->isMemoryMapped());
  EXPECT_EQ(file->getMetrics().strategy_used, "Memory-mapped");
  ASSERT_EQ(file->size(), payload_.size());
  EXPECT_EQ(std::memcmp(file->data(), payload_.data(), payload_.size()), 0);
}

TEST_F(FileAccessStrategyTest, MissingFileReportsNotFound) {
  try {
    FileAccessStrategy::create(path_ + ".missing");
    FAIL() << "expected FileAccessException";
  } catch (const FileAccessException& e) {
    EXPECT_EQ(e.getFailure(), FileAccessFailure::NotFound);
  }
}

TEST_F(FileAccessStrategyTest, DirectoryIsRejected) {
  EXPECT_THROW(FileAccessStrategy::create(::testing::TempDir()), FileAccessException);
}

}  // namespace
