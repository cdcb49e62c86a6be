/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "output/OutputGenerator.h"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace {

class OutputGeneratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    Region nested(".x", 0x10, 0x11, RegionKind::SectionContent);
    nested.addNote("display", "zero-length range widened to 1 byte");
    Region header("ELF Header", 0, 0x40, RegionKind::Header);
    header.addNote("class", "ELF64");
    header.children.push_back(nested);
    Region file_root("ELF file", 0, 0x100, RegionKind::SyntheticRoot);
    file_root.children.push_back(header);

    Region text(".text", 0x1000, 0x1010, RegionKind::SectionContent);
    Region virtual_root("Virtual memory", 0, 0x1010, RegionKind::SyntheticRoot);
    virtual_root.children.push_back(text);

    BinaryLayout layout;
    layout.name = "demo";
    layout.fileSpace = RegionTree(file_root, 0x100);
    layout.virtualSpace = RegionTree(virtual_root, 0x1010);
    layouts_.push_back(layout);
  }

  std::string render(const Config& config) {
    std::ostringstream out;
    OutputGenerator generator(config, out);
    generator.generate(layouts_);
    return out.str();
  }

  std::vector<BinaryLayout> layouts_;
};

TEST_F(OutputGeneratorTest, TextListsFileTreeIndentedByDepth) {
  Config config;
  config.space = "file";
  EXPECT_EQ(render(config),
            "demo: file space (256 bytes)\n"
            "[0x0, 0x100) ELF file (SyntheticRoot)\n"
            "  [0x0, 0x40) ELF Header (Header)\n"
            "    [0x10, 0x11) .x (SectionContent)\n");
}

TEST_F(OutputGeneratorTest, TextPrintsBothSpacesSeparatedByBlankLine) {
  Config config;
  EXPECT_EQ(render(config),
            "demo: file space (256 bytes)\n"
            "[0x0, 0x100) ELF file (SyntheticRoot)\n"
            "  [0x0, 0x40) ELF Header (Header)\n"
            "    [0x10, 0x11) .x (SectionContent)\n"
            "\n"
            "demo: virtual space (4112 bytes)\n"
            "[0x0, 0x1010) Virtual memory (SyntheticRoot)\n"
            "  [0x1000, 0x1010) .text (SectionContent)\n");
}

TEST_F(OutputGeneratorTest, TextShowsNotesWhenRequested) {
  Config config;
  config.space = "file";
  config.showNotes = true;
  EXPECT_EQ(render(config),
            "demo: file space (256 bytes)\n"
            "[0x0, 0x100) ELF file (SyntheticRoot)\n"
            "  [0x0, 0x40) ELF Header (Header)\n"
            "      class: ELF64\n"
            "    [0x10, 0x11) .x (SectionContent)\n"
            "        display: zero-length range widened to 1 byte\n");
}

TEST_F(OutputGeneratorTest, MaxDepthCutsDeeperRegions) {
  Config config;
  config.space = "file";
  config.maxDepth = 1;
  std::string text = render(config);
  EXPECT_NE(text.find("ELF Header"), std::string::npos);
  EXPECT_EQ(text.find(".x"), std::string::npos);
}

TEST_F(OutputGeneratorTest, JsonCarriesBothTreesAndNotes) {
  Config config;
  config.format = "json";
  std::string json = render(config);

  EXPECT_EQ(json.front(), '[');
  EXPECT_NE(json.find("\"name\": \"demo\""), std::string::npos);
  EXPECT_NE(json.find("\"fileSpace\": {"), std::string::npos);
  EXPECT_NE(json.find("\"virtualSpace\": {"), std::string::npos);
  EXPECT_NE(json.find("\"totalSize\": 256"), std::string::npos);
  EXPECT_NE(json.find("\"kind\": \"SyntheticRoot\""), std::string::npos);
  EXPECT_NE(json.find("\"start\": 4096"), std::string::npos);
  EXPECT_NE(json.find("{\"label\": \"class\", \"value\": \"ELF64\"}"), std::string::npos);
}

TEST_F(OutputGeneratorTest, JsonRespectsSpaceSelection) {
  Config config;
  config.format = "json";
  config.space = "virtual";
  std::string json = render(config);
  EXPECT_EQ(json.find("\"fileSpace\""), std::string::npos);
  EXPECT_NE(json.find("\"virtualSpace\""), std::string::npos);
}

TEST_F(OutputGeneratorTest, EmptyLayoutListIsEmptyJsonArray) {
  Config config;
  config.format = "json";
  layouts_.clear();
  EXPECT_EQ(render(config), "[\n]\n");
}

TEST(OutputGeneratorEscapeTest, EscapesJsonSpecialCharacters) {
  EXPECT_EQ(OutputGenerator::escapeJson("plain"), "plain");
  EXPECT_EQ(OutputGenerator::escapeJson("a\"b\\c"), "a\\\"b\\\\c");
  EXPECT_EQ(OutputGenerator::escapeJson("line\nbreak\t"), "line\\nbreak\\t");
  EXPECT_EQ(OutputGenerator::escapeJson(std::string("\x01", 1)), "\\u0001");
  EXPECT_EQ(OutputGenerator::escapeJson("carriage\r"), "carriage\\r");
}

TEST(OutputGeneratorEscapeTest, ReplacesBytesThatAreNotUtf8) {
  EXPECT_EQ(OutputGenerator::escapeJson(".te\xff\xfe" "xt"), ".te\\ufffd\\ufffdxt");
  // Truncated sequence, overlong encoding and encoded surrogate
  EXPECT_EQ(OutputGenerator::escapeJson("a\xc3"), "a\\ufffd");
  EXPECT_EQ(OutputGenerator::escapeJson("\xc0\xaf"), "\\ufffd\\ufffd");
  EXPECT_EQ(OutputGenerator::escapeJson("\xed\xa0\x80"), "\\ufffd\\ufffd\\ufffd");
}

TEST(OutputGeneratorEscapeTest, KeepsWellFormedUtf8) {
  EXPECT_EQ(OutputGenerator::escapeJson(".d\xc3\xa9j\xc3\xa0"), ".d\xc3\xa9j\xc3\xa0");
  EXPECT_EQ(OutputGenerator::escapeJson("\xe2\x82\xac\xf0\x9f\x98\x80"),
            "\xe2\x82\xac\xf0\x9f\x98\x80");
}

}  // namespace
