/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file OutputGenerator.cpp
 * @brief Implementation of text and JSON output for region trees
 *
 * ## Key Methods:
 * - generateTextOutput() - Indented tree listing, optional notes
 * - generateJsonOutput() - Nested JSON objects, numbers in decimal
 *
 * @see OutputGenerator.h for class documentation
 */

#include "OutputGenerator.h"

#include <iomanip>
#include <sstream>

namespace {

std::string spaces(size_t count) {
    return std::string(count, ' ');
}

}  // namespace

OutputGenerator::OutputGenerator(const Config& config, std::ostream& out)
    : config_(config), out_(out) {}

void OutputGenerator::generate(const std::vector<BinaryLayout>& layouts) const {
    if (config_.format == "json") {
        generateJsonOutput(layouts);
    } else {
        generateTextOutput(layouts);
    }
}

bool OutputGenerator::includeFileSpace() const {
    return config_.space != "virtual";
}

bool OutputGenerator::includeVirtualSpace() const {
    return config_.space != "file";
}

bool OutputGenerator::depthAllowed(size_t depth) const {
    return config_.maxDepth == 0 || depth <= config_.maxDepth;
}

// ============================================================================
// Text output
// ============================================================================

void OutputGenerator::generateTextOutput(const std::vector<BinaryLayout>& layouts) const {
    bool first = true;
    for (const auto& layout : layouts) {
        if (includeFileSpace()) {
            if (!first) {
                out_ << "\n";
            }
            writeTextTree(layout.name, "file space", layout.fileSpace);
            first = false;
        }
        if (includeVirtualSpace()) {
            if (!first) {
                out_ << "\n";
            }
            writeTextTree(layout.name, "virtual space", layout.virtualSpace);
            first = false;
        }
    }
}

void OutputGenerator::writeTextTree(const std::string& binary_name,
                                    const std::string& space_name,
                                    const RegionTree& tree) const {
    out_ << binary_name << ": " << space_name << " (" << std::dec << tree.totalSize()
         << " bytes)\n";
    writeTextRegion(tree.root(), 0);
}

void OutputGenerator::writeTextRegion(const Region& region, size_t depth) const {
    out_ << spaces(depth * 2) << "[0x" << std::hex << region.start << ", 0x" << region.end << ") "
         << std::dec << region.name << " (" << regionKindName(region.kind) << ")\n";

    if (config_.showNotes) {
        for (const auto& note : region.notes) {
            out_ << spaces(depth * 2 + 4) << note.first << ": " << note.second << "\n";
        }
    }

    if (!depthAllowed(depth + 1)) {
        return;
    }
    for (const auto& child : region.children) {
        writeTextRegion(child, depth + 1);
    }
}

// ============================================================================
// JSON output
// ============================================================================

void OutputGenerator::generateJsonOutput(const std::vector<BinaryLayout>& layouts) const {
    out_ << "[\n";
    for (size_t i = 0; i < layouts.size(); ++i) {
        const auto& layout = layouts[i];
        out_ << "  {\n";
        out_ << "    \"name\": \"" << escapeJson(layout.name) << "\"";
        if (includeFileSpace()) {
            out_ << ",\n    \"fileSpace\": ";
            writeJsonTree(layout.fileSpace, 4);
        }
        if (includeVirtualSpace()) {
            out_ << ",\n    \"virtualSpace\": ";
            writeJsonTree(layout.virtualSpace, 4);
        }
        out_ << "\n  }" << (i + 1 == layouts.size() ? "" : ",") << "\n";
    }
    out_ << "]\n";
}

void OutputGenerator::writeJsonTree(const RegionTree& tree, size_t indent) const {
    out_ << "{\n";
    out_ << spaces(indent + 2) << "\"totalSize\": " << std::dec << tree.totalSize() << ",\n";
    out_ << spaces(indent + 2) << "\"root\": ";
    writeJsonRegion(tree.root(), 0, indent + 2);
    out_ << "\n" << spaces(indent) << "}";
}

void OutputGenerator::writeJsonRegion(const Region& region, size_t depth, size_t indent) const {
    const std::string inner = spaces(indent + 2);
    out_ << "{\n";
    out_ << inner << "\"name\": \"" << escapeJson(region.name) << "\",\n";
    out_ << inner << "\"kind\": \"" << regionKindName(region.kind) << "\",\n";
    out_ << inner << "\"start\": " << std::dec << region.start << ",\n";
    out_ << inner << "\"end\": " << region.end << ",\n";

    out_ << inner << "\"notes\": [";
    for (size_t i = 0; i < region.notes.size(); ++i) {
        const auto& note = region.notes[i];
        out_ << (i == 0 ? "" : ", ") << "{\"label\": \"" << escapeJson(note.first)
             << "\", \"value\": \"" << escapeJson(note.second) << "\"}";
    }
    out_ << "],\n";

    out_ << inner << "\"children\": [";
    if (depthAllowed(depth + 1) && !region.children.empty()) {
        out_ << "\n";
        for (size_t i = 0; i < region.children.size(); ++i) {
            out_ << spaces(indent + 4);
            writeJsonRegion(region.children[i], depth + 1, indent + 4);
            out_ << (i + 1 == region.children.size() ? "" : ",") << "\n";
        }
        out_ << inner;
    }
    out_ << "]\n";
    out_ << spaces(indent) << "}";
}

namespace {

// Length of the well-formed UTF-8 sequence starting at pos, or 0 if the bytes
// there are not one (overlong forms, surrogates and values above U+10FFFF included)
size_t utf8SequenceLength(const std::string& value, size_t pos) {
    const auto byte = [&value](size_t i) { return static_cast<unsigned char>(value[i]); };
    const unsigned char lead = byte(pos);
    size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xbf;
    if (lead >= 0xc2 && lead <= 0xdf) {
        length = 2;
    } else if (lead >= 0xe0 && lead <= 0xef) {
        length = 3;
        if (lead == 0xe0) {
            low = 0xa0;
        } else if (lead == 0xed) {
            high = 0x9f;
        }
    } else if (lead >= 0xf0 && lead <= 0xf4) {
        length = 4;
        if (lead == 0xf0) {
            low = 0x90;
        } else if (lead == 0xf4) {
            high = 0x8f;
        }
    } else {
        return 0;
    }
    if (value.size() - pos < length) {
        return 0;
    }
    if (byte(pos + 1) < low || byte(pos + 1) > high) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (byte(pos + i) < 0x80 || byte(pos + i) > 0xbf) {
            return 0;
        }
    }
    return length;
}

}  // namespace

std::string OutputGenerator::escapeJson(const std::string& value) {
    std::ostringstream oss;
    for (size_t pos = 0; pos < value.size(); ++pos) {
        const char c = value[pos];
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\b':
                oss << "\\b";
                break;
            case '\f':
                oss << "\\f";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default: {
                const auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(byte) << std::dec << std::setfill(' ');
                } else if (byte < 0x80) {
                    oss << c;
                } else if (size_t length = utf8SequenceLength(value, pos)) {
                    oss << value.substr(pos, length);
                    pos += length - 1;
                } else {
                    // Names come from file bytes; each stray byte becomes U+FFFD
                    oss << "\\ufffd";
                }
            }
        }
    }
    return oss.str();
}
