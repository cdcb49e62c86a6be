/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file RegionStructures.h
 * @brief Region tree data model produced by the ELF region parser
 *
 * A loaded binary is described by two independent trees of named byte ranges:
 * one over file offsets and one over virtual (load-time) addresses.
 *
 * ## Tree Invariants:
 * - Two regions of one tree are either disjoint or one contains the other
 * - Siblings are ordered ascending by start, at every level
 * - The root spans [0, totalSize) and transitively contains every region
 * - end >= start for every region
 *
 * Regions own their children by value. Trees are immutable once built; consumers
 * such as OutputGenerator only read them.
 *
 * @note This header is independent of ElfStructures.h so that it can be included
 *       next to the system <elf.h> or <gelf.h>.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Origin of a region
 */
enum class RegionKind : uint8_t {
    Header,              ///< The fixed ELF header
    ProgramHeaderEntry,  ///< One entry of the program header table
    SectionHeaderEntry,  ///< One entry of the section header table
    SectionContent,      ///< Bytes (or addresses) occupied by a section
    SyntheticRoot        ///< Root spanning the whole space
};

/**
 * @brief Get printable name for a region kind
 */
inline const char* regionKindName(RegionKind kind) {
    switch (kind) {
        case RegionKind::Header:
            return "Header";
        case RegionKind::ProgramHeaderEntry:
            return "ProgramHeaderEntry";
        case RegionKind::SectionHeaderEntry:
            return "SectionHeaderEntry";
        case RegionKind::SectionContent:
            return "SectionContent";
        case RegionKind::SyntheticRoot:
            return "SyntheticRoot";
    }
    return "Unknown";
}

/// Ordered (label, value) annotation attached to a region
using RegionNote = std::pair<std::string, std::string>;

/**
 * @brief A named, contiguous byte interval [start, end) with owned children
 */
struct Region {
    std::string name;
    uint64_t start = 0;
    uint64_t end = 0;
    RegionKind kind = RegionKind::SectionContent;
    std::vector<RegionNote> notes;
    std::vector<Region> children;

    Region() = default;
    Region(std::string region_name, uint64_t region_start, uint64_t region_end, RegionKind region_kind)
        : name(std::move(region_name)), start(region_start), end(region_end), kind(region_kind) {}

    uint64_t length() const { return end - start; }

    /// True if other lies entirely inside this region
    bool contains(const Region& other) const { return other.start >= start && other.end <= end; }

    void addNote(const std::string& label, const std::string& value) {
        notes.emplace_back(label, value);
    }

    /**
     * @brief Find the first note with the given label
     * @return Pointer to the value, or nullptr if absent
     */
    const std::string* findNote(const std::string& label) const {
        for (const auto& note : notes) {
            if (note.first == label) {
                return &note.second;
            }
        }
        return nullptr;
    }

    bool operator==(const Region& other) const {
        return name == other.name && start == other.start && end == other.end &&
               kind == other.kind && notes == other.notes && children == other.children;
    }

    bool operator!=(const Region& other) const { return !(*this == other); }
};

/**
 * @brief Immutable region tree over one address space
 */
class RegionTree {
public:
    RegionTree() = default;
    RegionTree(Region root, uint64_t total_size) : root_(std::move(root)), total_size_(total_size) {}

    const Region& root() const { return root_; }
    uint64_t totalSize() const { return total_size_; }

    /// Number of regions in the tree, root included
    size_t regionCount() const { return countRegions(root_); }

    /// Number of levels below the root (0 for a childless root)
    size_t depth() const { return measureDepth(root_); }

    bool operator==(const RegionTree& other) const {
        return total_size_ == other.total_size_ && root_ == other.root_;
    }

    bool operator!=(const RegionTree& other) const { return !(*this == other); }

private:
    static size_t countRegions(const Region& region) {
        size_t count = 1;
        for (const auto& child : region.children) {
            count += countRegions(child);
        }
        return count;
    }

    static size_t measureDepth(const Region& region) {
        size_t deepest = 0;
        for (const auto& child : region.children) {
            size_t child_depth = 1 + measureDepth(child);
            if (child_depth > deepest) {
                deepest = child_depth;
            }
        }
        return deepest;
    }

    Region root_;
    uint64_t total_size_ = 0;
};

/**
 * @brief Parse result for one binary: both trees plus the display name
 */
struct BinaryLayout {
    std::string name;
    RegionTree fileSpace;
    RegionTree virtualSpace;
};
