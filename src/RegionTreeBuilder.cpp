/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "RegionTreeBuilder.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace {

bool strictlyInside(uint64_t point, const Region& region) {
    return point > region.start && point < region.end;
}

std::string formatRange(uint64_t start, uint64_t end) {
    std::ostringstream oss;
    oss << "[0x" << std::hex << start << ", 0x" << end << ")";
    return oss.str();
}

}  // namespace

RegionTree RegionTreeBuilder::build(std::vector<Region> regions,
                                    uint64_t total_size,
                                    const std::string& root_name) {
    resolveOverlaps(regions);

    Region root(root_name, 0, total_size, RegionKind::SyntheticRoot);
    root.children = std::move(regions);
    sortChildren(root);
    return RegionTree(std::move(root), total_size);
}

bool RegionTreeBuilder::overlaps(const Region& a, const Region& b) {
    if (a.start == b.start && a.end == b.end) {
        return true;
    }
    return strictlyInside(a.start, b) || strictlyInside(a.end, b) || strictlyInside(b.start, a) ||
           strictlyInside(b.end, a);
}

void RegionTreeBuilder::resolveOverlaps(std::vector<Region>& regions) {
    size_t first = 0;
    size_t second = 0;
    while (findOverlappingPair(regions, first, second)) {
        mergePair(regions, first, second);
    }

    for (auto& region : regions) {
        resolveOverlaps(region.children);
    }
}

bool RegionTreeBuilder::findOverlappingPair(const std::vector<Region>& regions,
                                            size_t& first,
                                            size_t& second) {
    for (size_t i = 0; i < regions.size(); ++i) {
        for (size_t j = i + 1; j < regions.size(); ++j) {
            if (overlaps(regions[i], regions[j])) {
                first = i;
                second = j;
                return true;
            }
        }
    }
    return false;
}

void RegionTreeBuilder::mergePair(std::vector<Region>& regions, size_t first, size_t second) {
    Region& candidate = regions[first];
    Region& other = regions[second];

    // Longer region wins, the earlier slot wins ties
    bool second_is_parent = other.length() > candidate.length();
    Region parent = std::move(second_is_parent ? other : candidate);
    Region child = std::move(second_is_parent ? candidate : other);

    uint64_t merged_start = std::min(parent.start, child.start);
    uint64_t merged_end = std::max(parent.end, child.end);
    if (merged_start != parent.start || merged_end != parent.end) {
        parent.addNote("extended",
                       formatRange(parent.start, parent.end) + " grown to " +
                           formatRange(merged_start, merged_end) + " to contain " + child.name);
        parent.start = merged_start;
        parent.end = merged_end;
    }

    parent.children.push_back(std::move(child));
    regions[first] = std::move(parent);
    regions.erase(regions.begin() + static_cast<std::ptrdiff_t>(second));
}

void RegionTreeBuilder::sortChildren(Region& region) {
    std::stable_sort(region.children.begin(),
                     region.children.end(),
                     [](const Region& a, const Region& b) { return a.start < b.start; });
    for (auto& child : region.children) {
        sortChildren(child);
    }
}
