/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "RegionStructures.h"

/**
 * @class RegionTreeBuilder
 * @brief Turns a flat list of possibly overlapping regions into a nested tree
 *
 * ## Merge Order
 * The list is scanned for the first overlapping pair (i, j), i < j, with i as
 * the outer loop. The longer region of the pair becomes the parent and receives
 * the shorter one as its last child; on equal length the region at index i is
 * the parent. The parent grows to the union of both ranges, takes slot i, and
 * slot j is removed. Scanning then restarts from the beginning until no pair
 * overlaps. The same resolution runs on every child list, recursively.
 *
 * Surviving regions become children of a synthetic root spanning
 * [0, totalSize), and every child list is stably sorted by start.
 *
 * The merge order decides which region ends up as parent and is part of the
 * observable output; identical input always produces an identical tree.
 */
class RegionTreeBuilder {
public:
    /**
     * @brief Build a tree from a flat region list
     * @param regions Regions of one address space, in extraction order
     * @param total_size Size of the address space, the root spans [0, total_size)
     * @param root_name Display name of the synthetic root
     */
    static RegionTree build(std::vector<Region> regions,
                            uint64_t total_size,
                            const std::string& root_name);

    /**
     * @brief Overlap test used by the resolver
     *
     * Two ranges overlap when an endpoint of either lies strictly inside the
     * other, or when they are identical. Touching ranges ([0,10) and [10,20))
     * do not overlap.
     */
    static bool overlaps(const Region& a, const Region& b);

    /**
     * @brief Resolve overlaps in place until siblings at every level are disjoint
     */
    static void resolveOverlaps(std::vector<Region>& regions);

private:
    static bool findOverlappingPair(const std::vector<Region>& regions, size_t& first, size_t& second);
    static void mergePair(std::vector<Region>& regions, size_t first, size_t second);
    static void sortChildren(Region& region);
};
