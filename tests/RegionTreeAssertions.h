/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <gtest/gtest.h>
#include <cstddef>
#include "RegionStructures.h"
#include "RegionTreeBuilder.h"

namespace elfscope_test {

// Every child lies inside its parent; siblings are disjoint and ascend by start
inline void expectWellFormed(const Region& region) {
  EXPECT_LE(region.start, region.end) << region.name;
  for (size_t i = 0; i < region.children.size(); ++i) {
    const Region& child = region.children[i];
    EXPECT_TRUE(region.contains(child)) << child.name << " escapes " << region.name;
    if (i > 0) {
      const Region& previous = region.children[i - 1];
      EXPECT_LT(previous.start, child.start)
          << previous.name << " does not precede " << child.name;
      EXPECT_LE(previous.end, child.start) << previous.name << " runs into " << child.name;
      EXPECT_FALSE(RegionTreeBuilder::overlaps(previous, child))
          << previous.name << " overlaps " << child.name;
    }
    expectWellFormed(child);
  }
}

inline void expectWellFormed(const RegionTree& tree) {
  EXPECT_EQ(tree.root().start, 0u);
  EXPECT_EQ(tree.root().end, tree.totalSize());
  expectWellFormed(tree.root());
}

}  // namespace elfscope_test
