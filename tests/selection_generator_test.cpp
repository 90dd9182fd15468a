#include <gtest/gtest.h>

#include <set>

#include "selection_generator.h"

TEST(SelectionGenerator, CombinesCountsAcrossClasses) {
  const auto selections =
      collect_selections(SelectionGenerator({0x03, 0x0C, 0x30}, 3));
  // Two from one class and one from another, or one from each.
  EXPECT_EQ(selections.size(), 3u * 2u + 1u);
  std::set<slot_mask> distinct;
  for (const slot_mask selection : selections) {
    EXPECT_EQ(mask_size(selection), 3);
    distinct.insert(selection);
  }
  EXPECT_EQ(distinct.size(), selections.size());
}

TEST(SelectionGenerator, SingleClassYieldsOneSelection) {
  const auto selections = collect_selections(SelectionGenerator({0xFF}, 4));
  EXPECT_EQ(selections, (std::vector<slot_mask>{0x0F}));
}

TEST(SelectionGenerator, OrderIsLexicographicAndSkipsExcluded) {
  const auto selections =
      collect_selections(SelectionGenerator({0x0F, 0xF0}, 4, {0x0F}));
  EXPECT_EQ(selections, (std::vector<slot_mask>{0xF0, 0x71, 0x33, 0x17}));
}

TEST(SelectionGenerator, EdgeSizes) {
  EXPECT_EQ(collect_selections(SelectionGenerator({0x0F}, 0)),
            (std::vector<slot_mask>{0}));
  EXPECT_EQ(collect_selections(SelectionGenerator({}, 0)),
            (std::vector<slot_mask>{0}));
  EXPECT_TRUE(collect_selections(SelectionGenerator({}, 2)).empty());
  EXPECT_TRUE(collect_selections(SelectionGenerator({0x03, 0x0C}, 5)).empty());
  EXPECT_TRUE(collect_selections(SelectionGenerator({0x0F}, 4, {0x0F})).empty());
}

TEST(SelectionGenerator, StaysExhausted) {
  SelectionGenerator generator({0x0F}, 4);
  slot_mask selection = 0;
  EXPECT_TRUE(generator.next(selection));
  EXPECT_EQ(selection, 0x0Fu);
  EXPECT_FALSE(generator.next(selection));
  EXPECT_FALSE(generator.next(selection));
}
