/* Copyright © 2026 The pdf2txt developers
 *
 * This file is part of pdf2txt.
 *
 * pdf2txt is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdf2txt is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "page-selection.hh"

static std::vector<int> enumerate(const std::set<int> &page_numbers, int max_pages, int n_pages)
{
  pdf::PageSelection selection(page_numbers, max_pages, n_pages);
  std::vector<int> result;
  int index;
  while (selection.next(index))
    result.push_back(index);
  return result;
}

TEST(PageSelection, AllPages)
{
  EXPECT_EQ(enumerate({}, 0, 4), std::vector<int>({0, 1, 2, 3}));
}

TEST(PageSelection, EmptyDocument)
{
  EXPECT_TRUE(enumerate({}, 0, 0).empty());
  EXPECT_TRUE(enumerate({0}, 1, 0).empty());
}

TEST(PageSelection, FilterKeepsDocumentOrder)
{
  EXPECT_EQ(enumerate({3, 0, 2}, 0, 4), std::vector<int>({0, 2, 3}));
}

TEST(PageSelection, OutOfRangeNumbersAreIgnored)
{
  EXPECT_EQ(enumerate({1, 7, 100}, 0, 3), std::vector<int>({1}));
  EXPECT_TRUE(enumerate({5}, 0, 3).empty());
}

TEST(PageSelection, MaxPages)
{
  EXPECT_EQ(enumerate({}, 2, 5), std::vector<int>({0, 1}));
  EXPECT_EQ(enumerate({}, 10, 3), std::vector<int>({0, 1, 2}));
}

TEST(PageSelection, MaxPagesCountsSelectedPages)
{
  EXPECT_EQ(enumerate({1, 3, 4}, 2, 5), std::vector<int>({1, 3}));
}

TEST(PageSelection, MaxPagesZeroMeansUnlimited)
{
  EXPECT_EQ(enumerate({}, 0, 3).size(), 3U);
}

TEST(PageSelection, Exhausted)
{
  pdf::PageSelection selection({}, 1, 3);
  EXPECT_FALSE(selection.exhausted());
  int index = -1;
  ASSERT_TRUE(selection.next(index));
  EXPECT_EQ(index, 0);
  EXPECT_TRUE(selection.exhausted());
  EXPECT_FALSE(selection.next(index));
  EXPECT_EQ(selection.get_n_yielded(), 1);
}

TEST(PageSelection, Ranges)
{
  pdf::PageSelection selection({4}, {{1, 2}, {6, 2000000000}}, 0, 8);
  std::vector<int> result;
  int index;
  while (selection.next(index))
    result.push_back(index);
  EXPECT_EQ(result, std::vector<int>({1, 2, 4, 6, 7}));
}

TEST(PageSelection, RangesAndMaxPages)
{
  pdf::PageSelection selection({}, {{0, 2147483646}}, 2, 5);
  int index;
  ASSERT_TRUE(selection.next(index));
  EXPECT_EQ(index, 0);
  ASSERT_TRUE(selection.next(index));
  EXPECT_EQ(index, 1);
  EXPECT_FALSE(selection.next(index));
}

TEST(PageSelection, RangeOutsideDocument)
{
  pdf::PageSelection selection({}, {{10, 20}}, 0, 3);
  int index;
  EXPECT_FALSE(selection.next(index));
  EXPECT_EQ(selection.get_n_yielded(), 0);
}

TEST(PageSelection, Accepts)
{
  pdf::PageSelection selection({2}, 0, 3);
  EXPECT_FALSE(selection.accepts(0));
  EXPECT_TRUE(selection.accepts(2));
  EXPECT_FALSE(selection.accepts(-1));
  EXPECT_FALSE(selection.accepts(3));
}

// vim:ts=2 sts=2 sw=2 et
