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

#include "page-selection.hh"

pdf::PageSelection::PageSelection(const std::set<int> &page_numbers, int max_pages, int n_pages)
: PageSelection(page_numbers, PageRanges(), max_pages, n_pages)
{ }

pdf::PageSelection::PageSelection(const std::set<int> &page_numbers, const PageRanges &page_ranges,
  int max_pages, int n_pages)
: page_numbers(page_numbers),
  page_ranges(page_ranges),
  max_pages(max_pages),
  n_pages(n_pages),
  position(0),
  n_yielded(0)
{ }

bool pdf::PageSelection::accepts(int index) const
{
  if (index < 0 || index >= this->n_pages)
    return false;
  if (this->page_numbers.empty() && this->page_ranges.empty())
    return true;
  if (this->page_numbers.count(index) > 0)
    return true;
  for (const std::pair<int, int> &range : this->page_ranges)
    if (range.first <= index && index <= range.second)
      return true;
  return false;
}

bool pdf::PageSelection::exhausted() const
{
  if (this->max_pages > 0 && this->n_yielded >= this->max_pages)
    return true;
  return this->position >= this->n_pages;
}

bool pdf::PageSelection::next(int &index)
{
  while (!this->exhausted())
  {
    int candidate = this->position++;
    if (!this->accepts(candidate))
      continue;
    this->n_yielded++;
    index = candidate;
    return true;
  }
  return false;
}

// vim:ts=2 sts=2 sw=2 et
