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

#ifndef PDF2TXT_PAGE_SELECTION_HH
#define PDF2TXT_PAGE_SELECTION_HH

#include <set>
#include <utility>
#include <vector>

namespace pdf
{

  /* zero-based, inclusive */
  typedef std::vector<std::pair<int, int>> PageRanges;

/* class pdf::PageSelection
 * ========================
 *
 * Enumerates zero-based page ordinals of a document with n_pages pages,
 * in ascending order. A non-empty filter (single ordinals and ranges)
 * restricts the ordinals; ordinals outside the document are ignored. A positive max_pages stops the
 * enumeration after that many ordinals have been produced.
 */

  class PageSelection
  {
  protected:
    std::set<int> page_numbers;
    PageRanges page_ranges;
    int max_pages;
    int n_pages;
    int position;
    int n_yielded;
  public:
    PageSelection(const std::set<int> &page_numbers, int max_pages, int n_pages);
    PageSelection(const std::set<int> &page_numbers, const PageRanges &page_ranges, int max_pages, int n_pages);
    bool accepts(int index) const;
    bool exhausted() const;
    bool next(int &index);
    int get_n_yielded() const
    {
      return this->n_yielded;
    }
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
