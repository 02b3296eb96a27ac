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

#include "document-source.hh"

#include <utility>

/* class pdf::PopplerDocumentSource
 * ================================
 */

std::unique_ptr<pdf::PageSequence> pdf::PopplerDocumentSource::get_pages(
  std::istream &stream,
  const std::set<int> &page_numbers,
  const pdf::PageRanges &page_ranges,
  int max_pages,
  const std::string &password,
  bool caching,
  bool check_extractable)
{
  std::unique_ptr<pdf::Document> document(new pdf::Document(stream, password));
  if (check_extractable && !document->is_extractable())
    throw pdf::Document::PermissionError();
  return std::unique_ptr<PageSequence>(
    new PopplerPageSequence(std::move(document), page_numbers, page_ranges, max_pages, caching)
  );
}


/* class pdf::PopplerPageSequence
 * ==============================
 */

pdf::PopplerPageSequence::PopplerPageSequence(std::unique_ptr<pdf::Document> document,
  const std::set<int> &page_numbers, const pdf::PageRanges &page_ranges,
  int max_pages, bool caching)
: document(std::move(document)),
  selection(page_numbers, page_ranges, max_pages, this->document->get_n_pages()),
  caching(caching)
{ }

const std::string &pdf::PopplerPageSequence::get_label(int index)
{
  auto it = this->labels.find(index);
  if (it != this->labels.end() && this->caching)
    return it->second;
  std::string &label = this->labels[index];
  label = this->document->get_page_label(index);
  return label;
}

bool pdf::PopplerPageSequence::next(pdf::Page &page)
{
  int index;
  if (!this->selection.next(index))
    return false;
  page = pdf::Page(
    this->document.get(),
    index,
    this->document->get_page_rotate(index),
    this->document->is_extractable(),
    this->get_label(index)
  );
  return true;
}

// vim:ts=2 sts=2 sw=2 et
