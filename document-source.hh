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

#ifndef PDF2TXT_DOCUMENT_SOURCE_HH
#define PDF2TXT_DOCUMENT_SOURCE_HH

#include <istream>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "page-selection.hh"
#include "pdf-backend.hh"

namespace pdf
{

/* class pdf::PageSequence
 * =======================
 *
 * Lazy, single-pass sequence of pages. The pages refer to a document
 * owned by the sequence.
 */

  class PageSequence
  {
  public:
    virtual bool next(pdf::Page &page) = 0;
    virtual ~PageSequence()
    { }
  };


/* class pdf::DocumentSource
 * =========================
 */

  class DocumentSource
  {
  public:
    /* Decryption and, if requested, the extraction permission are checked
     * before the sequence is returned. */
    virtual std::unique_ptr<PageSequence> get_pages(
      std::istream &stream,
      const std::set<int> &page_numbers,
      const PageRanges &page_ranges,
      int max_pages,
      const std::string &password,
      bool caching,
      bool check_extractable
    ) = 0;
    virtual ~DocumentSource()
    { }
  };


/* class pdf::PopplerDocumentSource
 * ================================
 */

  class PopplerDocumentSource : public DocumentSource
  {
  protected:
    pdf::Environment &environment;
  public:
    explicit PopplerDocumentSource(pdf::Environment &environment)
    : environment(environment)
    { }
    std::unique_ptr<PageSequence> get_pages(
      std::istream &stream,
      const std::set<int> &page_numbers,
      const PageRanges &page_ranges,
      int max_pages,
      const std::string &password,
      bool caching,
      bool check_extractable
    );
  };

  class PopplerPageSequence : public PageSequence
  {
  private:
    PopplerPageSequence(const PopplerPageSequence &) = delete;
    PopplerPageSequence& operator=(const PopplerPageSequence &) = delete;
  protected:
    std::unique_ptr<pdf::Document> document;
    PageSelection selection;
    bool caching;
    std::map<int, std::string> labels;
    const std::string &get_label(int index);
  public:
    PopplerPageSequence(std::unique_ptr<pdf::Document> document,
      const std::set<int> &page_numbers, const PageRanges &page_ranges,
      int max_pages, bool caching);
    bool next(pdf::Page &page);
    pdf::Document &get_document()
    {
      return *this->document;
    }
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
