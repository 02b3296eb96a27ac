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

#ifndef PDF2TXT_EXTRACTION_CONFIG_HH
#define PDF2TXT_EXTRACTION_CONFIG_HH

#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include "page-selection.hh"

/* class LayoutParams
 * ==================
 *
 * Knobs forwarded to Poppler's layout analysis. The presence of a
 * LayoutParams object means that text is grouped into boxes and lines;
 * its absence means that text is kept in content-stream order.
 */

class LayoutParams
{
public:
  bool physical_layout;
  double fixed_pitch;
  /* in font-size units */
  double min_column_spacing;
  bool discard_diagonal;

  LayoutParams()
  : physical_layout(false),
    fixed_pitch(0.0),
    min_column_spacing(0.7),
    discard_diagonal(false)
  { }
};

enum class OutputType
{
  text,
  xml,
  html,
  tag,
};

enum class LayoutMode
{
  normal,
  exact,
  loose,
};

/* class ExtractionConfig
 * ======================
 */

class ExtractionConfig
{
public:
  OutputType output_type;
  std::string codec;
  std::unique_ptr<LayoutParams> layout_params;
  /* zero-based; empty means every page */
  std::set<int> page_numbers;
  /* zero-based, inclusive; combined with page_numbers */
  pdf::PageRanges page_ranges;
  /* 0 means no limit */
  int max_pages;
  std::string password;
  /* added to each page's own rotation; may be negative */
  int rotation;
  double scale;
  LayoutMode layout_mode;
  bool strip_control;
  /* empty means that images are not extracted */
  std::string output_dir;
  bool disable_caching;
  int verbose;

  ExtractionConfig();
  ExtractionConfig(const ExtractionConfig &);
  ExtractionConfig& operator=(const ExtractionConfig &);

  bool caching() const
  {
    return !this->disable_caching;
  }

  /* Throws ExtractionConfig::Error on the first invalid setting. */
  void validate() const;

  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string &message)
    : std::runtime_error(message)
    { }
  };
};

OutputType parse_output_type(const std::string &s);
LayoutMode parse_layout_mode(const std::string &s);
const char * get_output_type_name(OutputType output_type);
const char * get_layout_mode_name(LayoutMode layout_mode);

#endif

// vim:ts=2 sts=2 sw=2 et
