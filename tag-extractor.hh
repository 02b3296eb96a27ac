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

#ifndef PDF2TXT_TAG_EXTRACTOR_HH
#define PDF2TXT_TAG_EXTRACTOR_HH

#include <ostream>
#include <string>
#include <vector>

#include "output-device.hh"
#include "pdf-backend.hh"

namespace pdf
{

/* class pdf::TagExtractor
 * =======================
 *
 * Writes the decoded text of each page together with its marked-content
 * structure: BMC/BDC open a tag, EMC closes it, MP/DP produce an empty
 * tag.
 */

  class TagExtractor : public Device, public pdf::OutputDevice
  {
  protected:
    int page_number;
    std::vector<std::string> tag_stack;
    void open_tag(const char *name, pdf::Dict *properties, bool empty);
    void do_begin_page(const pdf::Page &page);
    void do_end_page(const pdf::Page &page);
  public:
    TagExtractor(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec);
    pdf::OutputDevice &output_device()
    {
      return *this;
    }

    bool upsideDown() { return true; }
    bool useDrawChar() { return true; }
    bool interpretType3Chars() { return false; }
    bool needNonText() { return false; }

#if POPPLER_VERSION >= 8200
    void drawChar(pdf::gfx::State *state, double x, double y, double dx, double dy, double origin_x, double origin_y,
      CharCode code, int n_bytes, const Unicode *unistr, int length);
#else
    void drawChar(pdf::gfx::State *state, double x, double y, double dx, double dy, double origin_x, double origin_y,
      CharCode code, int n_bytes, Unicode *unistr, int length);
#endif
    void beginMarkedContent(const char *name, pdf::Dict *properties);
    void endMarkedContent(pdf::gfx::State *state);
    void markPoint(const char *name);
    void markPoint(const char *name, pdf::Dict *properties);
  };

  /* ' k1="v1" k2="v2"', sorted by key */
  std::string format_tag_properties(pdf::Dict *properties);

}

#endif

// vim:ts=2 sts=2 sw=2 et
