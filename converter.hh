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

#ifndef PDF2TXT_CONVERTER_HH
#define PDF2TXT_CONVERTER_HH

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <TextOutputDev.h>

#include "extraction-config.hh"
#include "output-device.hh"
#include "pdf-backend.hh"

namespace pdf
{

  struct TextPageRelease
  {
    void operator()(::TextPage *text_page) const
    {
      text_page->decRefCnt();
    }
  };

  typedef std::unique_ptr<::TextPage, TextPageRelease> TextPagePtr;


/* class pdf::LayoutAnalyzer
 * =========================
 *
 * Common base of the devices that go through Poppler's layout analysis.
 * Without layout parameters, text is kept in content-stream order.
 */

  class LayoutAnalyzer : public Device, public ::TextOutputDev
  {
  protected:
    struct PlacedImage
    {
      std::string name;
      int width, height;
      /* device space, origin in the top-left corner */
      double x0, y0, x1, y1;
    };
    std::unique_ptr<LayoutParams> layout_params;
    double page_width, page_height;
    std::vector<PlacedImage> images;
    TextPagePtr take_text_page();
    void place_image(pdf::gfx::State *state, const std::string &name, int width, int height);
    /* page space, origin in the bottom-left corner */
    double flip_y(double y) const
    {
      return this->page_height - y;
    }
  public:
    LayoutAnalyzer(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
      const LayoutParams *layout_params, pdf::ImageWriter *image_writer,
      TextOutputFunc text_output_func = nullptr, void *text_output_stream = nullptr);
    bool has_layout() const
    {
      return static_cast<bool>(this->layout_params);
    }
    pdf::OutputDevice &output_device()
    {
      return *this;
    }

    void startPage(int page_number, pdf::gfx::State *state, XRef *xref);
    bool needNonText()
    {
      return this->image_writer != nullptr;
    }
    void drawImageMask(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      bool invert, bool interpolate, bool inline_image);
#if POPPLER_VERSION >= 8200
    void drawImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool interpolate, const int *mask_colors, bool inline_image);
#else
    void drawImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool interpolate, int *mask_colors, bool inline_image);
#endif
  };


/* class pdf::TextConverter
 * ========================
 */

  class TextConverter : public LayoutAnalyzer
  {
  protected:
    static void output_text(void *stream, const char *text, int length);
  public:
    TextConverter(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
      const LayoutParams *layout_params, pdf::ImageWriter *image_writer = nullptr);
  };


/* class pdf::XmlConverter
 * =======================
 */

  class XmlConverter : public LayoutAnalyzer
  {
  protected:
    bool strip_control;
    std::string text_element(const std::string &font, double x0, double y0, double x1, double y1,
      double size, const std::string &text);
    template <typename Word>
    std::string word_elements(Word *word, bool line_end);
    void do_begin_page(const pdf::Page &page);
    void do_end_page(const pdf::Page &page);
    void do_close();
  public:
    XmlConverter(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
      const LayoutParams *layout_params, pdf::ImageWriter *image_writer = nullptr, bool strip_control = false);
  };


/* class pdf::HtmlConverter
 * ========================
 */

  class HtmlConverter : public LayoutAnalyzer
  {
  protected:
    double scale;
    LayoutMode layout_mode;
    double y_offset;
    std::vector<int> page_ids;
    std::string span(const std::string &font, double size, const std::string &text);
    template <typename Word>
    std::string positioned_word(Word *word);
    template <typename Block>
    std::string text_box(Block *block, bool positioned);
    void do_end_page(const pdf::Page &page);
    void do_close();
  public:
    static const int page_margin = 50;
    HtmlConverter(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
      const LayoutParams *layout_params, pdf::ImageWriter *image_writer = nullptr,
      double scale = 1.0, LayoutMode layout_mode = LayoutMode::normal);
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
