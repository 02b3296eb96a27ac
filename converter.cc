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

#include "converter.hh"

#include <algorithm>
#include <sstream>

#include "pdf-unicode.hh"
#include "string-utils.hh"

/* Poppler text words
 * ==================
 *
 * Older Poppler versions expose the text layout through non-const
 * pointers and non-const methods, newer ones through const ones; hence
 * the templates.
 */

template <typename Word>
static std::string get_word_text(Word *word)
{
  std::ostringstream stream;
  for (int i = 0; i < word->getLength(); i++)
    pdf::write_as_utf8(stream, *word->getChar(i));
  return stream.str();
}

template <typename Word>
static std::string get_word_font(pdf::ResourceManager &resource_manager, Word *word)
{
  auto font_info = word->getFontInfo(0);
  if (font_info == nullptr)
    return resource_manager.get_font_name(std::string());
  return resource_manager.get_font_name(font_info->getFontName());
}

template <typename Line>
static void get_line_bbox(Line *line, double &x0, double &y0, double &x1, double &y1)
{
  bool first = true;
  for (auto word = line->getWords(); word != nullptr; word = word->getNext())
  {
    double wx0, wy0, wx1, wy1;
    word->getBBox(&wx0, &wy0, &wx1, &wy1);
    if (first)
    {
      x0 = wx0; y0 = wy0; x1 = wx1; y1 = wy1;
      first = false;
      continue;
    }
    x0 = std::min(x0, wx0);
    y0 = std::min(y0, wy0);
    x1 = std::max(x1, wx1);
    y1 = std::max(y1, wy1);
  }
  if (first)
    x0 = y0 = x1 = y1 = 0;
}


/* class pdf::LayoutAnalyzer
 * =========================
 */

pdf::LayoutAnalyzer::LayoutAnalyzer(pdf::ResourceManager &resource_manager, std::ostream &sink,
  const std::string &codec, const LayoutParams *layout_params, pdf::ImageWriter *image_writer,
  TextOutputFunc text_output_func, void *text_output_stream)
: Device(resource_manager, sink, codec, image_writer),
  ::TextOutputDev(
    text_output_func,
    text_output_stream,
    layout_params != nullptr && layout_params->physical_layout,
    layout_params != nullptr ? layout_params->fixed_pitch : 0.0,
    layout_params == nullptr /* raw order */,
    layout_params != nullptr && layout_params->discard_diagonal
  ),
  page_width(0),
  page_height(0)
{
  if (layout_params != nullptr)
  {
    this->layout_params.reset(new LayoutParams(*layout_params));
    this->setMinColSpacing1(layout_params->min_column_spacing);
  }
}

pdf::TextPagePtr pdf::LayoutAnalyzer::take_text_page()
{
  return TextPagePtr(this->takeText());
}

void pdf::LayoutAnalyzer::startPage(int page_number, pdf::gfx::State *state, XRef *xref)
{
  this->page_width = state->getPageWidth();
  this->page_height = state->getPageHeight();
  this->images.clear();
  this->TextOutputDev::startPage(page_number, state, xref);
}

void pdf::LayoutAnalyzer::place_image(pdf::gfx::State *state, const std::string &name, int width, int height)
{
  static const double corners[4][2] = { {0, 0}, {0, 1}, {1, 0}, {1, 1} };
  PlacedImage image;
  image.name = name;
  image.width = width;
  image.height = height;
  for (int i = 0; i < 4; i++)
  {
    double x, y;
    state->transform(corners[i][0], corners[i][1], &x, &y);
    if (i == 0)
    {
      image.x0 = image.x1 = x;
      image.y0 = image.y1 = y;
      continue;
    }
    image.x0 = std::min(image.x0, x);
    image.y0 = std::min(image.y0, y);
    image.x1 = std::max(image.x1, x);
    image.y1 = std::max(image.y1, y);
  }
  this->images.push_back(image);
}

void pdf::LayoutAnalyzer::drawImageMask(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream,
  int width, int height, bool invert, bool interpolate, bool inline_image)
{
  std::string name = this->export_mask(object, stream, width, height, invert, inline_image);
  if (name.length() > 0)
    this->place_image(state, name, width, height);
}

#if POPPLER_VERSION >= 8200
void pdf::LayoutAnalyzer::drawImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream,
  int width, int height, pdf::gfx::ImageColorMap *color_map, bool interpolate, const int *mask_colors,
  bool inline_image)
#else
void pdf::LayoutAnalyzer::drawImage(pdf::gfx::State *state, pdf::Object *object, pdf::Stream *stream,
  int width, int height, pdf::gfx::ImageColorMap *color_map, bool interpolate, int *mask_colors,
  bool inline_image)
#endif
{
  std::string name = this->export_image(object, stream, width, height, color_map, inline_image);
  if (name.length() > 0)
    this->place_image(state, name, width, height);
}


/* class pdf::TextConverter
 * ========================
 */

pdf::TextConverter::TextConverter(pdf::ResourceManager &resource_manager, std::ostream &sink,
  const std::string &codec, const LayoutParams *layout_params, pdf::ImageWriter *image_writer)
: LayoutAnalyzer(resource_manager, sink, codec, layout_params, image_writer,
    &TextConverter::output_text, this)
{ }

/* Poppler dumps the text of each page, followed by a form feed, when the
 * page ends. */
void pdf::TextConverter::output_text(void *stream, const char *text, int length)
{
  TextConverter *converter = static_cast<TextConverter*>(stream);
  converter->write(std::string(text, length));
}


/* class pdf::XmlConverter
 * =======================
 */

pdf::XmlConverter::XmlConverter(pdf::ResourceManager &resource_manager, std::ostream &sink,
  const std::string &codec, const LayoutParams *layout_params, pdf::ImageWriter *image_writer,
  bool strip_control)
: LayoutAnalyzer(resource_manager, sink, codec, layout_params, image_writer),
  strip_control(strip_control)
{
  this->write(string_printf("<?xml version=\"1.0\" encoding=\"%s\" ?>\n", codec.c_str()));
  this->write("<pages>\n");
}

std::string pdf::XmlConverter::text_element(const std::string &font, double x0, double y0, double x1, double y1,
  double size, const std::string &text)
{
  std::string content = this->strip_control ? string::strip_control(text) : text;
  return string_printf("<text font=\"%s\" bbox=\"%s\" size=\"%.3f\">%s</text>\n",
    string::escape_xml(font).c_str(),
    pdf::format_bbox(x0, y0, x1, y1).c_str(),
    size,
    string::escape_xml(content).c_str()
  );
}

template <typename Word>
std::string pdf::XmlConverter::word_elements(Word *word, bool line_end)
{
  double x0, y0, x1, y1;
  word->getBBox(&x0, &y0, &x1, &y1);
  std::string result = this->text_element(
    get_word_font(this->resource_manager, word),
    x0, this->flip_y(y1), x1, this->flip_y(y0),
    word->getFontSize(),
    get_word_text(word)
  );
  if (line_end)
    result += "<text>\n</text>\n";
  else if (word->getSpaceAfter())
    result += "<text> </text>\n";
  return result;
}

void pdf::XmlConverter::do_begin_page(const pdf::Page &page)
{
  this->write(string_printf("<page id=\"%d\" bbox=\"%s\" rotate=\"%d\">\n",
    page.get_index() + 1,
    pdf::get_page_bbox(page).c_str(),
    page.rotate
  ));
}

void pdf::XmlConverter::do_end_page(const pdf::Page &page)
{
  TextPagePtr text_page = this->take_text_page();
  std::ostringstream stream;
  if (this->has_layout())
  {
    int box_id = 0;
    for (auto flow = text_page->getFlows(); flow != nullptr; flow = flow->getNext())
    for (auto block = flow->getBlocks(); block != nullptr; block = block->getNext())
    {
      double x0, y0, x1, y1;
      block->getBBox(&x0, &y0, &x1, &y1);
      stream << string_printf("<textbox id=\"%d\" bbox=\"%s\">\n",
        box_id++,
        pdf::format_bbox(x0, this->flip_y(y1), x1, this->flip_y(y0)).c_str()
      );
      for (auto line = block->getLines(); line != nullptr; line = line->getNext())
      {
        get_line_bbox(line, x0, y0, x1, y1);
        stream << string_printf("<textline bbox=\"%s\">\n",
          pdf::format_bbox(x0, this->flip_y(y1), x1, this->flip_y(y0)).c_str()
        );
        for (auto word = line->getWords(); word != nullptr; word = word->getNext())
          stream << this->word_elements(word, word->getNext() == nullptr);
        stream << "</textline>\n";
      }
      stream << "</textbox>\n";
    }
  }
  else
  {
    ::TextWordList words(text_page.get(), false);
    for (int i = 0; i < words.getLength(); i++)
      stream << this->word_elements(words.get(i), false);
  }
  for (const PlacedImage &image : this->images)
  {
    stream
      << string_printf("<figure name=\"%s\" bbox=\"%s\">\n",
           string::escape_xml(image.name).c_str(),
           pdf::format_bbox(image.x0, this->flip_y(image.y1), image.x1, this->flip_y(image.y0)).c_str())
      << string_printf("<image src=\"%s\" width=\"%d\" height=\"%d\" />\n",
           string::escape_xml(image.name).c_str(), image.width, image.height)
      << "</figure>\n";
  }
  this->images.clear();
  stream << "</page>\n";
  this->write(stream.str());
}

void pdf::XmlConverter::do_close()
{
  this->write("</pages>\n");
}


/* class pdf::HtmlConverter
 * ========================
 */

pdf::HtmlConverter::HtmlConverter(pdf::ResourceManager &resource_manager, std::ostream &sink,
  const std::string &codec, const LayoutParams *layout_params, pdf::ImageWriter *image_writer,
  double scale, LayoutMode layout_mode)
: LayoutAnalyzer(resource_manager, sink, codec, layout_params, image_writer),
  scale(scale),
  layout_mode(layout_mode),
  y_offset(page_margin)
{
  this->write("<html><head>\n");
  this->write(string_printf(
    "<meta http-equiv=\"Content-Type\" content=\"text/html; charset=%s\">\n",
    codec.c_str()
  ));
  this->write("</head><body>\n");
}

std::string pdf::HtmlConverter::span(const std::string &font, double size, const std::string &text)
{
  return string_printf("<span style=\"font-family: %s; font-size:%dpx\">%s</span>",
    string::escape_xml(font).c_str(),
    static_cast<int>(size * this->scale),
    string::escape_xml(text).c_str()
  );
}

template <typename Word>
std::string pdf::HtmlConverter::positioned_word(Word *word)
{
  double x0, y0, x1, y1;
  word->getBBox(&x0, &y0, &x1, &y1);
  return string_printf(
    "<span style=\"position:absolute; font-family: %s; font-size:%dpx; left:%dpx; top:%dpx;\">%s</span>\n",
    string::escape_xml(get_word_font(this->resource_manager, word)).c_str(),
    static_cast<int>(word->getFontSize() * this->scale),
    static_cast<int>(x0 * this->scale),
    static_cast<int>((this->y_offset + y0) * this->scale),
    string::escape_xml(get_word_text(word)).c_str()
  );
}

template <typename Block>
std::string pdf::HtmlConverter::text_box(Block *block, bool positioned)
{
  std::ostringstream stream;
  if (positioned)
  {
    double x0, y0, x1, y1;
    block->getBBox(&x0, &y0, &x1, &y1);
    stream << string_printf(
      "<div style=\"position:absolute; writing-mode:lr-tb; left:%dpx; top:%dpx; width:%dpx; height:%dpx;\">",
      static_cast<int>(x0 * this->scale),
      static_cast<int>((this->y_offset + y0) * this->scale),
      static_cast<int>((x1 - x0) * this->scale),
      static_cast<int>((y1 - y0) * this->scale)
    );
  }
  else
    stream << "<div>";
  for (auto line = block->getLines(); line != nullptr; line = line->getNext())
  {
    for (auto word = line->getWords(); word != nullptr; word = word->getNext())
    {
      stream << this->span(get_word_font(this->resource_manager, word), word->getFontSize(), get_word_text(word));
      if (word->getSpaceAfter() && word->getNext() != nullptr)
        stream << " ";
    }
    stream << "<br>";
  }
  stream << "</div>\n";
  return stream.str();
}

void pdf::HtmlConverter::do_end_page(const pdf::Page &page)
{
  TextPagePtr text_page = this->take_text_page();
  int page_id = page.get_index() + 1;
  std::ostringstream stream;
  int top = static_cast<int>(this->y_offset * this->scale);
  stream
    << string_printf("<div style=\"position:absolute; top:%dpx;\"><a name=\"%d\">Page %d</a></div>\n",
         top, page_id, page_id)
    << string_printf(
         "<span style=\"position:absolute; border: gray 1px solid; left:0px; top:%dpx; width:%dpx; height:%dpx;\"></span>\n",
         top,
         static_cast<int>(this->page_width * this->scale),
         static_cast<int>(this->page_height * this->scale));
  if (!this->has_layout())
  {
    ::TextWordList words(text_page.get(), false);
    for (int i = 0; i < words.getLength(); i++)
      stream << this->positioned_word(words.get(i));
  }
  else
  {
    for (auto flow = text_page->getFlows(); flow != nullptr; flow = flow->getNext())
    for (auto block = flow->getBlocks(); block != nullptr; block = block->getNext())
    {
      switch (this->layout_mode)
      {
      case LayoutMode::exact:
        for (auto line = block->getLines(); line != nullptr; line = line->getNext())
        for (auto word = line->getWords(); word != nullptr; word = word->getNext())
          stream << this->positioned_word(word);
        break;
      case LayoutMode::loose:
        stream << this->text_box(block, false);
        break;
      case LayoutMode::normal:
        stream << this->text_box(block, true);
        break;
      }
    }
  }
  for (const PlacedImage &image : this->images)
  {
    stream << string_printf(
      "<img src=\"%s\" border=\"1\" style=\"position:absolute; left:%dpx; top:%dpx;\" width=\"%d\" height=\"%d\" />\n",
      string::escape_xml(this->image_writer->get_path(image.name)).c_str(),
      static_cast<int>(image.x0 * this->scale),
      static_cast<int>((this->y_offset + image.y0) * this->scale),
      static_cast<int>((image.x1 - image.x0) * this->scale),
      static_cast<int>((image.y1 - image.y0) * this->scale)
    );
  }
  this->images.clear();
  this->write(stream.str());
  this->y_offset += this->page_height + page_margin;
  this->page_ids.push_back(page_id);
}

void pdf::HtmlConverter::do_close()
{
  std::ostringstream stream;
  stream << "<div style=\"position:absolute; top:0px;\">Page: ";
  for (size_t i = 0; i < this->page_ids.size(); i++)
  {
    if (i > 0)
      stream << ", ";
    stream << string_printf("<a href=\"#%d\">%d</a>", this->page_ids[i], this->page_ids[i]);
  }
  stream << "</div>\n";
  stream << "</body></html>\n";
  this->write(stream.str());
}

// vim:ts=2 sts=2 sw=2 et
