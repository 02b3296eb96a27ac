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

#include "tag-extractor.hh"

#include <map>
#include <sstream>

#include "pdf-unicode.hh"
#include "string-utils.hh"

static bool format_value(const pdf::Object &object, std::string &result)
{
  if (object.isName())
    result = object.getName();
  else if (object.isString())
    result = pdf::string_as_utf8(object);
  else if (object.isInt())
    result = string_printf("%d", object.getInt());
  else if (object.isReal())
    result = string_printf("%g", object.getReal());
  else if (object.isBool())
    result = object.getBool() ? "true" : "false";
  else
    return false;
  return true;
}

std::string pdf::format_tag_properties(pdf::Dict *properties)
{
  if (properties == nullptr)
    return "";
  std::map<std::string, std::string> items;
  for (int i = 0; i < properties->getLength(); i++)
  {
    std::string value;
    pdf::Object object = properties->getVal(i);
    if (format_value(object, value))
      items[properties->getKey(i)] = value;
  }
  std::ostringstream stream;
  for (const auto &item : items)
    stream << " " << string::escape_xml(item.first) << "=\"" << string::escape_xml(item.second) << "\"";
  return stream.str();
}

pdf::TagExtractor::TagExtractor(pdf::ResourceManager &resource_manager, std::ostream &sink,
  const std::string &codec)
: Device(resource_manager, sink, codec),
  page_number(0)
{ }

void pdf::TagExtractor::do_begin_page(const pdf::Page &page)
{
  this->write(string_printf("<page id=\"%d\" bbox=\"%s\" rotate=\"%d\">",
    this->page_number,
    pdf::get_page_bbox(page).c_str(),
    page.rotate
  ));
}

void pdf::TagExtractor::do_end_page(const pdf::Page &page)
{
  /* tags left open by the page content */
  while (!this->tag_stack.empty())
  {
    this->write("</" + this->tag_stack.back() + ">");
    this->tag_stack.pop_back();
  }
  this->write("</page>\n");
  this->page_number++;
}

#if POPPLER_VERSION >= 8200
void pdf::TagExtractor::drawChar(pdf::gfx::State *state, double x, double y, double dx, double dy,
  double origin_x, double origin_y, CharCode code, int n_bytes, const Unicode *unistr, int length)
#else
void pdf::TagExtractor::drawChar(pdf::gfx::State *state, double x, double y, double dx, double dy,
  double origin_x, double origin_y, CharCode code, int n_bytes, Unicode *unistr, int length)
#endif
{
  if (unistr == nullptr || length <= 0)
    return;
  this->write(string::escape_xml(pdf::string_as_utf8(unistr, length)));
}

void pdf::TagExtractor::open_tag(const char *name, pdf::Dict *properties, bool empty)
{
  std::string tag = string::escape_xml(name);
  this->write("<" + tag + pdf::format_tag_properties(properties) + (empty ? "/>" : ">"));
  if (!empty)
    this->tag_stack.push_back(tag);
}

void pdf::TagExtractor::beginMarkedContent(const char *name, pdf::Dict *properties)
{
  this->open_tag(name, properties, false);
}

void pdf::TagExtractor::endMarkedContent(pdf::gfx::State *state)
{
  if (this->tag_stack.empty())
    return;
  this->write("</" + this->tag_stack.back() + ">");
  this->tag_stack.pop_back();
}

void pdf::TagExtractor::markPoint(const char *name)
{
  this->open_tag(name, nullptr, true);
}

void pdf::TagExtractor::markPoint(const char *name, pdf::Dict *properties)
{
  this->open_tag(name, properties, true);
}

// vim:ts=2 sts=2 sw=2 et
