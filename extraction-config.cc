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

#include "extraction-config.hh"

#include "i18n.hh"
#include "string-utils.hh"
#include "system.hh"

ExtractionConfig::ExtractionConfig()
: output_type(OutputType::text),
  codec("utf-8"),
  max_pages(0),
  rotation(0),
  scale(1.0),
  layout_mode(LayoutMode::normal),
  strip_control(false),
  disable_caching(false),
  verbose(1)
{
  this->layout_params.reset(new LayoutParams);
}

ExtractionConfig::ExtractionConfig(const ExtractionConfig &other)
{
  *this = other;
}

ExtractionConfig& ExtractionConfig::operator=(const ExtractionConfig &other)
{
  if (this == &other)
    return *this;
  this->output_type = other.output_type;
  this->codec = other.codec;
  if (other.layout_params)
    this->layout_params.reset(new LayoutParams(*other.layout_params));
  else
    this->layout_params.reset();
  this->page_numbers = other.page_numbers;
  this->page_ranges = other.page_ranges;
  this->max_pages = other.max_pages;
  this->password = other.password;
  this->rotation = other.rotation;
  this->scale = other.scale;
  this->layout_mode = other.layout_mode;
  this->strip_control = other.strip_control;
  this->output_dir = other.output_dir;
  this->disable_caching = other.disable_caching;
  this->verbose = other.verbose;
  return *this;
}

void ExtractionConfig::validate() const
{
  switch (this->output_type)
  {
  case OutputType::text:
  case OutputType::xml:
  case OutputType::html:
  case OutputType::tag:
    break;
  default:
    throw Error(string_printf(
      _("Invalid output type: %d"),
      static_cast<int>(this->output_type)
    ));
  }
  switch (this->layout_mode)
  {
  case LayoutMode::normal:
  case LayoutMode::exact:
  case LayoutMode::loose:
    break;
  default:
    throw Error(string_printf(
      _("Invalid layout mode: %d"),
      static_cast<int>(this->layout_mode)
    ));
  }
  if (this->max_pages < 0)
    throw Error(_("The maximum number of pages cannot be negative"));
  if (!(this->scale > 0))
    throw Error(_("The scale must be a positive number"));
  for (int n : this->page_numbers)
    if (n < 0)
      throw Error(string_printf(_("Invalid page number: %d"), n));
  for (const std::pair<int, int> &range : this->page_ranges)
    if (range.first < 0 || range.first > range.second)
      throw Error(string_printf(_("Invalid page range: %d-%d"), range.first, range.second));
  if (this->layout_params)
  {
    if (this->layout_params->fixed_pitch < 0)
      throw Error(_("The fixed pitch cannot be negative"));
    if (this->layout_params->min_column_spacing < 0)
      throw Error(_("The minimum column spacing cannot be negative"));
  }
  try
  {
    encoding::Codec codec(this->codec);
  }
  catch (const std::invalid_argument &)
  {
    throw Error(_("The codec name cannot be empty"));
  }
  catch (const POSIXError &)
  {
    throw Error(string_printf(_("Unknown codec: %s"), this->codec.c_str()));
  }
}

OutputType parse_output_type(const std::string &s)
{
  std::string name = string::lower(s);
  if (name == "text")
    return OutputType::text;
  else if (name == "xml")
    return OutputType::xml;
  else if (name == "html")
    return OutputType::html;
  else if (name == "tag")
    return OutputType::tag;
  throw ExtractionConfig::Error(string_printf(
    _("Invalid output type: %s"),
    s.c_str()
  ));
}

LayoutMode parse_layout_mode(const std::string &s)
{
  std::string name = string::lower(s);
  if (name == "normal")
    return LayoutMode::normal;
  else if (name == "exact")
    return LayoutMode::exact;
  else if (name == "loose")
    return LayoutMode::loose;
  throw ExtractionConfig::Error(string_printf(
    _("Invalid layout mode: %s"),
    s.c_str()
  ));
}

const char * get_output_type_name(OutputType output_type)
{
  switch (output_type)
  {
  case OutputType::text:
    return "text";
  case OutputType::xml:
    return "xml";
  case OutputType::html:
    return "html";
  case OutputType::tag:
    return "tag";
  }
  return "?";
}

const char * get_layout_mode_name(LayoutMode layout_mode)
{
  switch (layout_mode)
  {
  case LayoutMode::normal:
    return "normal";
  case LayoutMode::exact:
    return "exact";
  case LayoutMode::loose:
    return "loose";
  }
  return "?";
}

// vim:ts=2 sts=2 sw=2 et
