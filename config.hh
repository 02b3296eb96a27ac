/* Copyright © 2007-2019 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2009 Mateusz Turcza
 * Copyright © 2026 The pdf2txt developers
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

#ifndef PDF2TXT_CONFIG_HH
#define PDF2TXT_CONFIG_HH

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "extraction-config.hh"
#include "i18n.hh"
#include "page-selection.hh"

class Config
{
public:
  ExtractionConfig extraction;
  std::string output;
  bool output_stdout;
  std::vector<const char*> filenames;

  Config();

  int verbose() const
  {
    return this->extraction.verbose;
  }

  class NeedVersion
  { };

  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string &message)
    : std::runtime_error(message)
    { }
    virtual bool is_quiet() const
    {
      return false;
    }
    virtual bool is_already_printed() const
    {
      return false;
    }
  };

  class NeedHelp : public Error
  {
  public:
    NeedHelp()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
  };

  class InvalidOption : public Error
  {
  public:
    InvalidOption()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
    virtual bool is_already_printed() const
    {
      return true;
    }
  };

  void read_config(int argc, char * const argv[]);
  void usage(const Error &error) const;
  void usage() const;
};

/* Parses one-based page ranges, such as "1-3,5", into zero-based
 * inclusive ranges. */
void parse_pages(const std::string &s, pdf::PageRanges &result);

#endif

// vim:ts=2 sts=2 sw=2 et
