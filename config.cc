/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
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

#include "config.hh"

#include <climits>
#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <getopt.h>

#include "autoconf.hh"
#include "debug.hh"
#include "i18n.hh"
#include "string-utils.hh"
#include "system.hh"

Config::Config()
{
  this->output_stdout = true;
}

namespace string
{
  template <typename tp>
  tp as(const std::string &);
}

static void bad_pages()
{
  throw Config::Error(_("Unable to parse page numbers"));
}

void parse_pages(const std::string &s, pdf::PageRanges &result)
{
  int state = 0;
  int value[2] = { 0, 0 };
  for (char c : s)
  {
    if ('0' <= c && c <= '9')
    {
      if (value[state] > (INT_MAX - 9) / 10)
        bad_pages();
      value[state] = value[state] * 10 + static_cast<int>(c - '0');
      if (state == 0)
        value[1] = value[0];
    }
    else if (state == 0 && c == '-')
    {
      state = 1;
      value[1] = 0;
    }
    else if (c == ',')
    {
      if (value[0] < 1 || value[1] < 1 || value[0] > value[1])
        bad_pages();
      result.push_back({value[0] - 1, value[1] - 1});
      value[0] = value[1] = 0;
      state = 0;
    }
    else
      bad_pages();
  }
  if (state == 0)
    value[1] = value[0];
  if (value[0] < 1 || value[1] < 1 || value[0] > value[1])
    bad_pages();
  result.push_back({value[0] - 1, value[1] - 1});
}

template <typename tp>
tp string::as(const std::string &s)
{
  tp n;
  std::istringstream stream(s);
  stream >> n;
  if (stream.fail() || !stream.eof())
    throw Config::Error(string_printf(
      _("\"%s\" is not a valid number"),
      s.c_str())
    );
  return n;
}

void Config::read_config(int argc, char * const argv[])
{
  enum
  {
    OPT_CODEC = 'c',
    OPT_DISABLE_CACHING = 'C',
    OPT_DEBUG = 'd',
    OPT_HELP = 'h',
    OPT_MAX_PAGES = 'm',
    OPT_NO_LAYOUT = 'n',
    OPT_OUTPUT = 'o',
    OPT_OUTPUT_DIR = 'O',
    OPT_PAGES = 'p',
    OPT_PASSWORD = 'P',
    OPT_QUIET = 'q',
    OPT_ROTATION = 'R',
    OPT_SCALE = 's',
    OPT_STRIP_CONTROL = 'S',
    OPT_OUTPUT_TYPE = 't',
    OPT_VERBOSE = 'v',
    OPT_LAYOUT_MODE = 'Y',
    OPT_DUMMY = CHAR_MAX,
    OPT_COLUMN_SPACING,
    OPT_FIXED_PITCH,
    OPT_NO_DIAGONAL,
    OPT_PHYSICAL_LAYOUT,
    OPT_VERSION,
  };
  static struct option options [] =
  {
    { "codec", 1, nullptr, OPT_CODEC },
    { "column-spacing", 1, nullptr, OPT_COLUMN_SPACING },
    { "debug", 0, nullptr, OPT_DEBUG },
    { "disable-caching", 0, nullptr, OPT_DISABLE_CACHING },
    { "fixed-pitch", 1, nullptr, OPT_FIXED_PITCH },
    { "help", 0, nullptr, OPT_HELP },
    { "layout-mode", 1, nullptr, OPT_LAYOUT_MODE },
    { "max-pages", 1, nullptr, OPT_MAX_PAGES },
    { "maxpages", 1, nullptr, OPT_MAX_PAGES },
    { "no-diagonal", 0, nullptr, OPT_NO_DIAGONAL },
    { "no-layout", 0, nullptr, OPT_NO_LAYOUT },
    { "output", 1, nullptr, OPT_OUTPUT },
    { "output-dir", 1, nullptr, OPT_OUTPUT_DIR },
    { "output-type", 1, nullptr, OPT_OUTPUT_TYPE },
    { "pages", 1, nullptr, OPT_PAGES },
    { "password", 1, nullptr, OPT_PASSWORD },
    { "physical-layout", 0, nullptr, OPT_PHYSICAL_LAYOUT },
    { "quiet", 0, nullptr, OPT_QUIET },
    { "rotation", 1, nullptr, OPT_ROTATION },
    { "scale", 1, nullptr, OPT_SCALE },
    { "strip-control", 0, nullptr, OPT_STRIP_CONTROL },
    { "verbose", 0, nullptr, OPT_VERBOSE },
    { "version", 0, nullptr, OPT_VERSION },
    { nullptr, 0, nullptr, '\0' }
  };
  bool no_layout = false;
  LayoutParams layout_params;
  optind = 0;
  while (true)
  {
    int c = getopt_long(argc, argv, "c:Cdhm:no:O:p:P:qR:s:St:vY:", options, nullptr);
    if (c < 0)
      break;
    if (c == 0)
      throw Config::Error(_("Unable to parse command-line options"));
    try
    {
      switch (c)
      {
      case OPT_CODEC:
        this->extraction.codec = optarg;
        break;
      case OPT_COLUMN_SPACING:
        layout_params.min_column_spacing = string::as<double>(optarg);
        break;
      case OPT_DEBUG:
        this->extraction.verbose = log_level::trace;
        break;
      case OPT_DISABLE_CACHING:
        this->extraction.disable_caching = true;
        break;
      case OPT_FIXED_PITCH:
        layout_params.fixed_pitch = string::as<double>(optarg);
        break;
      case OPT_LAYOUT_MODE:
        this->extraction.layout_mode = parse_layout_mode(optarg);
        break;
      case OPT_MAX_PAGES:
        this->extraction.max_pages = string::as<int>(optarg);
        break;
      case OPT_NO_DIAGONAL:
        layout_params.discard_diagonal = true;
        break;
      case OPT_NO_LAYOUT:
        no_layout = true;
        break;
      case OPT_OUTPUT:
        this->output = optarg;
        if (this->output == "-")
        {
          this->output.clear();
          this->output_stdout = true;
        }
        else
          this->output_stdout = false;
        break;
      case OPT_OUTPUT_DIR:
        this->extraction.output_dir = optarg;
        break;
      case OPT_OUTPUT_TYPE:
        this->extraction.output_type = parse_output_type(optarg);
        break;
      case OPT_PAGES:
        parse_pages(optarg, this->extraction.page_ranges);
        break;
      case OPT_PASSWORD:
        this->extraction.password = optarg;
        break;
      case OPT_PHYSICAL_LAYOUT:
        layout_params.physical_layout = true;
        break;
      case OPT_QUIET:
        this->extraction.verbose = log_level::quiet;
        break;
      case OPT_ROTATION:
        this->extraction.rotation = string::as<int>(optarg);
        break;
      case OPT_SCALE:
        this->extraction.scale = string::as<double>(optarg);
        break;
      case OPT_STRIP_CONTROL:
        this->extraction.strip_control = true;
        break;
      case OPT_VERBOSE:
        this->extraction.verbose++;
        break;
      case OPT_HELP:
        throw NeedHelp();
      case OPT_VERSION:
        throw NeedVersion();
      case '?':
      case ':':
        throw InvalidOption();
      default:
        throw std::logic_error(_("Unknown option"));
      }
    }
    catch (const ExtractionConfig::Error &ex)
    {
      throw Config::Error(ex.what());
    }
  }
  if (no_layout)
    this->extraction.layout_params.reset();
  else
    this->extraction.layout_params.reset(new LayoutParams(layout_params));
  try
  {
    this->extraction.validate();
  }
  catch (const ExtractionConfig::Error &ex)
  {
    throw Config::Error(ex.what());
  }
  if (optind > argc - 1)
    throw Config::Error(_("No input file name was specified"));
  else
    while (optind < argc)
    {
      this->filenames.push_back(argv[optind]);
      if (!this->output_stdout && is_same_file(this->output, argv[optind]))
        throw Config::Error(string_printf(
          _("Input file is the same as output file: %s"),
          this->output.c_str()
        ));
      optind++;
    }
}

template <typename streamtp>
static void print_usage(streamtp &stream)
{
  stream
    << _("Usage: ") << std::endl
    << _("   pdf2txt [-o <output-file>] [options] <pdf-file>...") << std::endl
    << std::endl << _("Options: ")
    << std::endl << _(" -o, --output=FILE")
    << std::endl <<   " -t, --output-type=text|xml|html|tag"
    << std::endl << _(" -c, --codec=CODEC")
    << std::endl <<   " -p, --pages=..."
    << std::endl <<   " -m, --max-pages=N"
    << std::endl << _(" -P, --password=PASSWORD")
    << std::endl <<   " -R, --rotation=DEGREES"
    << std::endl <<   " -s, --scale=X"
    << std::endl <<   " -Y, --layout-mode=normal|exact|loose"
    << std::endl << _(" -O, --output-dir=DIRECTORY")
    << std::endl <<   " -S, --strip-control"
    << std::endl <<   " -C, --disable-caching"
    << std::endl <<   " -n, --no-layout"
    << std::endl <<   "     --physical-layout"
    << std::endl <<   "     --fixed-pitch=X"
    << std::endl <<   "     --column-spacing=X"
    << std::endl <<   "     --no-diagonal"
    << std::endl <<   " -d, --debug"
    << std::endl <<   " -v, --verbose"
    << std::endl <<   " -q, --quiet"
    << std::endl <<   " -h, --help"
    << std::endl <<   "     --version"
    << std::endl;
}

void Config::usage(const Config::Error &error) const
{
  DebugStream &log = debug(0, this->verbose());
  if (error.is_already_printed())
    log << std::endl;
  if (!error.is_quiet())
    log << error << std::endl << std::endl;
  print_usage(log);
}

void Config::usage() const
{
  print_usage(std::cout);
}

// vim:ts=2 sts=2 sw=2 et
