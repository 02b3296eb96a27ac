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

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "config.hh"
#include "debug.hh"
#include "document-source.hh"
#include "extractor.hh"
#include "i18n.hh"
#include "pdf-backend.hh"
#include "string-utils.hh"
#include "system.hh"
#include "version.hh"

static Config config;

static inline DebugStream &debug(int n)
{
  return debug(n, config.verbose());
}

static int xmain(int argc, char * const argv[])
{
  std::ios_base::sync_with_stdio(false);

  try
  {
    config.read_config(argc, argv);
  }
  catch (const Config::NeedVersion &)
  {
    std::cout << get_multiline_version();
    exit(0);
  }
  catch (const Config::NeedHelp &)
  {
    config.usage();
    exit(0);
  }
  catch (const Config::Error &ex)
  {
    config.usage(ex);
    exit(1);
  }

  debug(log_level::trace) << get_version() << std::endl;

  pdf::Environment environment;
  pdf::PopplerDocumentSource source(environment);
  Extractor extractor(source);

  std::unique_ptr<File> output_file;
  std::ostream *output = &std::cout;
  if (!config.output_stdout)
  {
    output_file.reset(new File(config.output));
    output = output_file.get();
  }
  for (const char *filename : config.filenames)
  {
    debug(log_level::progress) << string_printf(_("processing %s"), filename) << std::endl;
    DebugStream::Indent indent(debug(log_level::progress));
    ExistingFile input(filename);
    extractor.extract_to_stream(input, *output, config.extraction);
  }
  if (output_file)
    output_file->close();
  else
    std::cout.flush();
  return 0;
}

int main(int argc, char * const argv[])
try
{
  i18n::setup();
  return xmain(argc, argv);
}
catch (const std::ios_base::failure &ex)
{
  error_log << string_printf(_("Input/output error (%s)"), ex.what()) << std::endl;
  exit(2);
}
catch (const OSError &ex)
{
  error_log << string_printf(_("Input/output error (%s)"), ex.what()) << std::endl;
  exit(2);
}
catch (const std::runtime_error &ex)
{
  error_log << ex << std::endl;
  exit(1);
}

// vim:ts=2 sts=2 sw=2 et
