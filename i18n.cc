/* Copyright © 2009-2015 Jakub Wilk <jwilk@jwilk.net>
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

#include "i18n.hh"

#include <clocale>

#include "paths.hh"

#if ENABLE_NLS

void i18n::setup_locale()
{
  std::setlocale(LC_ALL, "");
  /* Deliberately ignore errors. */
  /* Poppler formats coordinates with printf(); keep the C decimal point. */
  std::setlocale(LC_NUMERIC, "C");
}

void i18n::setup()
{
  i18n::setup_locale();
  bindtextdomain(PACKAGE_NAME, paths::localedir);
  /* Deliberately ignore errors. */
  textdomain(PACKAGE_NAME);
  /* Deliberately ignore errors. */
}

#else

void i18n::setup_locale()
{
  std::setlocale(LC_CTYPE, "");
  /* Deliberately ignore errors. */
}

void i18n::setup()
{
  i18n::setup_locale();
}

#endif

// vim:ts=2 sts=2 sw=2 et
