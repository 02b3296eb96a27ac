/* Copyright © 2007-2019 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDF2TXT_PDF_UNICODE_HH
#define PDF2TXT_PDF_UNICODE_HH

#include <ostream>
#include <string>

#include <CharTypes.h>

#include "pdf-backend.hh"

namespace pdf
{

/* Unicode → UTF-8 conversion
 * ==========================
 */

    void write_as_utf8(std::ostream &stream, Unicode unicode_char);
    void write_as_utf8(std::ostream &stream, const Unicode *unicode_string, int length);

    std::string string_as_utf8(const pdf::String *);
    std::string string_as_utf8(const pdf::Object &);
    std::string string_as_utf8(const Unicode *unicode_string, int length);

}

#endif

// vim:ts=4 sts=4 sw=4 et
