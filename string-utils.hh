/* Copyright © 2015-2016 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDF2TXT_STRING_UTILS_HH
#define PDF2TXT_STRING_UTILS_HH

#include <cstdarg>
#include <string>

namespace string {

    std::string lower(const std::string &s);

/* markup helpers
 * ==============
 */

    /* Escapes ``&``, ``<``, ``>`` and ``"`` for use in element content and
     * attribute values. */
    std::string escape_xml(const std::string &s);

    /* Removes C0 control characters other than TAB, LF and CR. */
    std::string strip_control(const std::string &s);

}

std::string string_vprintf(const char *message, va_list args);
#if defined(__GNUC__)
__attribute__ ((format (printf, 1, 2)))
#endif
std::string string_printf(const char *message, ...);

#endif

// vim:ts=4 sts=4 sw=4 et
