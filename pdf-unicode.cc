/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
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

#include "pdf-unicode.hh"

#include <cstddef>
#include <sstream>

#include "autoconf.hh"

#include <CharTypes.h>
#include <PDFDocEncoding.h>
#include <UnicodeMapFuncs.h>

/* Unicode → UTF-8 conversion
 * ==========================
 */

void pdf::write_as_utf8(std::ostream &stream, Unicode unicode_char)
{
    char buffer[8];
    int seqlen = mapUTF8(unicode_char, buffer, sizeof buffer);
    stream.write(buffer, seqlen);
}

/* Decodes UTF-16-BE text following the byte order mark. Unpaired
 * surrogates and a lone trailing byte become U+FFFD. */
static void write_utf16be_as_utf8(std::ostream &stream, const char *cstring, size_t clength)
{
    const static Unicode replacement_character = 0xFFFD;
    Unicode high_surrogate = 0;
    for (size_t i = 0; i < clength; i += 2) {
        if (i + 1 >= clength) {
            pdf::write_as_utf8(stream, replacement_character);
            break;
        }
        Unicode code = ((cstring[i] & 0xFF) << 8) | (cstring[i + 1] & 0xFF);
        if (high_surrogate) {
            if (code >= 0xDC00 && code < 0xE000)
                pdf::write_as_utf8(stream, 0x10000 + ((high_surrogate & 0x3FF) << 10) + (code & 0x3FF));
            else {
                pdf::write_as_utf8(stream, replacement_character);
                if (code >= 0xD800 && code < 0xDC00) {
                    high_surrogate = code;
                    continue;
                }
                pdf::write_as_utf8(stream, code);
            }
            high_surrogate = 0;
        } else if (code >= 0xD800 && code < 0xDC00)
            high_surrogate = code;
        else if (code >= 0xDC00 && code < 0xE000)
            pdf::write_as_utf8(stream, replacement_character);
        else
            pdf::write_as_utf8(stream, code);
    }
    if (high_surrogate)
        pdf::write_as_utf8(stream, replacement_character);
}

/* Text strings are either UTF-16-BE with a byte order mark or
 * PDFDocEncoding. */
std::string pdf::string_as_utf8(const pdf::String *string)
{
    const char *cstring = pdf::get_c_string(string);
    size_t clength = string->getLength();
    std::ostringstream stream;
    if (clength >= 2 && (cstring[0] & 0xFF) == 0xFE && (cstring[1] & 0xFF) == 0xFF)
        write_utf16be_as_utf8(stream, cstring + 2, clength - 2);
    else {
        for (size_t i = 0; i < clength; i++)
            write_as_utf8(stream, pdfDocEncoding[cstring[i] & 0xFF]);
    }
    return stream.str();
}

std::string pdf::string_as_utf8(const pdf::Object &object)
{
    return pdf::string_as_utf8(object.getString());
}

void pdf::write_as_utf8(std::ostream &stream, const Unicode *unicode_string, int length)
{
    for (int i = 0; i < length; i++)
        write_as_utf8(stream, unicode_string[i]);
}

std::string pdf::string_as_utf8(const Unicode *unicode_string, int length)
{
    std::ostringstream stream;
    write_as_utf8(stream, unicode_string, length);
    return stream.str();
}

// vim:ts=4 sts=4 sw=4 et
