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

#include "string-utils.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdio>
#include <vector>

#include "system.hh"

static char lower_char(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string string::lower(const std::string &s)
{
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), lower_char);
    return result;
}

std::string string::escape_xml(const std::string &s)
{
    std::string result;
    result.reserve(s.length());
    for (char c : s)
        switch (c) {
        case '&':
            result += "&amp;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        case '"':
            result += "&quot;";
            break;
        default:
            result += c;
        }
    return result;
}

std::string string::strip_control(const std::string &s)
{
    std::string result;
    result.reserve(s.length());
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 && c != '\t' && c != '\n' && c != '\r')
            continue;
        result += c;
    }
    return result;
}

std::string string_vprintf(const char *message, va_list args)
{
    va_list args_copy;
    va_copy(args_copy, args);
    int length = vsnprintf(nullptr, 0, message, args_copy);
    va_end(args_copy);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    if (length == INT_MAX) {
        errno = ENOMEM;
        throw_posix_error("vsnprintf()");
    }
    std::vector<char> buffer(length + 1);
    length = vsnprintf(buffer.data(), buffer.size(), message, args);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    return buffer.data();
}

std::string string_printf(const char *message, ...)
{
    va_list args;
    va_start(args, message);
    std::string result = string_vprintf(message, args);
    va_end(args);
    return result;
}

// vim:ts=4 sts=4 sw=4 et
