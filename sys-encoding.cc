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

#include "system.hh"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <ostream>
#include <sstream>
#include <string>

#include <errno.h>
#include <iconv.h>

#include "i18n.hh"
#include "string-utils.hh"

namespace encoding {

template <>
std::ostream &operator <<(std::ostream &stream, const proxy<native, terminal> &converter)
{
    stream << converter.string;
    return stream;
}

/* POSIX requires that “inbuf” type must be “char **”, but some systems use
 * “const char **”. This adapter converts to whichever type is needed.
 */
template <typename ConstT, typename T>
class const_adapter
{
protected:
    ConstT x;
public:
    explicit const_adapter(ConstT x)
    : x(x)
    { }
    operator T () const
    {
        return const_cast<T>(x);
    }
    operator ConstT () const
    {
        return x;
    }
};

class IConv
{
protected:
    iconv_t cd;
public:
    explicit IConv(const char *tocode, const char *fromcode="UTF-8")
    {
        this->cd = iconv_open(tocode, fromcode);
        if (this->cd == reinterpret_cast<iconv_t>(-1))
            throw_posix_error(string_printf("iconv_open(\"%s\")", tocode));
    }
    ~IConv()
    {
        iconv_close(this->cd);
    }
    size_t operator()(const char **inbuf, size_t *inbytesleft, char **outbuf, size_t *outbytesleft)
    {
        typedef const_adapter<const char **, char **> const_adapter;
        return iconv(this->cd, const_adapter(inbuf), inbytesleft, outbuf, outbytesleft);
    }
    void reset()
    {
        iconv(this->cd, nullptr, nullptr, nullptr, nullptr);
    }
};

static size_t utf8_sequence_length(unsigned char c)
{
    if (c < 0x80)
        return 1;
    if ((c & 0xE0) == 0xC0)
        return 2;
    if ((c & 0xF0) == 0xE0)
        return 3;
    if ((c & 0xF8) == 0xF0)
        return 4;
    return 1;
}

bool Codec::is_utf8_name(const std::string &name)
{
    std::string lname = string::lower(name);
    return lname == "utf-8" || lname == "utf8";
}

Codec::Codec(const std::string &name)
: name(name), iconv(nullptr)
{
    if (name.empty())
        throw std::invalid_argument(_("Empty codec name"));
    if (!is_utf8_name(name))
        this->iconv = new IConv(name.c_str());
}

Codec::~Codec()
{
    delete this->iconv;
}

void Codec::write(std::ostream &stream, const std::string &utf8_string) const
{
    if (this->iconv == nullptr) {
        stream << utf8_string;
        return;
    }
    char outbuf[BUFSIZ];
    char *outbuf_ptr = outbuf;
    size_t outbuf_len = sizeof outbuf;
    const char *inbuf = utf8_string.c_str();
    size_t inbuf_len = utf8_string.length();
    while (inbuf_len > 0) {
        size_t n = (*this->iconv)(&inbuf, &inbuf_len, &outbuf_ptr, &outbuf_len);
        if (n != static_cast<size_t>(-1))
            continue;
        if (errno == E2BIG) {
            stream.write(outbuf, outbuf_ptr - outbuf);
            outbuf_ptr = outbuf;
            outbuf_len = sizeof outbuf;
        } else if (errno == EILSEQ || errno == EINVAL) {
            /* unrepresentable or truncated character: drop it */
            size_t skip = std::min(utf8_sequence_length(*inbuf), inbuf_len);
            inbuf += skip;
            inbuf_len -= skip;
        } else
            throw Error();
    }
    stream.write(outbuf, outbuf_ptr - outbuf);
    this->iconv->reset();
}

std::string Codec::encode(const std::string &utf8_string) const
{
    std::ostringstream stream;
    this->write(stream, utf8_string);
    return stream.str();
}

}

// vim:ts=4 sts=4 sw=4 et
