/* Copyright © 2007-2015 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDF2TXT_DEBUG_HH
#define PDF2TXT_DEBUG_HH

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "system.hh"

/* Verbosity thresholds for debug(n, threshold):
 * 0 = errors only, 1 = warnings, 2 = per-page progress, 3 = every step.
 */
namespace log_level
{
  static const int quiet = 0;
  static const int normal = 1;
  static const int progress = 2;
  static const int trace = 3;
}

class DebugStream;

template <typename tp>
static inline DebugStream &operator<<(DebugStream &, const tp &);

class DebugStream
{
protected:
  unsigned int level;
  bool started;
  std::ostream &ostream;
  void indent();
public:
  explicit DebugStream(std::ostream &ostream)
  : level(0), started(false), ostream(ostream)
  { }
  void operator ++(int) { this->level++; }
  void operator --(int) { this->level--; }
  template <typename tp>
    friend DebugStream &operator<<(DebugStream &, const tp &);
  friend DebugStream &operator<<(DebugStream &stream, std::ostream& (*)(std::ostream&));

  class Indent
  {
  private:
    Indent(const Indent &) = delete;
    Indent& operator=(const Indent &) = delete;
  protected:
    DebugStream &stream;
  public:
    explicit Indent(DebugStream &stream);
    ~Indent();
  };
};

DebugStream &debug(int n, int threshold);
void warning(const std::string &message, int threshold);
extern DebugStream error_log;

extern std::ostream &dev_null;

static inline std::ostream &operator<<(std::ostream &stream, const std::runtime_error &error)
{
  stream << error.what();
  return stream;
}

template <typename tp>
static inline DebugStream &operator<<(DebugStream &stream, const tp &object)
{
  if (!stream.started)
  {
    stream.indent();
    stream.started = true;
  }
  std::ostringstream buffer;
  buffer.copyfmt(stream.ostream);
  buffer << object;
  std::string string = buffer.str();
  stream.ostream << encoding::proxy<encoding::native, encoding::terminal>(string);
  return stream;
}

#endif

// vim:ts=2 sts=2 sw=2 et
