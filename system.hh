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

#ifndef PDF2TXT_SYSTEM_HH
#define PDF2TXT_SYSTEM_HH

#include <cstddef>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

class OSError : public std::runtime_error
{
protected:
  explicit OSError(const std::string &message)
  : std::runtime_error(message)
  { }
};

class POSIXError : public OSError
{
public:
  static std::string error_message(const std::string &context);
  explicit POSIXError(const std::string &context)
  : OSError(error_message(context))
  { }
};

[[noreturn]]
void throw_posix_error(const std::string &context);

class NoSuchFileOrDirectory : public POSIXError
{
public:
  explicit NoSuchFileOrDirectory(const std::string &context)
  : POSIXError(context)
  { }
};

class NotADirectory : public POSIXError
{
public:
  explicit NotADirectory(const std::string &context)
  : POSIXError(context)
  { }
};

class Directory
{
private:
  Directory(const Directory&) = delete;
  Directory& operator=(const Directory&) = delete;
protected:
  std::string name;
  void *posix_dir;
  void open(const char *name);
  void close();
public:
  explicit Directory(const std::string &name);
  virtual ~Directory();
  const std::string &get_name() const
  {
    return this->name;
  }
  std::string join(const std::string &file_name) const;
  bool contains(const std::string &file_name) const;
};

class File : public std::fstream
{
private:
  File(const File&) = delete;
  File& operator=(const File&) = delete;
protected:
  std::string name;
  virtual File::openmode get_default_open_mode();
  void open(const std::string &path, File::openmode mode);
  File()
  { }
public:
  explicit File(const std::string &path);
  File(const Directory& directory, const std::string &name);
  virtual ~File()
  { }
  operator const std::string& () const;
};

class ExistingFile : public File
{
private:
  ExistingFile(const ExistingFile &) = delete;
  ExistingFile& operator=(const ExistingFile &) = delete;
protected:
  virtual File::openmode get_default_open_mode();
public:
  explicit ExistingFile(const std::string &path);
  virtual ~ExistingFile()
  { }
};

namespace encoding
{

  class Error : public POSIXError
  {
  public:
    Error()
    : POSIXError("")
    { }
  };

  enum encoding
  {
    native,
    terminal,
  };

  template <enum encoding from, enum encoding to>
  class proxy;

  template <enum encoding from, enum encoding to>
  std::ostream &operator << (std::ostream &, const proxy<from, to> &);

  template <enum encoding from, enum encoding to>
  class proxy
  {
  protected:
    const std::string &string;
  public:
    explicit proxy(const std::string &string)
    : string(string)
    { }
    friend std::ostream &operator << <>(std::ostream &, const proxy<from, to> &);
  };

/* class encoding::Codec
 * =====================
 *
 * Converts UTF-8 text to the named output codec. Characters that cannot be
 * represented in the target codec are dropped.
 */

  class IConv;

  class Codec
  {
  private:
    Codec(const Codec &) = delete;
    Codec& operator=(const Codec &) = delete;
  protected:
    std::string name;
    IConv *iconv;
  public:
    explicit Codec(const std::string &name);
    ~Codec();
    const std::string &get_name() const
    {
      return this->name;
    }
    bool is_utf8() const
    {
      return this->iconv == nullptr;
    }
    void write(std::ostream &stream, const std::string &utf8_string) const;
    std::string encode(const std::string &utf8_string) const;
    static bool is_utf8_name(const std::string &name);
  };

}

void read_stream(std::istream &istream, std::vector<char> &buffer);

bool is_same_file(const std::string &path1, const std::string &path2);

#endif

// vim:ts=2 sts=2 sw=2 et
