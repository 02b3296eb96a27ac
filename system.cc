/* Copyright © 2007-2018 Jakub Wilk <jwilk@jwilk.net>
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

#include "autoconf.hh"
#include "system.hh"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include "debug.hh"
#include "i18n.hh"
#include "string-utils.hh"

/* constants
 * =========
 */

static const char path_separator = '/';


/* class POSIXError : OSError
 * ==========================
 */

std::string POSIXError::error_message(const std::string &context)
{
  /* POSIX says that ``strerror()`` returns a locale-dependent error message.
   * No need to translate. */
  std::string message = strerror(errno);
  if (context.length())
    message = context + ": " + message;
  return message;
}

void throw_posix_error(const std::string &context)
{
  switch (errno)
  {
  case ENOTDIR:
    throw NotADirectory(context);
  case ENOENT:
    throw NoSuchFileOrDirectory(context);
  default:
    throw POSIXError(context);
  }
}


/* class Directory
 * ===============
 */

Directory::Directory(const std::string &name)
: name(name), posix_dir(nullptr)
{
  this->open(name.c_str());
}

Directory::~Directory()
{
  this->close();
}

void Directory::open(const char* path)
{
  this->posix_dir = opendir(path);
  if (this->posix_dir == nullptr)
    throw_posix_error(path);
}

void Directory::close()
{
  if (this->posix_dir == nullptr)
    return;
  if (closedir(static_cast<DIR*>(this->posix_dir)) != 0)
    error_log << string_printf(_("Warning: %s"), POSIXError(this->name).what()) << std::endl;
  this->posix_dir = nullptr;
}

std::string Directory::join(const std::string &file_name) const
{
  if (this->name.length() > 0 && this->name[this->name.length() - 1] == path_separator)
    return this->name + file_name;
  return this->name + path_separator + file_name;
}

bool Directory::contains(const std::string &file_name) const
{
  struct stat st;
  std::string path = this->join(file_name);
  if (stat(path.c_str(), &st) == 0)
    return true;
  if (errno != ENOENT)
    throw_posix_error(path);
  return false;
}


/* class File : std::fstream
 * =========================
 */

File::openmode File::get_default_open_mode()
{
  return std::fstream::out | std::fstream::trunc;
}

void File::open(const std::string &path, File::openmode mode)
{
  mode |= std::fstream::binary;
  this->exceptions(std::ifstream::failbit | std::ifstream::badbit);
  this->name = path;
  this->std::fstream::open(path.c_str(), mode);
  this->exceptions(std::ifstream::badbit);
}

File::File(const std::string &path)
{
  this->open(path, this->get_default_open_mode());
}

File::File(const Directory& directory, const std::string &name)
{
  this->open(directory.join(name), this->get_default_open_mode());
}

File::operator const std::string& () const
{
  return this->name;
}


/* class ExistingFile : File
 * =========================
 */

File::openmode ExistingFile::get_default_open_mode()
{
  return std::fstream::in;
}

ExistingFile::ExistingFile(const std::string &path)
{
  /* The virtual call in the File constructor would not reach this class. */
  try
  {
    this->open(path, this->get_default_open_mode());
  }
  catch (const std::ios_base::failure &)
  {
    throw_posix_error(path);
  }
}


/* utility functions
 * =================
 */

void read_stream(std::istream &istream, std::vector<char> &buffer)
{
  char chunk[BUFSIZ];
  while (istream)
  {
    istream.read(chunk, sizeof chunk);
    buffer.insert(buffer.end(), chunk, chunk + istream.gcount());
  }
  if (istream.bad())
    throw std::ios_base::failure(_("Unable to read input stream"));
}

bool is_same_file(const std::string &path1, const std::string &path2)
{
  struct stat st1, st2;
  int rc;
  rc = stat(path1.c_str(), &st1);
  if (rc)
    return false;
  rc = stat(path2.c_str(), &st2);
  if (rc)
    return false;
  return
    (st1.st_dev == st2.st_dev) &&
    (st1.st_ino == st2.st_ino);
}

// vim:ts=2 sts=2 sw=2 et
