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

#include "pdf-backend.hh"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <Error.h>
#include <ErrorCodes.h>
#include <GlobalParams.h>
#include <PDFDoc.h>
#include <Page.h>
#include <Stream.h>
#include <goo/GooString.h>

#if POPPLER_VERSION >= 220300
#include <optional>
#endif

#include "debug.hh"
#include "i18n.hh"
#include "pdf-unicode.hh"
#include "string-utils.hh"
#include "system.hh"


/* class pdf::Environment
 * ======================
 */

static void poppler_error_handler(ErrorCategory category, pdf::Offset pos, const char *message)
{
  const char *category_name = _("PDF error");
  switch (category)
  {
    case errSyntaxWarning:
      category_name = _("PDF syntax warning");
      break;
    case errSyntaxError:
      category_name = _("PDF syntax error");
      break;
    case errConfig:
      category_name = _("Poppler configuration error");
      break;
    case errCommandLine:
      break; /* should not happen */
    case errIO:
      category_name = _("Input/output error");
      break;
    case errNotAllowed:
      category_name = _("Permission denied");
      break;
    case errUnimplemented:
      category_name = _("PDF feature not implemented");
      break;
    case errInternal:
      category_name = _("Internal Poppler error");
      break;
  }

  if (pos >= 0)
  {
    error_log <<
      /* L10N: "<error-category> (<position>): <error-message>" */
      string_printf(_("%s (%jd): %s"), category_name, static_cast<intmax_t>(pos), message);
  }
  else
  {
    error_log <<
      /* L10N: "<error-category>: <error-message>" */
      string_printf(_("%s: %s"), category_name, message);
  }
  error_log << std::endl;
}

pdf::Environment::Environment()
{
  globalParams = std::unique_ptr<GlobalParams>(new GlobalParams);
  /* Converters receive UTF-8 and recode it themselves. */
  globalParams->setTextEncoding("UTF-8");
  setErrorCallback(poppler_error_handler);
}

pdf::Environment::~Environment()
{
  globalParams.reset();
}


/* class pdf::Document
 * ===================
 */

pdf::Document::Document(std::istream &stream, const std::string &password)
{
  read_stream(stream, this->data);
  if (this->data.empty())
    throw LoadError();
  ::BaseStream *mem_stream = new MemStream(this->data.data(), 0, this->data.size(), pdf::Object(objNull));
  /* The same password is tried as the owner and the user password. */
#if POPPLER_VERSION >= 220300
  std::optional<pdf::String> password_string;
  if (password.length() > 0)
    password_string = pdf::String(password.c_str());
  this->doc.reset(new ::PDFDoc(mem_stream, password_string, password_string));
#else
  std::unique_ptr<pdf::String> password_string;
  if (password.length() > 0)
    password_string.reset(new pdf::String(password.c_str()));
  this->doc.reset(new ::PDFDoc(mem_stream, password_string.get(), password_string.get()));
#endif
  if (!this->doc->isOk())
  {
    int error_code = this->doc->getErrorCode();
    this->doc.reset();
    if (error_code == errEncrypted)
      throw DecryptionError();
    throw LoadError();
  }
}

pdf::Document::~Document()
{
  /* PDFDoc refers to this->data, so it has to go first. */
  this->doc.reset();
}

int pdf::Document::get_n_pages()
{
  return this->doc->getNumPages();
}

int pdf::Document::get_page_rotate(int n)
{
  return pdf::normalize_rotation(this->doc->getPageRotate(n + 1));
}

std::string pdf::Document::get_page_label(int n)
{
  pdf::String label;
  pdf::Catalog *catalog = this->doc->getCatalog();
  if (catalog != nullptr && catalog->indexToLabel(n, &label))
    return pdf::string_as_utf8(&label);
  return "";
}

void pdf::Document::get_page_media_box(int n, double &x0, double &y0, double &x1, double &y1)
{
  ::Page *page = this->doc->getPage(n + 1);
  if (page == nullptr)
    throw LoadError();
  const PDFRectangle *box = page->getMediaBox();
  x0 = box->x1;
  y0 = box->y1;
  x1 = box->x2;
  y1 = box->y2;
}

bool pdf::Document::is_encrypted()
{
  return this->doc->isEncrypted();
}

bool pdf::Document::is_extractable()
{
  return this->doc->okToCopy();
}

void pdf::Document::display_page(pdf::OutputDevice *device, int n, int rotate)
{
  /* Poppler adds the page's own /Rotate to the value given here. */
  this->doc->displayPage(device, n + 1, 72.0, 72.0, rotate,
    true /* use media box */,
    false /* crop */,
    false /* printing */
  );
}


/* utility functions
 * =================
 */

#if POPPLER_VERSION >= 7200
const char * pdf::get_c_string(const pdf::String *str)
{
  return str->c_str();
}
#else
const char * pdf::get_c_string(const pdf::String *str)
{
  return str->getCString();
}
#endif

int pdf::normalize_rotation(int degrees)
{
  int result = degrees % 360;
  if (result < 0)
    result += 360;
  return result;
}

// vim:ts=2 sts=2 sw=2 et
