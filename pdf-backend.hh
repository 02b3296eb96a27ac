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

#ifndef PDF2TXT_PDF_BACKEND_HH
#define PDF2TXT_PDF_BACKEND_HH

#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "autoconf.hh"

// Poppler:
#include <PDFDoc.h>
#include <Catalog.h>
#include <Dict.h>
#include <GfxFont.h>
#include <GfxState.h>
#include <Object.h>
#include <OutputDev.h>
#include <Stream.h>
#include <goo/GooString.h>

#include "i18n.hh"

namespace pdf
{

/* miscellaneous type definitions
 * ==============================
 */

  typedef ::OutputDev OutputDevice;
  typedef ::Stream Stream;
  typedef ::Object Object;
  typedef ::Dict Dict;
  typedef ::Catalog Catalog;
  typedef ::GooString String;
  typedef ::Goffset Offset;
  typedef ::Ref Ref;

/* type definitions: rendering subsystem
 * =====================================
 */

  namespace gfx
  {
    typedef ::GfxState State;
    typedef ::GfxFont Font;
    typedef ::GfxImageColorMap ImageColorMap;
    typedef ::GfxColorComp ColorComponent;
    typedef ::GfxRGB RgbColor;
    typedef ::GfxGray GrayColor;
  }

/* class pdf::Environment
 * ======================
 *
 * Poppler keeps its parameters in a process-wide object; exactly one
 * Environment must exist while documents are processed.
 */

  class Environment
  {
  private:
    Environment(const Environment &) = delete;
    Environment& operator=(const Environment &) = delete;
  public:
    Environment();
    ~Environment();
  };


/* class pdf::Document
 * ===================
 */

  class Document
  {
  private:
    Document(const Document &) = delete;
    Document& operator=(const Document &) = delete;
  protected:
    /* MemStream does not copy the data; it must outlive the PDFDoc. */
    std::vector<char> data;
    std::unique_ptr<::PDFDoc> doc;
  public:
    Document(std::istream &stream, const std::string &password);
    ~Document();
    int get_n_pages();
    /* Pages are numbered from 0. */
    int get_page_rotate(int n);
    std::string get_page_label(int n);
    void get_page_media_box(int n, double &x0, double &y0, double &x1, double &y1);
    bool is_encrypted();
    bool is_extractable();
    void display_page(pdf::OutputDevice *device, int n, int rotate);

    class LoadError : public std::runtime_error
    {
    public:
      LoadError()
      : std::runtime_error(_("Unable to load document"))
      { }
    };

    class DecryptionError : public std::runtime_error
    {
    public:
      DecryptionError()
      : std::runtime_error(_("Incorrect password for encrypted document"))
      { }
    };

    class PermissionError : public std::runtime_error
    {
    public:
      PermissionError()
      : std::runtime_error(_("Text extraction is not allowed for this document"))
      { }
    };
  };


/* class pdf::Page
 * ===============
 */

  class Page
  {
  protected:
    Document *document;
    int index;
    int intrinsic_rotate;
    bool extractable;
    std::string label;
  public:
    /* effective rotation seen by the interpreter */
    int rotate;

    Page()
    : document(nullptr), index(-1), intrinsic_rotate(0), extractable(true), rotate(0)
    { }

    Page(Document *document, int index, int rotate, bool extractable, const std::string &label = "")
    : document(document),
      index(index),
      intrinsic_rotate(rotate),
      extractable(extractable),
      label(label),
      rotate(rotate)
    { }

    Document *get_document() const
    {
      return this->document;
    }

    int get_index() const
    {
      return this->index;
    }

    int get_intrinsic_rotate() const
    {
      return this->intrinsic_rotate;
    }

    bool is_extractable() const
    {
      return this->extractable;
    }

    const std::string &get_label() const
    {
      return this->label;
    }
  };


/* utility functions
 * =================
 */

  const char * get_c_string(const pdf::String *str);

  /* Reduces any rotation, including negative ones, to [0, 360). */
  int normalize_rotation(int degrees);

}

#endif

// vim:ts=2 sts=2 sw=2 et
