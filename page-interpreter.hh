/* Copyright © 2026 The pdf2txt developers
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

#ifndef PDF2TXT_PAGE_INTERPRETER_HH
#define PDF2TXT_PAGE_INTERPRETER_HH

#include "output-device.hh"
#include "pdf-backend.hh"
#include "resource-manager.hh"

namespace pdf
{

  class Interpreter
  {
  public:
    virtual void process_page(const pdf::Page &page) = 0;
    virtual ~Interpreter()
    { }
  };

/* class pdf::PageInterpreter
 * ==========================
 *
 * Runs the content stream of a page through Poppler into the output
 * device, using the page's effective rotation.
 */

  class PageInterpreter : public Interpreter
  {
  private:
    PageInterpreter(const PageInterpreter &) = delete;
    PageInterpreter& operator=(const PageInterpreter &) = delete;
  protected:
    pdf::ResourceManager &resource_manager;
    pdf::Device &device;
  public:
    PageInterpreter(pdf::ResourceManager &resource_manager, pdf::Device &device)
    : resource_manager(resource_manager), device(device)
    { }
    void process_page(const pdf::Page &page);
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
