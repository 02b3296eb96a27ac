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

#include "page-interpreter.hh"

#include <stdexcept>

#include "i18n.hh"

void pdf::PageInterpreter::process_page(const pdf::Page &page)
{
  pdf::Document *document = page.get_document();
  if (document == nullptr)
    throw std::logic_error(_("Page does not belong to any document"));
  this->device.begin_page(page);
  /* Poppler adds the page's own rotation. */
  int rotate = pdf::normalize_rotation(page.rotate - page.get_intrinsic_rotate());
  document->display_page(&this->device.output_device(), page.get_index(), rotate);
  this->device.end_page(page);
}

// vim:ts=2 sts=2 sw=2 et
