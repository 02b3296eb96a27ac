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

#include "output-device.hh"

#include "string-utils.hh"

pdf::Device::Device(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
  pdf::ImageWriter *image_writer)
: resource_manager(resource_manager),
  sink(sink),
  codec(codec),
  image_writer(image_writer),
  closed(false),
  n_inline_images(0)
{ }

void pdf::Device::write(const std::string &utf8_string)
{
  this->codec.write(this->sink, utf8_string);
}

void pdf::Device::check_open() const
{
  if (this->closed)
    throw Closed();
}

void pdf::Device::begin_page(const pdf::Page &page)
{
  this->check_open();
  this->do_begin_page(page);
}

void pdf::Device::end_page(const pdf::Page &page)
{
  this->check_open();
  this->do_end_page(page);
}

void pdf::Device::close()
{
  this->check_open();
  this->do_close();
  this->closed = true;
  this->sink.flush();
}

std::string pdf::Device::get_image_stem(pdf::Object *ref, bool inline_image)
{
  if (!inline_image && ref != nullptr && ref->isRef())
  {
    pdf::Ref r = ref->getRef();
    return string_printf("img-%d-%d", r.num, r.gen);
  }
  return string_printf("inline-%u", this->n_inline_images++);
}

std::string pdf::Device::export_image(pdf::Object *ref, pdf::Stream *stream, int width, int height,
  pdf::gfx::ImageColorMap *color_map, bool inline_image)
{
  if (this->image_writer == nullptr)
    return "";
  bool has_ref = !inline_image && ref != nullptr && ref->isRef();
  std::string name;
  if (has_ref && this->resource_manager.find_image(ref->getRef(), name))
    return name;
  name = this->image_writer->write_image(
    this->get_image_stem(ref, inline_image),
    stream, width, height, color_map, inline_image
  );
  if (has_ref)
    this->resource_manager.add_image(ref->getRef(), name);
  return name;
}

std::string pdf::Device::export_mask(pdf::Object *ref, pdf::Stream *stream, int width, int height,
  bool invert, bool inline_image)
{
  if (this->image_writer == nullptr)
    return "";
  bool has_ref = !inline_image && ref != nullptr && ref->isRef();
  std::string name;
  if (has_ref && this->resource_manager.find_image(ref->getRef(), name))
    return name;
  name = this->image_writer->write_mask(
    this->get_image_stem(ref, inline_image),
    stream, width, height, invert
  );
  if (has_ref)
    this->resource_manager.add_image(ref->getRef(), name);
  return name;
}

std::string pdf::format_bbox(double x0, double y0, double x1, double y1)
{
  return string_printf("%.3f,%.3f,%.3f,%.3f", x0, y0, x1, y1);
}

std::string pdf::get_page_bbox(const pdf::Page &page)
{
  double x0 = 0, y0 = 0, x1 = 0, y1 = 0;
  pdf::Document *document = page.get_document();
  if (document != nullptr)
    document->get_page_media_box(page.get_index(), x0, y0, x1, y1);
  return pdf::format_bbox(x0, y0, x1, y1);
}

// vim:ts=2 sts=2 sw=2 et
