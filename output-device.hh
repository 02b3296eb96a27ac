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

#ifndef PDF2TXT_OUTPUT_DEVICE_HH
#define PDF2TXT_OUTPUT_DEVICE_HH

#include <ostream>
#include <stdexcept>
#include <string>

#include "i18n.hh"
#include "image-writer.hh"
#include "pdf-backend.hh"
#include "resource-manager.hh"
#include "system.hh"

namespace pdf
{

/* class pdf::Device
 * =================
 *
 * Receives the interpreted content of pages and writes it to a sink in
 * the configured codec. A device is either open or closed; once closed,
 * it accepts nothing.
 */

  class Device
  {
  private:
    Device(const Device &) = delete;
    Device& operator=(const Device &) = delete;
  protected:
    pdf::ResourceManager &resource_manager;
    std::ostream &sink;
    encoding::Codec codec;
    pdf::ImageWriter *image_writer;
    bool closed;
    unsigned int n_inline_images;
    std::string get_image_stem(pdf::Object *ref, bool inline_image);
    void write(const std::string &utf8_string);
    void check_open() const;
    /* Saves an image through the image writer; returns an empty string if
     * there is no image writer. */
    std::string export_image(pdf::Object *ref, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool inline_image);
    std::string export_mask(pdf::Object *ref, pdf::Stream *stream, int width, int height,
      bool invert, bool inline_image);
    virtual void do_begin_page(const pdf::Page &page)
    { }
    virtual void do_end_page(const pdf::Page &page)
    { }
    virtual void do_close()
    { }
  public:
    Device(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
      pdf::ImageWriter *image_writer = nullptr);
    virtual ~Device()
    { }
    void begin_page(const pdf::Page &page);
    void end_page(const pdf::Page &page);
    void close();
    bool is_closed() const
    {
      return this->closed;
    }
    const encoding::Codec &get_codec() const
    {
      return this->codec;
    }
    /* the Poppler device that the page content is rendered through */
    virtual pdf::OutputDevice &output_device() = 0;

    class Closed : public std::logic_error
    {
    public:
      Closed()
      : std::logic_error(_("Output device is already closed"))
      { }
    };
  };

  /* "x0,y0,x1,y1" with three decimal places */
  std::string format_bbox(double x0, double y0, double x1, double y1);

  /* media box of the page, formatted with format_bbox() */
  std::string get_page_bbox(const pdf::Page &page);

}

#endif

// vim:ts=2 sts=2 sw=2 et
