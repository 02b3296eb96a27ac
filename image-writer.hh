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

#ifndef PDF2TXT_IMAGE_WRITER_HH
#define PDF2TXT_IMAGE_WRITER_HH

#include <set>
#include <stdexcept>
#include <string>

#include "i18n.hh"
#include "pdf-backend.hh"
#include "system.hh"

namespace pdf
{

/* class pdf::ImageWriter
 * ======================
 *
 * Saves images drawn on pages into an output directory. JPEG and
 * JPEG 2000 streams are copied as they are; everything else is decoded
 * and saved as PNG.
 */

  class ImageWriter
  {
  private:
    ImageWriter(const ImageWriter &) = delete;
    ImageWriter& operator=(const ImageWriter &) = delete;
  protected:
    Directory directory;
    std::set<std::string> used_names;
    std::string get_unique_name(const std::string &stem, const std::string &extension);
    std::string copy_raw_stream(const std::string &stem, const std::string &extension, pdf::Stream *stream);
  public:
    explicit ImageWriter(const std::string &output_dir);
    const std::string &get_output_dir() const
    {
      return this->directory.get_name();
    }
    std::string get_path(const std::string &name) const
    {
      return this->directory.join(name);
    }
    /* Each method returns the name of the created file, relative to the
     * output directory. */
    std::string write_image(const std::string &stem, pdf::Stream *stream, int width, int height,
      pdf::gfx::ImageColorMap *color_map, bool inline_image);
    std::string write_mask(const std::string &stem, pdf::Stream *stream, int width, int height,
      bool invert);

    class NotImplementedError : public std::runtime_error
    {
    public:
      NotImplementedError()
      : std::runtime_error(_("pdf2txt was built without GraphicsMagick; only JPEG images can be extracted."))
      { }
    };
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
