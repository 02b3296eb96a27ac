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

#include "image-writer.hh"

#include <cstdio>
#include <memory>

#include "autoconf.hh"
#include "string-utils.hh"

#if HAVE_GRAPHICSMAGICK
#include <Magick++.h>
#endif

pdf::ImageWriter::ImageWriter(const std::string &output_dir)
: directory(output_dir)
{ }

std::string pdf::ImageWriter::get_unique_name(const std::string &stem, const std::string &extension)
{
  std::string name = stem + extension;
  for (unsigned int n = 1; this->used_names.count(name) || this->directory.contains(name); n++)
    name = string_printf("%s.%u%s", stem.c_str(), n, extension.c_str());
  this->used_names.insert(name);
  return name;
}

std::string pdf::ImageWriter::copy_raw_stream(const std::string &stem, const std::string &extension, pdf::Stream *stream)
{
  std::string name = this->get_unique_name(stem, extension);
  File file(this->directory, name);
  /* skip the decoding filter */
  pdf::Stream *raw_stream = stream->getNextStream();
  raw_stream->reset();
  char buffer[BUFSIZ];
  size_t length = 0;
  int c;
  while ((c = raw_stream->getChar()) != EOF)
  {
    buffer[length++] = static_cast<char>(c);
    if (length == sizeof buffer)
    {
      file.write(buffer, length);
      length = 0;
    }
  }
  file.write(buffer, length);
  raw_stream->close();
  file.close();
  return name;
}

#if HAVE_GRAPHICSMAGICK

class GraphicsMagickInitializer
{
public:
  GraphicsMagickInitializer()
  {
    Magick::InitializeMagick("");
  }
};

static inline MagickLib::Quantum c2q(unsigned char c)
{
  using namespace MagickLib;
  return ScaleCharToQuantum(c);
}

std::string pdf::ImageWriter::write_image(const std::string &stem, pdf::Stream *stream, int width, int height,
  pdf::gfx::ImageColorMap *color_map, bool inline_image)
{
  int n_components = color_map->getNumPixelComps();
  switch (stream->getKind())
  {
  case strDCT:
    if (!inline_image && (n_components == 1 || n_components == 3))
      return this->copy_raw_stream(stem, ".jpg", stream);
    break;
  case strJPX:
    if (!inline_image)
      return this->copy_raw_stream(stem, ".jp2", stream);
    break;
  default:
    break;
  }
  static GraphicsMagickInitializer gm_init;
  std::string name = this->get_unique_name(stem, ".png");
  Magick::Image image(Magick::Geometry(width, height), Magick::Color());
  image.type(Magick::TrueColorType);
  image.modifyImage();
  std::unique_ptr<ImageStream> image_stream(
    new ImageStream(stream, width, n_components, color_map->getBits())
  );
  image_stream->reset();
  for (int y = 0; y < height; y++)
  {
    Magick::PixelPacket *ipixel = image.setPixels(0, y, width, 1);
    unsigned char *row = image_stream->getLine();
    for (int x = 0; x < width; x++)
    {
      pdf::gfx::RgbColor rgb;
      if (row != nullptr)
      {
        color_map->getRGB(row, &rgb);
        row += n_components;
      }
      else
        rgb.r = rgb.g = rgb.b = 0;
      *ipixel = Magick::Color(
        c2q(colToByte(rgb.r)),
        c2q(colToByte(rgb.g)),
        c2q(colToByte(rgb.b)),
        OpaqueOpacity
      );
      ipixel++;
    }
    image.syncPixels();
  }
  image_stream->close();
  image.magick("PNG");
  image.write(this->directory.join(name));
  return name;
}

std::string pdf::ImageWriter::write_mask(const std::string &stem, pdf::Stream *stream, int width, int height,
  bool invert)
{
  static GraphicsMagickInitializer gm_init;
  std::string name = this->get_unique_name(stem, ".png");
  Magick::Image image(Magick::Geometry(width, height), Magick::Color("white"));
  image.modifyImage();
  std::unique_ptr<ImageStream> image_stream(new ImageStream(stream, width, 1, 1));
  image_stream->reset();
  /* A zero sample paints the page, unless the mask is inverted. */
  unsigned char paint = invert ? 1 : 0;
  for (int y = 0; y < height; y++)
  {
    Magick::PixelPacket *ipixel = image.setPixels(0, y, width, 1);
    unsigned char *row = image_stream->getLine();
    for (int x = 0; x < width; x++)
    {
      bool painted = row != nullptr && row[x] == paint;
      unsigned char value = painted ? 0 : 0xFF;
      *ipixel = Magick::Color(c2q(value), c2q(value), c2q(value), OpaqueOpacity);
      ipixel++;
    }
    image.syncPixels();
  }
  image_stream->close();
  image.type(Magick::BilevelType);
  image.magick("PNG");
  image.write(this->directory.join(name));
  return name;
}

#else

std::string pdf::ImageWriter::write_image(const std::string &stem, pdf::Stream *stream, int width, int height,
  pdf::gfx::ImageColorMap *color_map, bool inline_image)
{
  int n_components = color_map->getNumPixelComps();
  if (stream->getKind() == strDCT && !inline_image && (n_components == 1 || n_components == 3))
    return this->copy_raw_stream(stem, ".jpg", stream);
  if (stream->getKind() == strJPX && !inline_image)
    return this->copy_raw_stream(stem, ".jp2", stream);
  throw NotImplementedError();
}

std::string pdf::ImageWriter::write_mask(const std::string &stem, pdf::Stream *stream, int width, int height,
  bool invert)
{
  throw NotImplementedError();
}

#endif

// vim:ts=2 sts=2 sw=2 et
