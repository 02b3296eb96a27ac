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

#ifndef PDF2TXT_EXTRACTOR_HH
#define PDF2TXT_EXTRACTOR_HH

#include <istream>
#include <memory>
#include <ostream>
#include <set>
#include <string>

#include "debug.hh"
#include "document-source.hh"
#include "extraction-config.hh"
#include "image-writer.hh"
#include "output-device.hh"
#include "page-interpreter.hh"
#include "resource-manager.hh"

/* class Extractor
 * ===============
 *
 * Runs one extraction: every selected page of the document is interpreted
 * exactly once, in document order, into a single output device, which is
 * closed once all the pages are done.
 */

class Extractor
{
private:
  Extractor(const Extractor &) = delete;
  Extractor& operator=(const Extractor &) = delete;
protected:
  pdf::DocumentSource &source;
  void run(std::istream &input, std::ostream &output, const ExtractionConfig &config);
  virtual std::unique_ptr<pdf::Device> create_device(pdf::ResourceManager &resource_manager,
    std::ostream &output, const ExtractionConfig &config, pdf::ImageWriter *image_writer);
  virtual std::unique_ptr<pdf::Interpreter> create_interpreter(pdf::ResourceManager &resource_manager,
    pdf::Device &device);
public:
  explicit Extractor(pdf::DocumentSource &source)
  : source(source)
  { }
  virtual ~Extractor()
  { }

  /* Writes the content of the document read from input to output,
   * in the format selected by config. */
  void extract_to_stream(std::istream &input, std::ostream &output, const ExtractionConfig &config);

  /* Returns the plain text of the document stored at path. Without layout
   * parameters, the default ones are used. */
  std::string extract_text(const std::string &path,
    const std::string &password = "",
    const std::set<int> &page_numbers = std::set<int>(),
    int max_pages = 0,
    bool caching = true,
    const std::string &codec = "utf-8",
    const LayoutParams *layout_params = nullptr,
    int verbose = log_level::normal);
};

#endif

// vim:ts=2 sts=2 sw=2 et
