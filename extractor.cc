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

#include "extractor.hh"

#include <sstream>

#include "converter.hh"
#include "i18n.hh"
#include "string-utils.hh"
#include "system.hh"
#include "tag-extractor.hh"

std::unique_ptr<pdf::Device> Extractor::create_device(pdf::ResourceManager &resource_manager,
  std::ostream &output, const ExtractionConfig &config, pdf::ImageWriter *image_writer)
{
  const LayoutParams *layout_params = config.layout_params.get();
  switch (config.output_type)
  {
  case OutputType::text:
    return std::unique_ptr<pdf::Device>(new pdf::TextConverter(
      resource_manager, output, config.codec, layout_params, image_writer
    ));
  case OutputType::xml:
    return std::unique_ptr<pdf::Device>(new pdf::XmlConverter(
      resource_manager, output, config.codec, layout_params, image_writer,
      config.strip_control
    ));
  case OutputType::html:
    return std::unique_ptr<pdf::Device>(new pdf::HtmlConverter(
      resource_manager, output, config.codec, layout_params, image_writer,
      config.scale, config.layout_mode
    ));
  case OutputType::tag:
    return std::unique_ptr<pdf::Device>(new pdf::TagExtractor(
      resource_manager, output, config.codec
    ));
  }
  throw ExtractionConfig::Error(string_printf(
    _("Invalid output type: %d"),
    static_cast<int>(config.output_type)
  ));
}

std::unique_ptr<pdf::Interpreter> Extractor::create_interpreter(pdf::ResourceManager &resource_manager,
  pdf::Device &device)
{
  return std::unique_ptr<pdf::Interpreter>(new pdf::PageInterpreter(resource_manager, device));
}

void Extractor::run(std::istream &input, std::ostream &output, const ExtractionConfig &config)
{
  config.validate();
  DebugStream &trace = debug(log_level::trace, config.verbose);
  trace << string_printf(_("Output type: %s"), get_output_type_name(config.output_type)) << std::endl;
  pdf::ResourceManager resource_manager(config.caching());
  std::unique_ptr<pdf::ImageWriter> image_writer;
  if (config.output_dir.length() > 0)
  {
    trace << string_printf(_("Images will be saved in %s"), config.output_dir.c_str()) << std::endl;
    image_writer.reset(new pdf::ImageWriter(config.output_dir));
  }
  std::unique_ptr<pdf::Device> device = this->create_device(resource_manager, output, config, image_writer.get());
  std::unique_ptr<pdf::Interpreter> interpreter = this->create_interpreter(resource_manager, *device);
  trace << _("Opening the document") << std::endl;
  std::unique_ptr<pdf::PageSequence> pages = this->source.get_pages(
    input,
    config.page_numbers,
    config.page_ranges,
    config.max_pages,
    config.password,
    resource_manager.caching(),
    true /* check extractable */
  );
  pdf::Page page;
  int n_pages = 0;
  while (pages->next(page))
  {
    page.rotate = pdf::normalize_rotation(page.get_intrinsic_rotate() + pdf::normalize_rotation(config.rotation));
    debug(log_level::progress, config.verbose)
      << string_printf(_("page #%d"), page.get_index() + 1)
      << std::endl;
    {
      DebugStream::Indent indent(trace);
      trace << string_printf(_("rotation: %d"), page.rotate) << std::endl;
      if (page.get_label().length() > 0)
        trace << string_printf(_("label: %s"), page.get_label().c_str()) << std::endl;
    }
    interpreter->process_page(page);
    n_pages++;
  }
  device->close();
  if (n_pages == 0 && !(config.page_numbers.empty() && config.page_ranges.empty()))
    warning(_("none of the requested pages is in the document"), config.verbose);
  trace
    << string_printf(ngettext("%d page extracted", "%d pages extracted", n_pages), n_pages)
    << std::endl;
}

void Extractor::extract_to_stream(std::istream &input, std::ostream &output, const ExtractionConfig &config)
{
  this->run(input, output, config);
}

std::string Extractor::extract_text(const std::string &path,
  const std::string &password,
  const std::set<int> &page_numbers,
  int max_pages,
  bool caching,
  const std::string &codec,
  const LayoutParams *layout_params,
  int verbose)
{
  ExtractionConfig config;
  config.output_type = OutputType::text;
  config.codec = codec;
  if (layout_params != nullptr)
    config.layout_params.reset(new LayoutParams(*layout_params));
  else
    config.layout_params.reset(new LayoutParams);
  config.page_numbers = page_numbers;
  config.max_pages = max_pages;
  config.password = password;
  config.disable_caching = !caching;
  config.verbose = verbose;
  ExistingFile file(path);
  std::ostringstream output;
  this->run(file, output, config);
  return output.str();
}

// vim:ts=2 sts=2 sw=2 et
