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

#include <gtest/gtest.h>

#include <climits>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "debug.hh"
#include "document-source.hh"
#include "extractor.hh"
#include "output-device.hh"
#include "page-interpreter.hh"
#include "page-selection.hh"
#include "string-utils.hh"

typedef std::vector<std::string> EventLog;

class BrokenPage : public std::runtime_error
{
public:
  explicit BrokenPage(int index)
  : std::runtime_error(string_printf("page %d is broken", index))
  { }
};

/* Pages without a document behind them; intrinsic rotations are given
 * per page. Producing the page at broken_page throws BrokenPage. */
class FakePageSequence : public pdf::PageSequence
{
protected:
  std::vector<int> rotations;
  pdf::PageSelection selection;
  int broken_page;
public:
  FakePageSequence(const std::vector<int> &rotations, const std::set<int> &page_numbers,
    const pdf::PageRanges &page_ranges, int max_pages, int broken_page)
  : rotations(rotations),
    selection(page_numbers, page_ranges, max_pages, static_cast<int>(rotations.size())),
    broken_page(broken_page)
  { }
  bool next(pdf::Page &page)
  {
    int index;
    if (!this->selection.next(index))
      return false;
    if (index == this->broken_page)
      throw BrokenPage(index);
    page = pdf::Page(nullptr, index, this->rotations[index], true, string_printf("p%d", index + 1));
    return true;
  }
};

class FakeDocumentSource : public pdf::DocumentSource
{
public:
  std::vector<int> rotations;
  std::string expected_password;
  bool extractable;
  int n_calls;
  bool last_caching;
  bool last_check_extractable;
  int broken_page;

  explicit FakeDocumentSource(const std::vector<int> &rotations)
  : rotations(rotations),
    extractable(true),
    n_calls(0),
    last_caching(false),
    last_check_extractable(false),
    broken_page(-1)
  { }

  std::unique_ptr<pdf::PageSequence> get_pages(
    std::istream &stream,
    const std::set<int> &page_numbers,
    const pdf::PageRanges &page_ranges,
    int max_pages,
    const std::string &password,
    bool caching,
    bool check_extractable)
  {
    this->n_calls++;
    this->last_caching = caching;
    this->last_check_extractable = check_extractable;
    if (password != this->expected_password)
      throw pdf::Document::DecryptionError();
    if (check_extractable && !this->extractable)
      throw pdf::Document::PermissionError();
    return std::unique_ptr<pdf::PageSequence>(new FakePageSequence(
      this->rotations, page_numbers, page_ranges, max_pages, this->broken_page
    ));
  }
};

class RecordingDevice : public pdf::Device
{
protected:
  EventLog &log;
  int &n_released;
  void do_begin_page(const pdf::Page &page)
  {
    this->log.push_back(string_printf("begin %d", page.get_index()));
    this->write(string_printf("[%d]", page.get_index()));
  }
  void do_end_page(const pdf::Page &page)
  {
    this->log.push_back(string_printf("end %d", page.get_index()));
  }
  void do_close()
  {
    this->log.push_back("close");
  }
public:
  RecordingDevice(pdf::ResourceManager &resource_manager, std::ostream &sink, const std::string &codec,
    EventLog &log, int &n_released)
  : pdf::Device(resource_manager, sink, codec),
    log(log),
    n_released(n_released)
  { }
  ~RecordingDevice()
  {
    this->n_released++;
  }
  pdf::OutputDevice &output_device()
  {
    throw std::logic_error("RecordingDevice does not render");
  }
};

/* Interpreting the page at broken_page throws BrokenPage after the
 * device has seen begin_page. */
class RecordingInterpreter : public pdf::Interpreter
{
protected:
  pdf::Device &device;
  EventLog &log;
  int broken_page;
public:
  RecordingInterpreter(pdf::Device &device, EventLog &log, int broken_page)
  : device(device), log(log), broken_page(broken_page)
  { }
  void process_page(const pdf::Page &page)
  {
    this->log.push_back(string_printf("page %d rotate %d", page.get_index(), page.rotate));
    this->device.begin_page(page);
    if (page.get_index() == this->broken_page)
      throw BrokenPage(page.get_index());
    this->device.end_page(page);
  }
};

class RecordingExtractor : public Extractor
{
protected:
  std::unique_ptr<pdf::Device> create_device(pdf::ResourceManager &resource_manager,
    std::ostream &output, const ExtractionConfig &config, pdf::ImageWriter *image_writer)
  {
    this->log.push_back(string_printf("device %s", get_output_type_name(config.output_type)));
    this->device_caching = resource_manager.caching();
    this->had_image_writer = image_writer != nullptr;
    return std::unique_ptr<pdf::Device>(new RecordingDevice(
      resource_manager, output, config.codec, this->log, this->n_devices_released
    ));
  }
  std::unique_ptr<pdf::Interpreter> create_interpreter(pdf::ResourceManager &resource_manager,
    pdf::Device &device)
  {
    return std::unique_ptr<pdf::Interpreter>(new RecordingInterpreter(device, this->log, this->broken_page));
  }
public:
  EventLog log;
  bool device_caching;
  bool had_image_writer;
  int broken_page;
  int n_devices_released;
  explicit RecordingExtractor(pdf::DocumentSource &source)
  : Extractor(source),
    device_caching(false),
    had_image_writer(false),
    broken_page(-1),
    n_devices_released(0)
  { }
};

class ExtractorTest : public ::testing::Test
{
protected:
  ExtractionConfig config;
  std::istringstream input;
  std::ostringstream output;
  ExtractorTest()
  : input("%PDF")
  {
    this->config.verbose = log_level::quiet;
  }
};

TEST_F(ExtractorTest, PagesInOrderThenClose)
{
  FakeDocumentSource source({0, 0, 0});
  RecordingExtractor extractor(source);
  extractor.extract_to_stream(this->input, this->output, this->config);
  EventLog expected = {
    "device text",
    "page 0 rotate 0", "begin 0", "end 0",
    "page 1 rotate 0", "begin 1", "end 1",
    "page 2 rotate 0", "begin 2", "end 2",
    "close",
  };
  EXPECT_EQ(extractor.log, expected);
  EXPECT_EQ(this->output.str(), "[0][1][2]");
  EXPECT_TRUE(source.last_check_extractable);
}

TEST_F(ExtractorTest, OutputTypeIsPassedToDevice)
{
  FakeDocumentSource source({0});
  for (const char *name : {"text", "xml", "html", "tag"})
  {
    RecordingExtractor extractor(source);
    this->config.output_type = parse_output_type(name);
    extractor.extract_to_stream(this->input, this->output, this->config);
    ASSERT_FALSE(extractor.log.empty());
    EXPECT_EQ(extractor.log.front(), std::string("device ") + name);
  }
}

TEST_F(ExtractorTest, EmptyDocument)
{
  FakeDocumentSource source({});
  RecordingExtractor extractor(source);
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(extractor.log, EventLog({"device text", "close"}));
  EXPECT_EQ(this->output.str(), "");
}

TEST_F(ExtractorTest, PageFilterAndMaxPages)
{
  FakeDocumentSource source({0, 0, 0, 0, 0});
  RecordingExtractor extractor(source);
  this->config.page_numbers = {1, 3, 4, 9};
  this->config.max_pages = 2;
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(this->output.str(), "[1][3]");
}

TEST_F(ExtractorTest, RotationIsAddedAndNormalized)
{
  FakeDocumentSource source({0, 90, 270});
  RecordingExtractor extractor(source);
  this->config.rotation = -90;
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(extractor.log[1], "page 0 rotate 270");
  EXPECT_EQ(extractor.log[4], "page 1 rotate 0");
  EXPECT_EQ(extractor.log[7], "page 2 rotate 180");
}

TEST_F(ExtractorTest, LargeRotation)
{
  FakeDocumentSource source({90});
  RecordingExtractor extractor(source);
  this->config.rotation = 720 + 180;
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(extractor.log[1], "page 0 rotate 270");
}

TEST_F(ExtractorTest, ExtremeRotationDeltas)
{
  FakeDocumentSource source({90, 270});
  {
    RecordingExtractor extractor(source);
    this->config.rotation = INT_MAX;
    extractor.extract_to_stream(this->input, this->output, this->config);
    /* INT_MAX % 360 == 127 */
    EXPECT_EQ(extractor.log[1], "page 0 rotate 217");
    EXPECT_EQ(extractor.log[4], "page 1 rotate 37");
  }
  {
    RecordingExtractor extractor(source);
    this->config.rotation = INT_MIN;
    extractor.extract_to_stream(this->input, this->output, this->config);
    /* INT_MIN % 360 == -128 */
    EXPECT_EQ(extractor.log[1], "page 0 rotate 322");
    EXPECT_EQ(extractor.log[4], "page 1 rotate 142");
  }
}

TEST_F(ExtractorTest, PageRangesAreNotExpanded)
{
  FakeDocumentSource source({0, 0, 0, 0});
  RecordingExtractor extractor(source);
  this->config.page_ranges = {{2, 2147483646}};
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(this->output.str(), "[2][3]");
}

TEST_F(ExtractorTest, InterpreterErrorPropagates)
{
  FakeDocumentSource source({0, 0, 0});
  RecordingExtractor extractor(source);
  extractor.broken_page = 1;
  EXPECT_THROW(
    extractor.extract_to_stream(this->input, this->output, this->config),
    BrokenPage
  );
  EventLog expected = {
    "device text",
    "page 0 rotate 0", "begin 0", "end 0",
    "page 1 rotate 0", "begin 1",
  };
  EXPECT_EQ(extractor.log, expected);
  EXPECT_EQ(this->output.str(), "[0][1]");
  EXPECT_EQ(extractor.n_devices_released, 1);
}

TEST_F(ExtractorTest, PageSequenceErrorPropagates)
{
  FakeDocumentSource source({0, 0, 0});
  source.broken_page = 1;
  RecordingExtractor extractor(source);
  try
  {
    extractor.extract_to_stream(this->input, this->output, this->config);
    FAIL() << "BrokenPage was not thrown";
  }
  catch (const BrokenPage &ex)
  {
    EXPECT_STREQ(ex.what(), "page 1 is broken");
  }
  EventLog expected = {
    "device text",
    "page 0 rotate 0", "begin 0", "end 0",
  };
  EXPECT_EQ(extractor.log, expected);
  EXPECT_EQ(this->output.str(), "[0]");
  EXPECT_EQ(extractor.n_devices_released, 1);
}

TEST_F(ExtractorTest, CachingFlagReachesEveryComponent)
{
  FakeDocumentSource source({0});
  {
    RecordingExtractor extractor(source);
    extractor.extract_to_stream(this->input, this->output, this->config);
    EXPECT_TRUE(extractor.device_caching);
    EXPECT_TRUE(source.last_caching);
  }
  {
    RecordingExtractor extractor(source);
    this->config.disable_caching = true;
    extractor.extract_to_stream(this->input, this->output, this->config);
    EXPECT_FALSE(extractor.device_caching);
    EXPECT_FALSE(source.last_caching);
  }
}

TEST_F(ExtractorTest, WrongPassword)
{
  FakeDocumentSource source({0, 0});
  source.expected_password = "secret";
  RecordingExtractor extractor(source);
  this->config.password = "guess";
  EXPECT_THROW(
    extractor.extract_to_stream(this->input, this->output, this->config),
    pdf::Document::DecryptionError
  );
  EXPECT_EQ(extractor.log, EventLog({"device text"}));
  EXPECT_EQ(this->output.str(), "");
}

TEST_F(ExtractorTest, RightPassword)
{
  FakeDocumentSource source({0, 0});
  source.expected_password = "secret";
  RecordingExtractor extractor(source);
  this->config.password = "secret";
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(this->output.str(), "[0][1]");
}

TEST_F(ExtractorTest, ExtractionNotAllowed)
{
  FakeDocumentSource source({0});
  source.extractable = false;
  RecordingExtractor extractor(source);
  EXPECT_THROW(
    extractor.extract_to_stream(this->input, this->output, this->config),
    pdf::Document::PermissionError
  );
  EXPECT_EQ(this->output.str(), "");
}

TEST_F(ExtractorTest, InvalidConfigIsRejectedBeforeOpening)
{
  FakeDocumentSource source({0});
  RecordingExtractor extractor(source);
  this->config.max_pages = -3;
  EXPECT_THROW(
    extractor.extract_to_stream(this->input, this->output, this->config),
    ExtractionConfig::Error
  );
  EXPECT_EQ(source.n_calls, 0);
  EXPECT_TRUE(extractor.log.empty());
}

TEST_F(ExtractorTest, DeviceCodec)
{
  FakeDocumentSource source({0});
  RecordingExtractor extractor(source);
  this->config.codec = "UTF-16BE";
  extractor.extract_to_stream(this->input, this->output, this->config);
  EXPECT_EQ(this->output.str(), std::string("\0[\0" "0\0]", 6));
}


/* class pdf::Device
 * =================
 */

TEST(Device, ClosedDeviceRejectsEverything)
{
  pdf::ResourceManager resource_manager(true);
  std::ostringstream sink;
  EventLog log;
  int n_released = 0;
  RecordingDevice device(resource_manager, sink, "utf-8", log, n_released);
  pdf::Page page(nullptr, 0, 0, true);
  EXPECT_FALSE(device.is_closed());
  device.begin_page(page);
  device.end_page(page);
  device.close();
  EXPECT_TRUE(device.is_closed());
  EXPECT_THROW(device.begin_page(page), pdf::Device::Closed);
  EXPECT_THROW(device.end_page(page), pdf::Device::Closed);
  EXPECT_THROW(device.close(), pdf::Device::Closed);
  EXPECT_EQ(log, EventLog({"begin 0", "end 0", "close"}));
}

TEST(Device, FormatBbox)
{
  EXPECT_EQ(pdf::format_bbox(0, 0, 612, 792), "0.000,0.000,612.000,792.000");
  EXPECT_EQ(pdf::format_bbox(1.5, -2.25, 3.0006, 4), "1.500,-2.250,3.001,4.000");
}

TEST(Device, PageBboxWithoutDocument)
{
  pdf::Page page(nullptr, 0, 0, true);
  EXPECT_EQ(pdf::get_page_bbox(page), "0.000,0.000,0.000,0.000");
}

TEST(NormalizeRotation, Values)
{
  EXPECT_EQ(pdf::normalize_rotation(0), 0);
  EXPECT_EQ(pdf::normalize_rotation(90), 90);
  EXPECT_EQ(pdf::normalize_rotation(360), 0);
  EXPECT_EQ(pdf::normalize_rotation(-90), 270);
  EXPECT_EQ(pdf::normalize_rotation(-450), 270);
  EXPECT_EQ(pdf::normalize_rotation(810), 90);
}

// vim:ts=2 sts=2 sw=2 et
