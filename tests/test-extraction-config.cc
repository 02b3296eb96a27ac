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

#include <string>

#include "extraction-config.hh"

TEST(ExtractionConfig, Defaults)
{
  ExtractionConfig config;
  EXPECT_EQ(config.output_type, OutputType::text);
  EXPECT_EQ(config.codec, "utf-8");
  ASSERT_TRUE(config.layout_params != nullptr);
  EXPECT_TRUE(config.page_numbers.empty());
  EXPECT_EQ(config.max_pages, 0);
  EXPECT_EQ(config.password, "");
  EXPECT_EQ(config.rotation, 0);
  EXPECT_EQ(config.scale, 1.0);
  EXPECT_EQ(config.layout_mode, LayoutMode::normal);
  EXPECT_FALSE(config.strip_control);
  EXPECT_EQ(config.output_dir, "");
  EXPECT_TRUE(config.caching());
  EXPECT_NO_THROW(config.validate());
}

TEST(ExtractionConfig, DefaultLayoutParams)
{
  LayoutParams params;
  EXPECT_FALSE(params.physical_layout);
  EXPECT_EQ(params.fixed_pitch, 0.0);
  EXPECT_EQ(params.min_column_spacing, 0.7);
  EXPECT_FALSE(params.discard_diagonal);
}

TEST(ExtractionConfig, CopyIsDeep)
{
  ExtractionConfig config;
  config.layout_params->min_column_spacing = 2.0;
  config.page_numbers.insert(4);
  config.page_ranges.push_back({6, 9});
  ExtractionConfig copy(config);
  config.layout_params->min_column_spacing = 3.0;
  ASSERT_TRUE(copy.layout_params != nullptr);
  EXPECT_EQ(copy.layout_params->min_column_spacing, 2.0);
  EXPECT_EQ(copy.page_numbers.count(4), 1U);
  EXPECT_EQ(copy.page_ranges, pdf::PageRanges({{6, 9}}));
  config.layout_params.reset();
  copy = config;
  EXPECT_TRUE(copy.layout_params == nullptr);
}

TEST(ExtractionConfig, NegativeMaxPages)
{
  ExtractionConfig config;
  config.max_pages = -1;
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, NonPositiveScale)
{
  ExtractionConfig config;
  config.scale = 0;
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
  config.scale = -2;
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, NegativePageNumber)
{
  ExtractionConfig config;
  config.page_numbers.insert(-1);
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, InvalidPageRange)
{
  ExtractionConfig config;
  config.page_ranges.push_back({-1, 3});
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
  config.page_ranges[0] = {5, 4};
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
  config.page_ranges[0] = {0, 2147483646};
  EXPECT_NO_THROW(config.validate());
}

TEST(ExtractionConfig, NegativeLayoutKnobs)
{
  ExtractionConfig config;
  config.layout_params->fixed_pitch = -1;
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
  config.layout_params->fixed_pitch = 0;
  config.layout_params->min_column_spacing = -0.5;
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, NoLayoutIsValid)
{
  ExtractionConfig config;
  config.layout_params.reset();
  EXPECT_NO_THROW(config.validate());
}

TEST(ExtractionConfig, InvalidOutputType)
{
  ExtractionConfig config;
  config.output_type = static_cast<OutputType>(42);
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, InvalidLayoutMode)
{
  ExtractionConfig config;
  config.layout_mode = static_cast<LayoutMode>(42);
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, Codec)
{
  ExtractionConfig config;
  config.codec = "latin1";
  EXPECT_NO_THROW(config.validate());
  config.codec = "";
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
  config.codec = "no-such-codec";
  EXPECT_THROW(config.validate(), ExtractionConfig::Error);
}

TEST(ExtractionConfig, ParseOutputType)
{
  EXPECT_EQ(parse_output_type("text"), OutputType::text);
  EXPECT_EQ(parse_output_type("xml"), OutputType::xml);
  EXPECT_EQ(parse_output_type("HTML"), OutputType::html);
  EXPECT_EQ(parse_output_type("tag"), OutputType::tag);
  EXPECT_THROW(parse_output_type("pdf"), ExtractionConfig::Error);
  EXPECT_THROW(parse_output_type(""), ExtractionConfig::Error);
  EXPECT_THROW(parse_output_type("\xc5\xbbml"), ExtractionConfig::Error);
}

TEST(ExtractionConfig, ParseLayoutMode)
{
  EXPECT_EQ(parse_layout_mode("normal"), LayoutMode::normal);
  EXPECT_EQ(parse_layout_mode("exact"), LayoutMode::exact);
  EXPECT_EQ(parse_layout_mode("Loose"), LayoutMode::loose);
  EXPECT_THROW(parse_layout_mode("tight"), ExtractionConfig::Error);
  EXPECT_THROW(parse_layout_mode("\xe9xact"), ExtractionConfig::Error);
}

TEST(ExtractionConfig, Names)
{
  EXPECT_STREQ(get_output_type_name(OutputType::tag), "tag");
  EXPECT_STREQ(get_output_type_name(parse_output_type("xml")), "xml");
  EXPECT_STREQ(get_layout_mode_name(LayoutMode::exact), "exact");
}

// vim:ts=2 sts=2 sw=2 et
