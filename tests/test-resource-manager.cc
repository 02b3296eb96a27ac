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

#include "resource-manager.hh"

TEST(ResourceManager, SubsetTagIsRemoved)
{
  pdf::ResourceManager resource_manager(true);
  EXPECT_EQ(resource_manager.get_font_name("ABCDEF+Helvetica"), "Helvetica");
  EXPECT_EQ(resource_manager.get_font_name("Helvetica"), "Helvetica");
  EXPECT_EQ(resource_manager.get_font_name("abcdef+Helvetica"), "abcdef+Helvetica");
  EXPECT_EQ(resource_manager.get_font_name("ABC+Helvetica"), "ABC+Helvetica");
}

TEST(ResourceManager, UnnamedFont)
{
  pdf::ResourceManager resource_manager(true);
  EXPECT_EQ(resource_manager.get_font_name(""), "unknown");
  EXPECT_EQ(resource_manager.get_font_name(static_cast<const pdf::String *>(nullptr)), "unknown");
}

TEST(ResourceManager, FontNamesAreCached)
{
  pdf::ResourceManager resource_manager(true);
  EXPECT_TRUE(resource_manager.caching());
  for (int i = 0; i < 5; i++)
    resource_manager.get_font_name("XYZXYZ+Times-Roman");
  EXPECT_EQ(resource_manager.get_n_font_resolutions(), 1U);
}

TEST(ResourceManager, NoCaching)
{
  pdf::ResourceManager resource_manager(false);
  EXPECT_FALSE(resource_manager.caching());
  for (int i = 0; i < 5; i++)
    EXPECT_EQ(resource_manager.get_font_name("XYZXYZ+Times-Roman"), "Times-Roman");
  EXPECT_EQ(resource_manager.get_n_font_resolutions(), 5U);
}

TEST(ResourceManager, Images)
{
  pdf::ResourceManager resource_manager(true);
  pdf::Ref ref = { 12, 0 };
  pdf::Ref other = { 12, 1 };
  std::string name;
  EXPECT_FALSE(resource_manager.find_image(ref, name));
  resource_manager.add_image(ref, "img-12-0.png");
  ASSERT_TRUE(resource_manager.find_image(ref, name));
  EXPECT_EQ(name, "img-12-0.png");
  EXPECT_FALSE(resource_manager.find_image(other, name));
}

TEST(ResourceManager, ImagesWithoutCaching)
{
  pdf::ResourceManager resource_manager(false);
  pdf::Ref ref = { 12, 0 };
  std::string name;
  resource_manager.add_image(ref, "img-12-0.png");
  EXPECT_FALSE(resource_manager.find_image(ref, name));
}

// vim:ts=2 sts=2 sw=2 et
