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

#include "resource-manager.hh"

#include <cstddef>

pdf::ResourceManager::ResourceManager(bool caching)
: caching_enabled(caching),
  n_font_resolutions(0)
{ }

std::string pdf::ResourceManager::resolve_font_name(const std::string &raw_name)
{
  if (raw_name.empty())
    return "unknown";
  size_t plus = raw_name.find('+');
  if (plus == 6)
  {
    bool subset_tag = true;
    for (size_t i = 0; i < plus; i++)
      if (raw_name[i] < 'A' || raw_name[i] > 'Z')
        subset_tag = false;
    if (subset_tag && raw_name.length() > plus + 1)
      return raw_name.substr(plus + 1);
  }
  return raw_name;
}

std::string pdf::ResourceManager::get_font_name(const std::string &raw_name)
{
  if (this->caching_enabled)
  {
    auto it = this->font_names.find(raw_name);
    if (it != this->font_names.end())
      return it->second;
  }
  this->n_font_resolutions++;
  std::string name = resolve_font_name(raw_name);
  if (this->caching_enabled)
    this->font_names[raw_name] = name;
  return name;
}

std::string pdf::ResourceManager::get_font_name(const pdf::String *raw_name)
{
  if (raw_name == nullptr)
    return this->get_font_name(std::string());
  return this->get_font_name(std::string(pdf::get_c_string(raw_name), raw_name->getLength()));
}

bool pdf::ResourceManager::find_image(const pdf::Ref &ref, std::string &file_name) const
{
  if (!this->caching_enabled)
    return false;
  auto it = this->image_names.find(ObjectKey(ref.num, ref.gen));
  if (it == this->image_names.end())
    return false;
  file_name = it->second;
  return true;
}

void pdf::ResourceManager::add_image(const pdf::Ref &ref, const std::string &file_name)
{
  if (!this->caching_enabled)
    return;
  this->image_names[ObjectKey(ref.num, ref.gen)] = file_name;
}

// vim:ts=2 sts=2 sw=2 et
