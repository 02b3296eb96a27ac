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

#ifndef PDF2TXT_RESOURCE_MANAGER_HH
#define PDF2TXT_RESOURCE_MANAGER_HH

#include <map>
#include <string>
#include <utility>

#include "pdf-backend.hh"

namespace pdf
{

/* class pdf::ResourceManager
 * ==========================
 *
 * Per-run store of resources shared by the interpreter and the output
 * device across pages. With caching disabled every lookup misses.
 */

  class ResourceManager
  {
  private:
    ResourceManager(const ResourceManager &) = delete;
    ResourceManager& operator=(const ResourceManager &) = delete;
  protected:
    typedef std::pair<int, int> ObjectKey;
    bool caching_enabled;
    std::map<std::string, std::string> font_names;
    std::map<ObjectKey, std::string> image_names;
    unsigned long n_font_resolutions;
    static std::string resolve_font_name(const std::string &raw_name);
  public:
    explicit ResourceManager(bool caching);
    bool caching() const
    {
      return this->caching_enabled;
    }
    /* Font name with any subset tag ("ABCDEF+") removed. */
    std::string get_font_name(const std::string &raw_name);
    std::string get_font_name(const pdf::String *raw_name);
    bool find_image(const pdf::Ref &ref, std::string &file_name) const;
    void add_image(const pdf::Ref &ref, const std::string &file_name);
    unsigned long get_n_font_resolutions() const
    {
      return this->n_font_resolutions;
    }
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
