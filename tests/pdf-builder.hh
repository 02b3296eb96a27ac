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

#ifndef PDF2TXT_TESTS_PDF_BUILDER_HH
#define PDF2TXT_TESTS_PDF_BUILDER_HH

#include <string>
#include <vector>

namespace testing_pdf
{

/* class testing_pdf::Builder
 * ==========================
 *
 * Writes small PDF documents with Helvetica text, for the tests.
 */

  class Builder
  {
  protected:
    struct PageData
    {
      std::string content;
      int rotate;
    };
    std::vector<PageData> pages;
    bool with_image;
    std::string page_labels;
  public:
    Builder()
    : with_image(false)
    { }
    /* content is a content stream; /F1 is Helvetica and /Im1 is a 2×2
     * RGB image, if enabled */
    Builder &add_page(const std::string &content, int rotate = 0);
    Builder &add_text_page(const std::string &text, int rotate = 0);
    Builder &add_image();
    Builder &set_page_labels(const std::string &prefix);
    std::string build() const;
  };

  /* a page content stream showing one line of text */
  std::string text_content(const std::string &text, int x = 72, int y = 712);


/* class testing_pdf::TemporaryFile
 * ================================
 */

  class TemporaryFile
  {
  private:
    TemporaryFile(const TemporaryFile &) = delete;
    TemporaryFile& operator=(const TemporaryFile &) = delete;
  protected:
    std::string path;
  public:
    explicit TemporaryFile(const std::string &data);
    ~TemporaryFile();
    const std::string &get_path() const
    {
      return this->path;
    }
  };


/* class testing_pdf::TemporaryDirectory
 * =====================================
 */

  class TemporaryDirectory
  {
  private:
    TemporaryDirectory(const TemporaryDirectory &) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory &) = delete;
  protected:
    std::string path;
  public:
    TemporaryDirectory();
    ~TemporaryDirectory();
    const std::string &get_path() const
    {
      return this->path;
    }
    std::vector<std::string> list() const;
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
