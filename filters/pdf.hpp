//  pdf.hpp -- PDF image format support
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
//  Copyright (C) 2026  scan2pdf developers
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
//
//  This file is part of the 'scan2pdf' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef filters_pdf_hpp_
#define filters_pdf_hpp_

#include <string>

#include <scan2pdf/filter.hpp>

#include "pdf/array.hpp"
#include "pdf/writer.hpp"

namespace scan2pdf {
namespace _flt_ {

//! Puts all images of a scan sequence in a single PDF document
/*! Accepts JPEG images as well as 1-bit and 8-bit raster images.
 *  JPEG data is embedded with the \c DCTDecode filter.  Raster data
 *  is embedded as is.  For 1-bit images a set bit means black, as
 *  scanners deliver them, and the image gets a \c /Decode array that
 *  inverts the PDF default.
 *
 *  Each image gets a page of its own, sized so that the image prints
 *  at its scan resolution.  Images without resolution information
 *  are assumed to be at 72 dpi.
 *
 *  The document catalog is output at the beginning of the sequence.
 *  Image data streams straight into the image XObject.  The page that
 *  shows the image is completed at the end of the image.  The page
 *  tree and file trailer follow at the end of the sequence.
 */
class pdf
  : public filter
{
public:
  pdf ();

  streamsize write (const octet *data, streamsize n);

  //! Number of pages completed in the current sequence
  context::size_type page_count () const;

protected:
  void bos (const context& ctx);
  void boi (const context& ctx);
  void eoi (const context& ctx);
  void eos (const context& ctx);

private:
  void write_preamble ();
  void write_image_header (const context& ctx);
  void write_page (const context& ctx);

  _pdf_::writer doc_;

  std::size_t info_num_;
  std::size_t catalog_num_;
  std::size_t pages_num_;
  std::size_t image_num_;
  std::size_t height_num_;

  _pdf_::array kids_;
  std::string content_type_;
  bool preamble_pending_;
};

}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_pdf_hpp_ */
