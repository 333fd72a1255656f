//  jpeg.hpp -- JPEG image compression
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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

#ifndef filters_jpeg_hpp_
#define filters_jpeg_hpp_

#include <cstdio>
#include <vector>

extern "C" {
#include <jpeglib.h>
}

#include <scan2pdf/filter.hpp>

namespace scan2pdf {
namespace _flt_ {
namespace jpeg {

//!  Turn a sequence of image data into JPEG format
/*!  Only 8-bit gray and RGB raster images are compressed.  Anything
 *   else, 1-bit line-art in particular, passes through untouched so
 *   that consumers can decide how to deal with it based on the image
 *   context's content type.
 *
 *   Errors reported by the JPEG library are turned into exceptions.
 */
class compressor
  : public filter
{
public:
  explicit compressor (int quality = default_quality);
  ~compressor ();

  streamsize write (const octet *data, streamsize n);

  int quality () const;

  enum { default_quality = 75 };

protected:
  void bos (const context& ctx);
  void boi (const context& ctx);
  void eoi (const context& ctx);
  void eos (const context& ctx);
  void eof (const context& ctx);

private:
  void    init_destination ();
  boolean empty_output_buffer ();
  void    term_destination ();

  void error_exit (j_common_ptr cinfo);
  void output_message (j_common_ptr cinfo);

  //! Passes \a n octets of compressed \a data to the output
  void flush (const JOCTET *data, size_t n);

  int  quality_;
  bool compressing_;
  bool pass_through_;

  struct jpeg_compress_struct cinfo_;
  struct jpeg_error_mgr       jerr_;
  struct jpeg_destination_mgr dmgr_;

  //! Work buffer for compressed data
  std::vector< JOCTET > jbuf_;

  //! Partial scan line carried over between write() calls
  std::vector< octet > line_;
  streamsize line_fill_;

  friend struct callback;
};

}       // namespace jpeg
}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_jpeg_hpp_ */
