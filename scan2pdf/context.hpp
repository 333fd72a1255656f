//  context.hpp -- image geometry and pixel format information
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
#ifndef scan2pdf_context_hpp_
#define scan2pdf_context_hpp_

#include <sys/types.h>

#include <string>

namespace scan2pdf {

//! Describes the image data flowing through a stream
/*! A context travels along with the sequence markers.  Producers fill
 *  it in at the begin of an image, filters that change the data hand
 *  on a modified copy and consumers use it to interpret the octets.
 *
 *  Raster data is laid out one scan line after another.  Each line
 *  holds width() pixels of comps() components of depth() bits,
 *  packed without gaps and followed by padding_octets() octets that
 *  carry no image data.  The image is followed by padding_lines()
 *  such lines.
 */
class context
{
public:
  typedef ssize_t size_type;

  enum {
    unknown_size = -1,
  };

  //! Pixel types that can be handed to the constructor
  enum pixel_type {
    unknown_type = -1,
    MONO,
    GRAY8, GRAY16,
    RGB8 , RGB16 ,
  };

  //! Creates a raster image description
  /*! \throws  std::logic_error if \a type is not supported
   */
  context (const size_type& width  = unknown_size,
           const size_type& height = unknown_size,
           const pixel_type& type = RGB8);

  //! A content type identifier as specified in RFC 2046
  std::string content_type () const;
  void content_type (const std::string& type);

  //! Tells whether the data is uncompressed pixel data
  bool is_raster_image () const;
  bool is_rgb () const;

  //! Image width in pixels
  size_type width () const;
  //! Image height in pixels
  size_type height () const;
  //! Bits per colour component
  size_type depth () const;
  //! Colour components per pixel
  short comps () const;
  //! Dots per inch, zero if not known
  size_type resolution () const;

  //! Octets of image data in a scan line
  size_type scan_width () const;

  size_type octets_per_line () const;
  size_type octets_per_image () const;

  size_type padding_octets () const;
  size_type padding_lines () const;

  void width (const size_type& pixels, const size_type& padding = 0);
  void height (const size_type& pixels, const size_type& padding = 0);

  //! Changes the bit depth while keeping the colour components
  /*! \throws  std::logic_error for combinations that have no
   *           corresponding pixel_type
   */
  void depth (const size_type& bits);

  void resolution (const size_type& dpi);

private:
  std::string content_type_;

  size_type width_;
  size_type height_;
  size_type w_padding_;
  size_type h_padding_;

  size_type depth_;
  short     comps_;

  size_type resolution_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_context_hpp_ */
