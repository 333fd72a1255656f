//  jpeg.cpp -- JPEG image compression
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <boost/assert.hpp>
#include <boost/static_assert.hpp>
#include <boost/throw_exception.hpp>

#include <scan2pdf/log.hpp>

#include "jpeg.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace jpeg {

BOOST_STATIC_ASSERT ((sizeof (JSAMPLE) == sizeof (octet)));
BOOST_STATIC_ASSERT ((sizeof (JOCTET)  == sizeof (octet)));

//! Callback wrappers for use by the JPEG library
/*! The wrappers are collected in a struct so that they can reach the
 *  compressor's private API.  The compressor instance is recovered
 *  from the JPEG library's client data.
 */
struct callback
{
  static compressor *
  self (j_common_ptr cinfo)
  {
    compressor *rv = static_cast< compressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo->err == &rv->jerr_);
    return rv;
  }

  static void
  error_exit_(j_common_ptr cinfo)
  {
    self (cinfo)->error_exit (cinfo);
  }

  static void
  output_message_(j_common_ptr cinfo)
  {
    self (cinfo)->output_message (cinfo);
  }

  static void
  init_destination_(j_compress_ptr cinfo)
  {
    self (reinterpret_cast< j_common_ptr > (cinfo))->init_destination ();
  }

  static boolean
  empty_output_buffer_(j_compress_ptr cinfo)
  {
    return self (reinterpret_cast< j_common_ptr > (cinfo))
      ->empty_output_buffer ();
  }

  static void
  term_destination_(j_compress_ptr cinfo)
  {
    self (reinterpret_cast< j_common_ptr > (cinfo))->term_destination ();
  }
};

compressor::compressor (int quality)
  : quality_(std::max (0, std::min (quality, 100)))
  , compressing_(false)
  , pass_through_(false)
  , jbuf_(default_buffer_size)
  , line_fill_(0)
{
  // The error handler needs to be in place before the compressor is
  // created because creation may fail.

  jpeg_std_error (&jerr_);
  jerr_.error_exit     = &callback::error_exit_;
  jerr_.output_message = &callback::output_message_;

  cinfo_.client_data = this;
  cinfo_.err         = &jerr_;

  jpeg_create_compress (&cinfo_);

  dmgr_.init_destination    = &callback::init_destination_;
  dmgr_.empty_output_buffer = &callback::empty_output_buffer_;
  dmgr_.term_destination    = &callback::term_destination_;

  cinfo_.dest = &dmgr_;
}

compressor::~compressor ()
{
  jpeg_destroy_compress (&cinfo_);
}

int
compressor::quality () const
{
  return quality_;
}

streamsize
compressor::write (const octet *data, streamsize n)
{
  BOOST_ASSERT ((data && 0 < n) || 0 == n);

  if (pass_through_)
    {
      const octet *p = data;
      streamsize left = n;
      while (0 < left)
        {
          streamsize m = output_->write (p, left);
          p += m;
          left -= m;
        }
      return n;
    }

  const streamsize line_size = ctx_.octets_per_line ();
  const streamsize rv = n;      // all data is consumed

  while (0 < n)
    {
      JSAMPROW row;

      if (0 == line_fill_ && line_size <= n)
        {
          // The JPEG library is not const correct
          row = const_cast< JSAMPROW >
            (reinterpret_cast< const JSAMPLE * > (data));
          data += line_size;
          n    -= line_size;
        }
      else
        {
          streamsize count = std::min (n, line_size - line_fill_);
          std::memcpy (&line_[line_fill_], data, count);
          data += count;
          n    -= count;
          line_fill_ += count;

          if (line_fill_ < line_size) break;

          row = reinterpret_cast< JSAMPROW > (&line_[0]);
          line_fill_ = 0;
        }

      if (cinfo_.next_scanline < cinfo_.image_height)
        {
          while (!jpeg_write_scanlines (&cinfo_, &row, 1))
            ;
        }
    }

  return rv;
}

void
compressor::bos (const context& ctx)
{
  ctx_ = ctx;
  log::trace ("JPEG quality %1%, %2% byte work buffer")
    % quality_ % jbuf_.size ();
}

void
compressor::boi (const context& ctx)
{
  pass_through_ = !(ctx.is_raster_image () && 8 == ctx.depth ());

  ctx_ = ctx;
  if (pass_through_)
    {
      log::debug ("JPEG compression skipped for %1%-bit images")
        % ctx.depth ();
      return;
    }

  // The JPEG library needs to know the image height up front.

  if (!(0 < ctx.width () && 0 < ctx.height ()))
    {
      BOOST_THROW_EXCEPTION
        (std::logic_error ("JPEG compression needs known image size"));
    }

  ctx_.content_type ("image/jpeg");

  cinfo_.image_width      = ctx.width ();
  cinfo_.image_height     = ctx.height ();
  cinfo_.input_components = ctx.comps ();
  cinfo_.in_color_space   = (3 == ctx.comps () ? JCS_RGB : JCS_GRAYSCALE);

  jpeg_set_defaults (&cinfo_);
  jpeg_set_quality  (&cinfo_, quality_, true);

  if (0 < ctx.resolution ())
    {
      cinfo_.density_unit = 1;  // dots per inch
      cinfo_.X_density = ctx.resolution ();
      cinfo_.Y_density = ctx.resolution ();
    }

  line_.assign (ctx.octets_per_line (), 0);
  line_fill_ = 0;

  jpeg_start_compress (&cinfo_, true);
  compressing_ = true;
}

void
compressor::eoi (const context& ctx)
{
  ctx_ = ctx;
  if (pass_through_) return;

  ctx_.content_type ("image/jpeg");

  // Images that are shorter than promised get white scan lines so
  // that the JPEG library can finish the image.

  if (cinfo_.next_scanline < cinfo_.image_height)
    {
      log::alert ("JPEG image short by %1% scan lines")
        % (cinfo_.image_height - cinfo_.next_scanline);

      line_.assign (line_.size (), octet (0xff));
      JSAMPROW row = reinterpret_cast< JSAMPROW > (&line_[0]);
      while (cinfo_.next_scanline < cinfo_.image_height)
        jpeg_write_scanlines (&cinfo_, &row, 1);
    }
  ctx_.height (cinfo_.image_height);

  jpeg_finish_compress (&cinfo_);
  compressing_ = false;
}

void
compressor::eos (const context& ctx)
{
  ctx_ = ctx;
}

void
compressor::eof (const context& ctx)
{
  ctx_ = ctx;
  if (compressing_)
    {
      jpeg_abort_compress (&cinfo_);
      compressing_ = false;
    }
}

void
compressor::init_destination ()
{
  dmgr_.next_output_byte = &jbuf_[0];
  dmgr_.free_in_buffer   = jbuf_.size ();
}

//! \note  The current values of \c next_output_byte and \c
//!        free_in_buffer are to be ignored as per the libjpeg docs.
boolean
compressor::empty_output_buffer ()
{
  flush (&jbuf_[0], jbuf_.size ());
  init_destination ();
  return true;
}

void
compressor::term_destination ()
{
  flush (&jbuf_[0], jbuf_.size () - dmgr_.free_in_buffer);
}

void
compressor::flush (const JOCTET *data, size_t n)
{
  const octet *p = reinterpret_cast< const octet * > (data);

  while (0 < n)
    {
      streamsize m = output_->write (p, n);
      p += m;
      n -= m;
    }
}

void
compressor::error_exit (j_common_ptr cinfo)
{
  char msg[JMSG_LENGTH_MAX];

  jerr_.format_message (cinfo, msg);
  jpeg_abort (cinfo);
  compressing_ = false;

  log::fatal (msg);

  BOOST_THROW_EXCEPTION (std::runtime_error (msg));
}

void
compressor::output_message (j_common_ptr cinfo)
{
  char msg[JMSG_LENGTH_MAX];

  jerr_.format_message (cinfo, msg);

  log::error (msg);
}

}       // namespace jpeg
}       // namespace _flt_
}       // namespace scan2pdf
