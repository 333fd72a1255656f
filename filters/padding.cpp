//  padding.cpp -- remove scan line padding
//  Copyright (C) 2012, 2013, 2015  SEIKO EPSON CORPORATION
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
#include <stdexcept>

#include <boost/assert.hpp>
#include <boost/throw_exception.hpp>

#include <scan2pdf/log.hpp>

#include "padding.hpp"

namespace scan2pdf {
namespace _flt_ {

padding::padding ()
  : w_padding_(0)
  , lines_(0)
  , offset_(0)
{}

streamsize
padding::write (const octet *data, streamsize n)
{
  BOOST_ASSERT ((data && 0 < n) || 0 == n);

  const context::size_type width = ctx_.scan_width ();
  const context::size_type line  = width + w_padding_;

  streamsize seen = 0;
  while (seen < n && lines_ < ctx_.height ())
    {
      streamsize count = std::min< streamsize > (n - seen, line - offset_);

      if (offset_ < width)
        {
          streamsize octets = std::min< streamsize > (count, width - offset_);
          const octet *p = data + seen;
          while (0 < octets)
            {
              streamsize m = output_->write (p, octets);
              p += m;
              octets -= m;
            }
        }

      seen    += count;
      offset_ += count;
      if (line == offset_)
        {
          offset_ = 0;
          ++lines_;
        }
    }

  return n;                     // padding lines are dropped on the floor
}

void
padding::boi (const context& ctx)
{
  if (!ctx.is_raster_image ())
    BOOST_THROW_EXCEPTION
      (std::logic_error ("padding removal needs raster image data"));

  if ((0 != ctx.padding_octets ()
       && context::unknown_size == ctx.width ())
      || (0 != ctx.padding_lines ()
          && context::unknown_size == ctx.height ()))
    BOOST_THROW_EXCEPTION
      (std::logic_error ("padding removal needs a known image size"));

  w_padding_ = ctx.padding_octets ();
  lines_  = 0;
  offset_ = 0;

  ctx_ = ctx;
  ctx_.width (ctx.width ());
  ctx_.height (ctx.height ());

  if (w_padding_ || ctx.padding_lines ())
    log::debug ("removing %1% octets per scan line, %2% scan lines")
      % w_padding_ % ctx.padding_lines ();
}

void
padding::eoi (const context& ctx)
{
  if (ctx.width () < ctx_.width ())
    {
      context::size_type octets = ctx_.scan_width () - ctx.scan_width ();
      log::alert ("%1% padding octets remain per scan line") % octets;
      ctx_.width (ctx.width (), octets);
    }

  if (ctx.height () < ctx_.height ())
    {
      context::size_type lines = ctx_.height () - ctx.height ();
      log::alert ("%1% padding scan lines remain") % lines;
      ctx_.height (ctx.height (), lines);
    }
  else if (lines_ < ctx_.height ())
    {
      log::alert ("image is %1% scan lines short")
        % (ctx_.height () - lines_);
      ctx_.height (lines_);
    }
}

}       // namespace _flt_
}       // namespace scan2pdf
