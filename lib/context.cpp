//  context.cpp -- image geometry and pixel format information
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
#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "scan2pdf/context.hpp"
#include "scan2pdf/format.hpp"

namespace scan2pdf {

namespace {

const std::string raster_type ("image/x-raster");

std::logic_error
unsupported (context::size_type bits, short comps)
{
  return std::logic_error
    ((format ("unsupported pixel type (%1% bit, %2% components)")
      % bits % comps).str ());
}

bool
is_supported (context::size_type bits, short comps)
{
  if (1 != comps && 3 != comps) return false;

  return ((1 == bits && 1 == comps)
          || 8 == bits
          || 16 == bits);
}

}       // namespace

context::context (const size_type& width, const size_type& height,
                  const pixel_type& type)
  : content_type_(raster_type)
  , width_(width)
  , height_(height)
  , w_padding_(0)
  , h_padding_(0)
  , depth_(0)
  , comps_(0)
  , resolution_(0)
{
  switch (type)
    {
    case MONO:   depth_ =  1; comps_ = 1; break;
    case GRAY8:  depth_ =  8; comps_ = 1; break;
    case GRAY16: depth_ = 16; comps_ = 1; break;
    case RGB8:   depth_ =  8; comps_ = 3; break;
    case RGB16:  depth_ = 16; comps_ = 3; break;
    default:
      BOOST_THROW_EXCEPTION (unsupported (depth_, comps_));
    }
}

std::string
context::content_type () const
{
  return content_type_;
}

void
context::content_type (const std::string& type)
{
  content_type_ = type;
}

bool
context::is_raster_image () const
{
  return raster_type == content_type_;
}

bool
context::is_rgb () const
{
  return 3 == comps_;
}

context::size_type
context::width () const
{
  return width_;
}

context::size_type
context::height () const
{
  return height_;
}

context::size_type
context::depth () const
{
  return depth_;
}

short
context::comps () const
{
  return comps_;
}

context::size_type
context::resolution () const
{
  return resolution_;
}

context::size_type
context::scan_width () const
{
  if (unknown_size == width_) return unknown_size;

  return (width_ * comps_ * depth_ + 7) / 8;
}

context::size_type
context::octets_per_line () const
{
  if (unknown_size == width_) return unknown_size;

  return scan_width () + w_padding_;
}

context::size_type
context::octets_per_image () const
{
  if (unknown_size == width_ || unknown_size == height_)
    return unknown_size;

  return (height_ + h_padding_) * octets_per_line ();
}

context::size_type
context::padding_octets () const
{
  return w_padding_;
}

context::size_type
context::padding_lines () const
{
  return h_padding_;
}

void
context::width (const size_type& pixels, const size_type& padding)
{
  width_ = pixels;
  w_padding_ = padding;
}

void
context::height (const size_type& pixels, const size_type& padding)
{
  height_ = pixels;
  h_padding_ = padding;
}

void
context::depth (const size_type& bits)
{
  if (!is_supported (bits, comps_))
    BOOST_THROW_EXCEPTION (unsupported (bits, comps_));

  depth_ = bits;
}

void
context::resolution (const size_type& dpi)
{
  resolution_ = dpi;
}

}       // namespace scan2pdf
