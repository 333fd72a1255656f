//  stream.cpp -- image data consuming streams
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "scan2pdf/stream.hpp"

namespace scan2pdf {

using std::logic_error;

streamsize
stream::write (const octet *data, streamsize n)
{
  if (!is_complete ())
    BOOST_THROW_EXCEPTION (logic_error ("stream has no device"));

  return out_bottom_->write (data, n);
}

void
stream::mark (traits::int_type c, const context& ctx)
{
  if (!is_complete ())
    BOOST_THROW_EXCEPTION (logic_error ("stream has no device"));

  out_bottom_->mark (c, ctx);
}

void
stream::push (odevice::ptr device)
{
  attach (device);
  device_ = device;
}

void
stream::push (filter::ptr filter)
{
  attach (filter);
  filter_ = filter;
}

streamsize
stream::buffer_size () const
{
  return (out_bottom_
          ? out_bottom_->buffer_size ()
          : output::buffer_size ());
}

odevice::ptr
stream::get_device () const
{
  return device_;
}

bool
stream::is_complete () const
{
  return bool (device_);
}

void
stream::attach (output::ptr out)
{
  if (is_complete ())
    BOOST_THROW_EXCEPTION (logic_error ("stream already complete"));

  if (filter_)
    filter_->open (out);
  else
    out_bottom_ = out;
}

}       // namespace scan2pdf
