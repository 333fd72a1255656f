//  device.cpp -- interface implementations for image data producers and consumers
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "scan2pdf/device.hpp"
#include "scan2pdf/log.hpp"

namespace scan2pdf {

using std::logic_error;

idevice::idevice (const context& ctx)
  : input (ctx)
  , work_in_progress_(false)
  , cancel_requested_(work_in_progress_)
{}

streamsize
idevice::read (octet *data, streamsize n)
{
  try
    {
      return read_(data, n);
    }
  catch (...)
    {
      last_marker_ = traits::eof ();

      work_in_progress_ = false;
      cancel_requested_ = work_in_progress_;

      finish_sequence ();
      throw;
    }
}

streamsize
idevice::read_(octet *data, streamsize n)
{
  const streamsize prev = last_marker_;

  if (traits::boi () == prev)
    {
      if (0 >= n) return prev;

      streamsize rv = sgetn (data, n);
      if (0 < rv) return rv;

      finish_image ();
      last_marker_ = (0 == rv ? traits::eoi () : traits::eof ());
    }
  else
    {
      last_marker_ = next_marker_(prev);
    }

  if (   traits::eos () == last_marker_
      || traits::eof () == last_marker_)
    {
      end_sequence_(prev);
    }

  if (prev != last_marker_)
    log::debug ("idevice: marker %1% -> %2%") % prev % last_marker_;

  return last_marker_;
}

//! Works out where to go from a marker that is not traits::boi()
streamsize
idevice::next_marker_(streamsize prev)
{
  if (traits::bos () == prev)
    return (set_up_image () ? traits::boi () : traits::eos ());

  if (traits::eoi () == prev)
    return (is_consecutive () && obtain_media () && set_up_image ()
            ? traits::boi () : traits::eos ());

  if (traits::eos () != prev && traits::eof () != prev)
    BOOST_THROW_EXCEPTION
      (logic_error ("idevice: no transition from current marker"));

  work_in_progress_ = true;
  return (set_up_sequence () && obtain_media ()
          ? traits::bos () : traits::eof ());
}

//! Settles a pending cancellation request once a sequence ends
void
idevice::end_sequence_(streamsize prev)
{
  work_in_progress_ = false;
  if (cancel_requested_) last_marker_ = traits::eof ();
  cancel_requested_ = work_in_progress_;

  if (prev != last_marker_) finish_sequence ();
}

streamsize
idevice::marker ()
{
  return read (NULL, 0);
}

void
idevice::cancel ()
{
  cancel_requested_ = work_in_progress_;
}

bool
idevice::set_up_sequence ()
{
  return true;
}

bool
idevice::is_consecutive () const
{
  return false;
}

bool
idevice::obtain_media ()
{
  return true;
}

bool
idevice::set_up_image ()
{
  return false;
}

void
idevice::finish_image ()
{}

void
idevice::finish_sequence ()
{}

streamsize
idevice::sgetn (octet *, streamsize)
{
  return 0;
}

bool
idevice::cancel_requested () const
{
  return cancel_requested_;
}

void
odevice::mark (traits::int_type c, const context& ctx)
{
  output::mark (c, ctx);

  if (traits::is_marker (c))
    last_marker_ = c;
}

}       // namespace scan2pdf
