//  iobase.cpp -- input and output API for image data sequences
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

#include <algorithm>

#include <boost/scoped_array.hpp>

#include "scan2pdf/iobase.hpp"

namespace scan2pdf {

input::input (const context& ctx)
  : buffer_size_(default_buffer_size), ctx_(ctx)
{}

input::~input ()
{}

streamsize
input::buffer_size () const
{
  return buffer_size_;
}

context
input::get_context () const
{
  return ctx_;
}

output::output ()
  : buffer_size_(default_buffer_size)
{}

output::~output ()
{}

void
output::mark (traits::int_type c, const context& ctx)
{
  if (!traits::is_marker (c)) return;

  /**/ if (traits::bos () == c) bos (ctx);
  else if (traits::boi () == c) boi (ctx);
  else if (traits::eoi () == c) eoi (ctx);
  else if (traits::eos () == c) eos (ctx);
  else if (traits::eof () == c) eof (ctx);
}

streamsize
output::buffer_size () const
{
  return buffer_size_;
}

context
output::get_context () const
{
  return ctx_;
}

void
output::bos (const context&)
{}

void
output::boi (const context&)
{}

void
output::eoi (const context&)
{}

void
output::eos (const context&)
{}

void
output::eof (const context&)
{}

streamsize
operator| (input& iref, output& oref)
{
  streamsize rv = iref.marker ();
  if (traits::bos () != rv) return rv;

  oref.mark (traits::bos (), iref.get_context ());
  while (   traits::eos () != rv
         && traits::eof () != rv)
    {
      rv = iref >> oref;
    }
  oref.mark (rv, iref.get_context ());
  return rv;
}

streamsize
operator>> (input& iref, output& oref)
{
  streamsize n = iref.marker ();
  if (traits::boi () != n) return n;

  streamsize buffer_size = std::max (iref.buffer_size (),
                                     oref.buffer_size ());
  boost::scoped_array< octet > data (new octet[buffer_size]);

  oref.mark (traits::boi (), iref.get_context ());
  n = iref.read (data.get (), buffer_size);
  while (   traits::eoi () != n
         && traits::eof () != n)
    {
      const octet *p = data.get ();

      while (0 < n)
        {
          streamsize m = oref.write (p, n);
          p += m;
          n -= m;
        }
      n = iref.read (data.get (), buffer_size);
    }
  oref.mark (n, iref.get_context ());
  return n;
}

}       // namespace scan2pdf
