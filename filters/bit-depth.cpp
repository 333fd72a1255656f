//  bit-depth.cpp -- reduce image sample size
//  Copyright (C) 2015  SEIKO EPSON CORPORATION
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

#include <cstring>
#include <vector>

#include <boost/assert.hpp>
#include <boost/cstdint.hpp>

#include <scan2pdf/log.hpp>

#include "bit-depth.hpp"

namespace scan2pdf {
namespace _flt_ {

namespace {

octet
msb (const octet *sample)
{
  boost::uint16_t v;
  std::memcpy (&v, sample, sizeof (v));
  return octet (v >> 8);
}

}       // namespace

bit_depth::bit_depth ()
  : reduce_(false)
  , carry_(0)
  , carrying_(false)
{}

streamsize
bit_depth::write (const octet *data, streamsize n)
{
  BOOST_ASSERT ((data && 0 < n) || 0 == n);

  if (!reduce_)
    {
      streamsize left = n;
      while (0 < left)
        {
          streamsize m = output_->write (data + (n - left), left);
          left -= m;
        }
      return n;
    }

  std::vector< octet > buf;
  buf.reserve (n / 2 + 1);

  streamsize i = 0;
  if (carrying_ && 0 < n)
    {
      octet sample[2] = { carry_, data[0] };
      buf.push_back (msb (sample));
      carrying_ = false;
      i = 1;
    }
  for (; i + 1 < n; i += 2)
    {
      buf.push_back (msb (data + i));
    }
  if (i < n)
    {
      carry_ = data[i];
      carrying_ = true;
    }

  const octet *p = buf.empty () ? NULL : &buf[0];
  streamsize left = buf.size ();
  while (0 < left)
    {
      streamsize m = output_->write (p, left);
      p += m;
      left -= m;
    }
  return n;
}

void
bit_depth::boi (const context& ctx)
{
  reduce_ = (ctx.is_raster_image () && 16 == ctx.depth ());
  carrying_ = false;

  ctx_ = ctx;
  if (reduce_)
    {
      ctx_.depth (8);
      log::debug ("reducing 16-bit samples to 8 bits");
    }
}

void
bit_depth::eoi (const context& ctx)
{
  if (carrying_)
    log::alert ("dropping incomplete 16-bit sample");

  ctx_ = ctx;
  if (reduce_) ctx_.depth (8);
}

}       // namespace _flt_
}       // namespace scan2pdf
