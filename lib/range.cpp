//  range.cpp -- restrict option values to an interval
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

#include <sstream>

#include "scan2pdf/format.hpp"
#include "scan2pdf/range.hpp"

namespace scan2pdf {

range::range ()
{}

range::~range ()
{}

bool
range::admits (const value& v) const
{
  if (!v.is< quantity > ()) return false;

  quantity q = v;

  if (!(lower_ <= q && q <= upper_)) return false;

  if (quant_ == quantity ()
      || !(q.is_integral ()
           && lower_.is_integral ()
           && quant_.is_integral ()))
    return true;

  quantity steps = (q - lower_) / quant_;
  return steps.is_integral ();
}

namespace {

//! Shows whole amounts without a fractional part
std::string
brief (const quantity& q)
{
  std::ostringstream os;
  if (q.is_whole ())
    os << q.amount< quantity::integer_type > ();
  else
    os << q;
  return os.str ();
}

}       // namespace

std::string
range::describe (const std::string& unit) const
{
  std::string rv (brief (lower_) + ".." + brief (upper_) + unit);

  if (quant_ != quantity ())
    rv += (format (" (in steps of %1%)") % brief (quant_)).str ();

  return rv;
}

bool
range::is_unconstrained () const
{
  return false;
}

range *
range::bounds (const quantity& lo, const quantity& hi)
{
  return lower (lo) -> upper (hi);
}

range *
range::lower (const quantity& q)
{
  lower_ = q;
  return this;
}

range *
range::upper (const quantity& q)
{
  upper_ = q;
  return this;
}

range *
range::quant (const quantity& q)
{
  quant_ = q;
  return this;
}

quantity
range::lower () const
{
  return lower_;
}

quantity
range::upper () const
{
  return upper_;
}

quantity
range::quant () const
{
  return quant_;
}

}       // namespace scan2pdf
