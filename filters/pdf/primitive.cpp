//  primitive.cpp -- PDF primitives
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
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "primitive.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

primitive::primitive ()
{}

primitive
primitive::name (const std::string& s)
{
  primitive rv;
  rv.token_ = "/" + s;
  return rv;
}

primitive
primitive::text (const std::string& s)
{
  primitive rv;
  rv.token_ = "(";
  for (std::string::const_iterator it = s.begin (); s.end () != it; ++it)
    {
      if ('(' == *it || ')' == *it || '\\' == *it)
        rv.token_ += '\\';
      rv.token_ += *it;
    }
  rv.token_ += ")";
  return rv;
}

primitive
primitive::boolean (bool b)
{
  primitive rv;
  rv.token_ = (b ? "true" : "false");
  return rv;
}

void
primitive::operator>> (std::ostream& os) const
{
  os << token_;
}

primitive *
primitive::clone () const
{
  return new primitive (*this);
}

bool
primitive::operator== (const primitive& rhs) const
{
  return token_ == rhs.token_;
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf
