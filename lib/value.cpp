//  value.cpp -- generic option values
//  Copyright (C) 2012-2014  SEIKO EPSON CORPORATION
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

#include <ostream>

#include "scan2pdf/value.hpp"

namespace scan2pdf {

value::value ()
{}

value::value (const quantity& q)
  : value_(q)
{}

value::value (const std::string& s)
  : value_(s)
{}

value::value (const toggle& t)
  : value_(t)
{}

value::value (const quantity::integer_type& q)
  : value_(quantity (q))
{}

value::value (const quantity::non_integer_type& q)
  : value_(quantity (q))
{}

value::value (const bool& b)
  : value_(toggle (b))
{}

value::value (const char *str)
  : value_(std::string (str))
{}

bool
value::operator== (const value& val) const
{
  return (value_ == val.value_);
}

bool
value::is_none () const
{
  return 0 == value_.which ();
}

std::ostream&
operator<< (std::ostream& os, const value& val)
{
  return os << val.value_;
}

bool
value::none::operator== (const value::none&) const
{
  return true;
}

std::ostream&
operator<< (std::ostream& os, const value::none&)
{
  return os;
}

}       // namespace scan2pdf
