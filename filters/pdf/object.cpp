//  object.cpp -- PDF objects
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

#include "object.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

object::~object ()
{}

reference::reference (std::size_t num)
  : num_(num)
{}

std::size_t
reference::obj_num () const
{
  return num_;
}

void
reference::operator>> (std::ostream& os) const
{
  os << num_ << " 0 R";
}

reference *
reference::clone () const
{
  return new reference (*this);
}

std::ostream&
operator<< (std::ostream& os, const object& o)
{
  o >> os;
  return os;
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf
