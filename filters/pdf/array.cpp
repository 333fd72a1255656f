//  array.cpp -- PDF array objects
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

#include "array.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

array&
array::insert (const object& obj)
{
  store_.push_back (shared_ptr< object > (obj.clone ()));
  return *this;
}

std::size_t
array::size () const
{
  return store_.size ();
}

const object *
array::operator[] (std::size_t index) const
{
  return (index < store_.size () ? store_[index].get () : NULL);
}

void
array::operator>> (std::ostream& os) const
{
  const char *sep = (4 < store_.size () ? "\n" : " ");

  os << "[";
  for (std::size_t i = 0; i < store_.size (); ++i)
    {
      os << (i ? sep : "") << *store_[i];
    }
  os << "]";
}

array *
array::clone () const
{
  return new array (*this);
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf
