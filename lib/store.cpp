//  store.cpp -- restrict option values to a collection
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
#include <sstream>

#include "scan2pdf/store.hpp"

namespace scan2pdf {

store::~store ()
{}

bool
store::admits (const value& v) const
{
  return store_.end () != std::find (store_.begin (), store_.end (), v);
}

std::string
store::describe (const std::string& unit) const
{
  std::stringstream ss;
  bool numeric = false;

  for (const_iterator it = store_.begin (); store_.end () != it; ++it)
    {
      if (store_.begin () != it) ss << "|";
      if (it->is< std::string > ())
        {
          ss << "'" << *it << "'";
        }
      else
        {
          ss << *it;
          numeric = true;
        }
    }
  if (numeric) ss << unit;

  return ss.str ();
}

bool
store::is_unconstrained () const
{
  return false;
}

store *
store::alternative (const value& v)
{
  if (!admits (v)) store_.push_back (v);
  return this;
}

store::size_type
store::size () const
{
  return store_.size ();
}

store::const_iterator
store::begin () const
{
  return store_.begin ();
}

store::const_iterator
store::end () const
{
  return store_.end ();
}

}       // namespace scan2pdf
