//  dictionary.cpp -- PDF dictionaries
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

#include "dictionary.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

dictionary&
dictionary::insert (const std::string& key, const object& obj)
{
  shared_ptr< object > copy (obj.clone ());

  std::vector< entry >::iterator it;
  for (it = store_.begin (); store_.end () != it; ++it)
    {
      if (key == it->first)
        {
          it->second = copy;
          return *this;
        }
    }
  store_.push_back (std::make_pair (key, copy));
  return *this;
}

std::size_t
dictionary::size () const
{
  return store_.size ();
}

const object *
dictionary::operator[] (const std::string& key) const
{
  std::vector< entry >::const_iterator it;
  for (it = store_.begin (); store_.end () != it; ++it)
    {
      if (key == it->first) return it->second.get ();
    }
  return NULL;
}

void
dictionary::operator>> (std::ostream& os) const
{
  if (1 >= store_.size ())
    {
      os << "<<";
      if (!store_.empty ())
        os << " /" << store_.front ().first << " " << *store_.front ().second;
      os << " >>";
      return;
    }

  os << "<<\n";
  std::vector< entry >::const_iterator it;
  for (it = store_.begin (); store_.end () != it; ++it)
    {
      os << "/" << it->first << " " << *it->second << "\n";
    }
  os << ">>";
}

dictionary *
dictionary::clone () const
{
  return new dictionary (*this);
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf
