//  toggle.hpp -- boolean option values
//  Copyright (C) 2026  scan2pdf developers
//
//  License: GPL-3.0+
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

#ifndef scan2pdf_toggle_hpp_
#define scan2pdf_toggle_hpp_

#include <iosfwd>

#include <boost/operators.hpp>

namespace scan2pdf {

//! Boolean option values
/*! A separate type keeps booleans from being promoted to integers
 *  when put in a value.
 */
class toggle
  : private boost::equality_comparable< toggle >
{
public:
  toggle (const bool& toggle);
  toggle ();

  bool operator== (const toggle& t) const;

  operator bool () const;

  friend
  std::ostream& operator<< (std::ostream& os, const toggle& t);

private:
  bool toggle_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_toggle_hpp_ */
