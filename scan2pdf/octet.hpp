//  octet.hpp -- image data units and sequence markers
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

#ifndef scan2pdf_octet_hpp_
#define scan2pdf_octet_hpp_

#include <ios>
#include <string>

namespace scan2pdf {

//! A set of eight bits with no particular interpretation attached
typedef char octet;

//! Traits extensions for use by image data producers and consumers
/*! Besides the standard eof() marker, image data sequences carry
 *  markers for the begin and end of a scan sequence and of each
 *  image in it.  These let producers and consumers hook header and
 *  trailer processing into the flow of image data.
 */
struct traits
  : std::char_traits< octet >
{
  //! Convert \a c to its equivalent integer representation
  static int_type to_int_type (const char_type& c);

  //! Cancellation or failure marker
  static int_type eof ();
  //! End of scan sequence marker
  static int_type eos ();
  //! End of image marker
  static int_type eoi ();
  //! Begin of image marker
  static int_type boi ();
  //! Begin of scan sequence marker
  static int_type bos ();

  //! Tell whether \a i corresponds to a sequence marker
  static bool is_marker (const int_type& i);
};

//! Signed integral type that can be used to count octets
using std::streamsize;

}       // namespace scan2pdf

#endif  /* scan2pdf_octet_hpp_ */
