//  primitive.hpp -- PDF primitives
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

#ifndef filters_pdf_primitive_hpp_
#define filters_pdf_primitive_hpp_

#include <sstream>
#include <string>

#include "object.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

//! A PDF number, boolean, name or string object
/*! Primitives hold the token that represents them in a PDF file.
 *  Numbers are converted when constructed.  Use the name() and text()
 *  factories to get correctly delimited names and strings.
 */
class primitive
  : public object
{
public:
  primitive ();

  template< typename T >
  explicit primitive (const T& t)
  {
    std::ostringstream ss;
    ss << t;
    token_ = ss.str ();
  }

  //! Creates a name object, e.g. \c /DeviceGray
  static primitive name (const std::string& s);

  //! Creates a literal string object with special characters escaped
  static primitive text (const std::string& s);

  //! Creates a boolean object
  static primitive boolean (bool b);

  void operator>> (std::ostream& os) const;
  primitive * clone () const;

  bool operator== (const primitive& rhs) const;

private:
  std::string token_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_pdf_primitive_hpp_ */
