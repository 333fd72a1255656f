//  object.hpp -- PDF objects
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

#ifndef filters_pdf_object_hpp_
#define filters_pdf_object_hpp_

#include <cstddef>
#include <ostream>

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

//! Base class for all PDF objects
/*! Objects only know how to put their contents on a stream.  Whether
 *  they end up as direct or as indirect objects is decided by the
 *  writer that outputs them.
 */
class object
{
public:
  virtual ~object ();

  //! Outputs the object's contents, without indirect object framing
  virtual void operator>> (std::ostream& os) const = 0;

  //! Creates a heap allocated copy of the object
  virtual object * clone () const = 0;
};

//! Refers to an indirect object by its object number
class reference
  : public object
{
public:
  explicit reference (std::size_t num);

  std::size_t obj_num () const;

  void operator>> (std::ostream& os) const;
  reference * clone () const;

private:
  std::size_t num_;
};

std::ostream&
operator<< (std::ostream& os, const object& o);

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_pdf_object_hpp_ */
