//  array.hpp -- PDF array objects
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

#ifndef filters_pdf_array_hpp_
#define filters_pdf_array_hpp_

#include <cstddef>
#include <vector>

#include <scan2pdf/memory.hpp>

#include "object.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

//! An ordered collection of PDF objects
class array
  : public object
{
public:
  //! Appends a copy of \a obj
  array& insert (const object& obj);

  std::size_t size () const;
  const object * operator[] (std::size_t index) const;

  void operator>> (std::ostream& os) const;
  array * clone () const;

private:
  std::vector< shared_ptr< object > > store_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_pdf_array_hpp_ */
