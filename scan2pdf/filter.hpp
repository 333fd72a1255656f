//  filter.hpp -- interface declarations for image data filters
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

#ifndef scan2pdf_filter_hpp_
#define scan2pdf_filter_hpp_

#include "device.hpp"
#include "iobase.hpp"
#include "memory.hpp"

namespace scan2pdf {

//!  Interface for image data consuming filters
/*!  A %filter modifies the image data passing through it before it
 *   hands the result to the output it was opened on.  Sequence markers
 *   are forwarded along with the filter's own, possibly modified,
 *   context so that hooks only need to update ctx_.
 */
class filter
  : public device< output >
  , public output
{
public:
  typedef shared_ptr< filter > ptr;

  void mark (traits::int_type c, const context& ctx);

  //!  Sets a filter's underlying output object
  virtual void open (output::ptr output);

protected:
  output::ptr output_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_filter_hpp_ */
