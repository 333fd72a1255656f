//  range.hpp -- restrict option values to an interval
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

#ifndef scan2pdf_range_hpp_
#define scan2pdf_range_hpp_

#include "constraint.hpp"
#include "quantity.hpp"

namespace scan2pdf {

//! Only allow values between lower and upper bounds
/*! Settings such as a scan area or brightness are naturally expressed
 *  in terms of values within an interval.  A non-zero quant() limits
 *  the values to lower() plus a whole multiple of the quant.  That
 *  granularity is only checked for integral ranges as backends are
 *  expected to round non-integral amounts themselves.
 */
class range : public constraint
{
public:
  typedef shared_ptr< range > ptr;

  range ();

  virtual ~range ();

  virtual bool admits (const value& v) const;
  virtual std::string describe (const std::string& unit = std::string ()) const;
  virtual bool is_unconstrained () const;

  //! Sets the %range's \a lower and \a upper limits
  range * bounds (const quantity& lower, const quantity& upper);
  //! Modifies the %range's lower limit
  range * lower (const quantity& q);
  //! Modifies the %range's upper limit
  range * upper (const quantity& q);
  //! Modifies the %range's granularity, zero means none
  range * quant (const quantity& q);

  //! Returns the lower limit of the %range
  quantity lower () const;
  //! Returns the upper limit of the %range
  quantity upper () const;
  //! Returns the granularity with which values in the %range can change
  quantity quant () const;

private:
  quantity lower_;
  quantity upper_;
  quantity quant_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_range_hpp_ */
