//  quantity.hpp -- integral and non-integral option values
//  Copyright (C) 2012, 2014  SEIKO EPSON CORPORATION
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

#ifndef scan2pdf_quantity_hpp_
#define scan2pdf_quantity_hpp_

#include <stdint.h>

#include <iosfwd>

#include <boost/numeric/conversion/cast.hpp>
#include <boost/operators.hpp>
#include <boost/static_assert.hpp>
#include <boost/type_traits/is_arithmetic.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/variant.hpp>

namespace scan2pdf {

//! Numeric option values
/*! A quantity holds either an integer or a floating point amount.
 *  Arithmetic on two integral quantities stays integral as long as
 *  the result can be represented exactly.  Anything else results in
 *  a non-integral quantity.  Comparison is by amount, irrespective
 *  of the representation.
 */
class quantity
  : boost::totally_ordered< quantity
  , boost::arithmetic     < quantity
  > >
{
public:
  typedef int32_t integer_type;
  typedef double  non_integer_type;

  quantity (const integer_type& amount);
  quantity (const non_integer_type& amount);

  explicit quantity ();

  bool is_integral () const;

  //! Tells whether the amount has no fractional part
  /*! This holds for all integral quantities and for those that are
   *  not but happen to be whole numbers in the integer_type range.
   */
  bool is_whole () const;

  bool operator== (const quantity& q) const;
  bool operator<  (const quantity& q) const;

  quantity& operator+= (const quantity& q);
  quantity& operator-= (const quantity& q);
  quantity& operator*= (const quantity& q);
  quantity& operator/= (const quantity& q);

  template< typename T > T amount () const;

  friend
  std::ostream& operator<< (std::ostream& os, const quantity& q);

private:
  typedef boost::variant< integer_type, non_integer_type > value_type;

  value_type amount_;
};

quantity operator+ (const quantity& q);
quantity operator- (const quantity& q);

quantity abs (const quantity& q);

template< typename T >
T quantity::amount () const
{
  BOOST_STATIC_ASSERT ((boost::is_arithmetic< T >::value));

  return boost::numeric_cast< T >
    (is_integral ()
     ? boost::get< integer_type > (amount_)
     : boost::get< non_integer_type > (amount_));
}

}       // namespace scan2pdf

#endif  /* scan2pdf_quantity_hpp_ */
