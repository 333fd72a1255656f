//  quantity.cpp -- integral and non-integral option values
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <sstream>
#include <string>

#include <boost/throw_exception.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

#include "scan2pdf/quantity.hpp"

namespace scan2pdf {

namespace {

typedef quantity::integer_type     int_t;
typedef quantity::non_integer_type real_t;

bool
fits_integer (const real_t& r)
{
  return (std::floor (r) == r
          && r >= std::numeric_limits< int_t >::min ()
          && r <= std::numeric_limits< int_t >::max ());
}

//! Computes with integers where exact, in floating point otherwise
template< typename Op >
struct arithmetic_
  : public boost::static_visitor< quantity >
{
  quantity operator() (const int_t& lhs, const int_t& rhs) const
  {
    real_t r = Op::apply (real_t (lhs), real_t (rhs));

    if (fits_integer (r)) return int_t (r);
    return r;
  }

  template< typename T1, typename T2 >
  quantity operator() (const T1& lhs, const T2& rhs) const
  {
    return Op::apply (real_t (lhs), real_t (rhs));
  }
};

struct plus_     { static real_t apply (real_t a, real_t b) { return a + b; } };
struct minus_    { static real_t apply (real_t a, real_t b) { return a - b; } };
struct times_    { static real_t apply (real_t a, real_t b) { return a * b; } };
struct divided_  { static real_t apply (real_t a, real_t b) { return a / b; } };

struct is_less_than_
  : public boost::static_visitor< bool >
{
  template< typename T1, typename T2 >
  bool operator() (const T1& lhs, const T2& rhs) const
  {
    return real_t (lhs) < real_t (rhs);
  }
};

struct is_equal_to_
  : public boost::static_visitor< bool >
{
  template< typename T1, typename T2 >
  bool operator() (const T1& lhs, const T2& rhs) const
  {
    return real_t (lhs) == real_t (rhs);
  }
};

}       // namespace

quantity::quantity (const integer_type& amount)
  : amount_(amount)
{}

quantity::quantity (const non_integer_type& amount)
  : amount_(amount)
{}

quantity::quantity ()
  : amount_(integer_type (0))
{}

bool
quantity::is_integral () const
{
  return 0 == amount_.which ();
}

bool
quantity::is_whole () const
{
  return (is_integral ()
          || fits_integer (boost::get< non_integer_type > (amount_)));
}

bool
quantity::operator== (const quantity& q) const
{
  return boost::apply_visitor (is_equal_to_(), amount_, q.amount_);
}

bool
quantity::operator<  (const quantity& q) const
{
  // boost::variant::operator<() compares the indices of the bounded
  // types when these differ.  That would make an integer_type 1200
  // *less* than a non_integer_type 100.

  return boost::apply_visitor (is_less_than_(), amount_, q.amount_);
}

quantity&
quantity::operator+= (const quantity& q)
{
  return *this = boost::apply_visitor (arithmetic_< plus_ > (),
                                       amount_, q.amount_);
}

quantity&
quantity::operator-= (const quantity& q)
{
  return *this = boost::apply_visitor (arithmetic_< minus_ > (),
                                       amount_, q.amount_);
}

quantity&
quantity::operator*= (const quantity& q)
{
  return *this = boost::apply_visitor (arithmetic_< times_ > (),
                                       amount_, q.amount_);
}

quantity&
quantity::operator/= (const quantity& q)
{
  if (q == quantity ())
    BOOST_THROW_EXCEPTION (std::domain_error ("division by zero"));

  return *this = boost::apply_visitor (arithmetic_< divided_ > (),
                                       amount_, q.amount_);
}

std::ostream&
operator<< (std::ostream& os, const quantity& q)
{
  if (q.is_integral ())
    {
      os << boost::get< quantity::integer_type > (q.amount_);
    }
  else
    {
      std::stringstream ss;
      ss << boost::get< quantity::non_integer_type > (q.amount_);
      if (std::string::npos == ss.str ().find_first_of (".e"))
        ss << ".0";
      os << ss.str ();
    }
  return os;
}

quantity
operator+ (const quantity& q)
{
  return q;
}

quantity
operator- (const quantity& q)
{
  quantity rv (q);
  return rv *= -1;
}

quantity
abs (const quantity& q)
{
  return (q < quantity () ? -q : q);
}

}       // namespace scan2pdf
