//  value.hpp -- generic option values
//  Copyright (C) 2012-2014  SEIKO EPSON CORPORATION
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
#ifndef scan2pdf_value_hpp_
#define scan2pdf_value_hpp_

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>

#include <boost/mpl/assert.hpp>
#include <boost/mpl/contains.hpp>
#include <boost/operators.hpp>
#include <boost/variant.hpp>

#include "quantity.hpp"
#include "toggle.hpp"

namespace scan2pdf {

//! Setting values as exchanged with devices and configuration files
/*! A %value holds a quantity, a std::string or a toggle.  A default
 *  constructed %value holds none of these.  Settings of inactive
 *  options and of options without a value are such undefined values
 *  and are never written to a configuration.
 *
 *  Converting to the wrong type throws boost::bad_get.  Use is() to
 *  check first, or apply() a visitor.
 */
class value
  : private boost::equality_comparable< value >
{
public:
  typedef std::map< std::string, value > map;

  //! Placeholder for an undefined value
  class none
    : private boost::equality_comparable< none >
  {
  public:
    bool operator== (const none&) const;
  };

  template< typename ResultType = void > class visitor;

  value ();

  value (const quantity& q);
  value (const std::string& s);
  value (const toggle& t);

  //  Literals and built-in types map onto the closest bounded type
  value (const quantity::integer_type& q);
  value (const quantity::non_integer_type& q);
  value (const bool& b);
  value (const char *str);

  template< typename T > operator T () const;

  template< typename T > bool is () const;
  bool is_none () const;

  bool operator== (const value& val) const;

  template< typename Visitor >
  typename Visitor::result_type apply (Visitor& v) const;
  template< typename Visitor >
  typename Visitor::result_type apply (Visitor& v);

  friend
  std::ostream& operator<< (std::ostream& os, const value& val);

private:
  typedef boost::variant< none, quantity, std::string, toggle > impl_type;

  impl_type value_;
};

//! Base class for visitors that compute a \a ResultType
/*! Derived classes need an operator() for value::none as well as for
 *  every bounded type.
 */
template< typename ResultType >
class value::visitor
{
public:
  typedef ResultType result_type;

protected:
  visitor () {}
  ~visitor () {}
};

//! Base class for visitors that ignore undefined values
template<>
class value::visitor<>
{
public:
  typedef void result_type;

  result_type operator() (const value::none&) {}
  result_type operator() (value::none&) {}

protected:
  visitor () {}
  ~visitor () {}
};

std::ostream& operator<< (std::ostream& os, const value::none&);

template< typename T >
value::operator T () const
{
  BOOST_MPL_ASSERT ((boost::mpl::contains< impl_type::types, T >));

  return boost::get< T > (value_);
}

template< typename T >
bool
value::is () const
{
  return NULL != boost::get< T > (&value_);
}

template< typename Visitor >
typename Visitor::result_type
value::apply (Visitor& v) const
{
  return value_.apply_visitor (v);
}

template< typename Visitor >
typename Visitor::result_type
value::apply (Visitor& v)
{
  return value_.apply_visitor (v);
}

}       // namespace scan2pdf

#endif  /* scan2pdf_value_hpp_ */
