//  constraint.hpp -- restrictions on option values
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

#ifndef scan2pdf_constraint_hpp_
#define scan2pdf_constraint_hpp_

#include <ostream>
#include <string>

#include <boost/static_assert.hpp>
#include <boost/type_traits/is_base_of.hpp>

#include "memory.hpp"
#include "value.hpp"

namespace scan2pdf {

//! Impose limitations on allowed values
/*! The base class imposes no limitation at all.  It is what options
 *  without a constraint use.  Derived classes restrict values to an
 *  interval or to a fixed collection.
 *
 *  Type checking is the option's business, a %constraint merely
 *  says whether a value of the right type falls within its limits.
 */
class constraint
{
public:
  typedef shared_ptr< constraint > ptr;

  constraint ();
  virtual ~constraint ();

  //! Tells whether \a v satisfies the %constraint
  virtual bool admits (const value& v) const;

  //! Human readable rendition of the allowed values
  /*! The \a unit, if any, is appended to numeric alternatives.  An
   *  unconstrained object renders as an empty string.
   */
  virtual std::string describe (const std::string& unit = std::string ()) const;

  //! Tells whether this is the "anything goes" %constraint
  virtual bool is_unconstrained () const;
};

inline
std::ostream&
operator<< (std::ostream& os, const constraint& c)
{
  return os << c.describe ();
}

template <typename T>
T * from (const T& t = T ())
{
  BOOST_STATIC_ASSERT ((boost::is_base_of< constraint, T >::value));

  return new T (t);
}

}       // namespace scan2pdf

#endif  /* scan2pdf_constraint_hpp_ */
