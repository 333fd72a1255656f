//  store.hpp -- restrict option values to a collection
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

#ifndef scan2pdf_store_hpp_
#define scan2pdf_store_hpp_

#include <list>

#include <boost/concept_check.hpp>

#include "constraint.hpp"

namespace scan2pdf {

//! Allow only values from an iterable collection
/*! Many settings allow a choice from a limited number of values, the
 *  supported resolutions or the available scan modes for example.
 *  The values keep the order in which they were added.
 */
class store : public constraint
{
  typedef std::list< value > container_type;

public:
  typedef shared_ptr< store > ptr;
  typedef container_type::size_type size_type;
  typedef container_type::const_iterator const_iterator;

  virtual ~store ();

  virtual bool admits (const value& v) const;
  virtual std::string describe (const std::string& unit = std::string ()) const;
  virtual bool is_unconstrained () const;

  //! Adds values from the range \c [first,last) to the %store
  template <typename InputIterator>
  store * alternatives (InputIterator first, InputIterator last);
  //! Adds a value \a v to the %store
  store * alternative (const value& v);

  size_type size () const;

  const_iterator begin () const;
  const_iterator end () const;

private:
  container_type store_;
};

template <typename InputIterator>
store *
store::alternatives (InputIterator first, InputIterator last)
{
  BOOST_CONCEPT_ASSERT ((boost::InputIterator< InputIterator >));

  for (InputIterator it = first; it != last; ++it)
    {
      alternative (*it);
    }
  return this;
}

}       // namespace scan2pdf

#endif  /* scan2pdf_store_hpp_ */
