//  dictionary.hpp -- PDF dictionaries
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

#ifndef filters_pdf_dictionary_hpp_
#define filters_pdf_dictionary_hpp_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <scan2pdf/memory.hpp>

#include "object.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

//! A collection of PDF objects keyed by name
/*! Entries are output in insertion order.  Keys are given without
 *  the leading solidus, which is added on output.
 */
class dictionary
  : public object
{
public:
  //! Adds a copy of \a obj, replacing any value with the same \a key
  dictionary& insert (const std::string& key, const object& obj);

  std::size_t size () const;

  //! Returns the value for \a key or \c NULL if there is none
  const object * operator[] (const std::string& key) const;

  void operator>> (std::ostream& os) const;
  dictionary * clone () const;

private:
  typedef std::pair< std::string, shared_ptr< object > > entry;
  std::vector< entry > store_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_pdf_dictionary_hpp_ */
