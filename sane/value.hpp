//  value.hpp -- mediate between option values and SANE memory
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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

#ifndef sane_value_hpp_
#define sane_value_hpp_

extern "C" {                    // needed until sane-backends-1.0.14
#include <sane/sane.h>
}

#include <scan2pdf/value.hpp>

namespace sane {

//! Mediate between scan2pdf::value and SANE API conventions
/*! Instances are tied to a SANE option descriptor.  They know the
 *  SANE value type and buffer size the descriptor dictates and use
 *  that to dispatch to and from SANE frontend managed memory.  The
 *  bounded type of the value always matches the descriptor.
 */
class value
  : public scan2pdf::value
{
public:
  //! Creates a value of the type dictated by a descriptor \a sod
  /*! Options without a value, buttons, groups and vectors, result in
   *  an undefined value.
   */
  explicit value (const SANE_Option_Descriptor& sod);

  //! Converts \a v to the type dictated by a descriptor \a sod
  /*! \throws  scan2pdf::system_error with invalid_configuration code
   *           if \a v cannot be converted
   */
  value (const scan2pdf::value& v, const SANE_Option_Descriptor& sod);

  //! Number of octets needed for the SANE representation
  SANE_Int size () const;
  SANE_Value_Type type () const;

  //! Puts a sane::value into SANE frontend managed memory
  const value& operator>> (void *v) const;

  //! Sets a sane::value to what's in SANE frontend managed memory
  value& operator<< (const void *v);

private:
  SANE_Value_Type type_;
  SANE_Int        size_;
};

}       // namespace sane

#endif  /* sane_value_hpp_ */
