//  option.hpp -- scan option descriptions
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

#ifndef scan2pdf_option_hpp_
#define scan2pdf_option_hpp_

#include <string>
#include <vector>

#include "constraint.hpp"
#include "memory.hpp"
#include "value.hpp"

namespace scan2pdf {

//! Bundle information about a device setting
/*! An %option describes a single setting of a scanning device along
 *  with its current value.  Instances are snapshots.  They are not
 *  updated when the device changes, so one has to ask the device for
 *  its options again after changing any of them.
 */
class option
{
public:
  //! Kinds of values an option can take
  enum value_type {
    boolean,
    integer,
    fixed,                      //!< fractional numbers
    string,
    button,                     //!< triggers an action, has no value
    group,                      //!< heads a set of related options
  };

  enum unit_type {
    no_unit,
    pixel,
    bit,
    mm,
    dpi,
    percent,
    microsecond,
  };

  //! Capability flags, may be combined
  enum capability {
    soft_select = 1 << 0,       //!< value can be set in software
    hard_select = 1 << 1,       //!< value is set by user intervention
    soft_detect = 1 << 2,       //!< value can be read in software
    emulated    = 1 << 3,
    automatic   = 1 << 4,       //!< backend can choose the value
    inactive    = 1 << 5,
    advanced    = 1 << 6,
  };

  option (const std::string& key, const value_type& type,
          const unit_type& unit = no_unit, int count = 1,
          int caps = soft_select | soft_detect);

  std::string key () const;
  std::string name () const;
  std::string text () const;

  value_type type () const;
  unit_type unit () const;
  //! Number of values, scalars have only one
  int count () const;
  int capabilities () const;

  //! Restrictions on the values the option accepts
  constraint::ptr domain () const;

  //! Current value, value::none if unknown or not representable
  const value& current () const;

  option& name (const std::string& name);
  option& text (const std::string& text);
  option& capabilities (int caps);
  option& constrain (constraint *c);
  option& constrain (const constraint::ptr& c);
  option& current (const value& v);

  //! Whether the option takes effect
  bool is_active () const;
  //! Whether the backend can pick a value itself
  bool is_automatic () const;
  bool is_scalar () const;

  //! Whether the option's value can be read and set via configuration
  /*! This requires a software settable and readable, active, scalar
   *  option that is neither a button nor a group and that cannot be
   *  overruled by user intervention on the device.
   */
  bool is_configurable () const;

  //! Tells whether \a v is of the right type and within constraints
  /*! Integer options accept non-integral quantities with a zero
   *  fractional part.  Fixed options accept any quantity and check
   *  it as to_fixed_point() would store it.
   */
  bool admits (const value& v) const;

  //! Renders the allowed values for use in diagnostics
  std::string describe_constraint () const;

  //! Symbol appended to numeric values, if any
  static std::string unit_symbol (const unit_type& unit);

  //! Truncates \a q to the 16 fractional bits of a fixed option
  static quantity to_fixed_point (const quantity& q);

  class map;

private:
  std::string key_;
  std::string name_;
  std::string text_;

  value_type  type_;
  unit_type   unit_;
  int         count_;
  int         caps_;

  constraint::ptr constraint_;
  value           current_;
};

//! Options of a device in the order the device lists them
class option::map
{
  typedef std::vector< option > container_type;

public:
  typedef shared_ptr< map > ptr;
  typedef container_type::size_type size_type;
  typedef container_type::iterator iterator;
  typedef container_type::const_iterator const_iterator;

  bool empty () const;
  size_type size () const;

  //! Adds \a opt to the end of the map
  /*! \throws  std::logic_error if an option with the same key exists
   */
  void insert (const option& opt);

  //! Finds the option with a given key \a k, end() if none
  iterator find (const std::string& k);
  const_iterator find (const std::string& k) const;

  //! \throws  std::out_of_range when called with an unknown key
  const option& operator[] (const std::string& k) const;

  iterator begin ();
  iterator end ();
  const_iterator begin () const;
  const_iterator end () const;

private:
  container_type options_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_option_hpp_ */
