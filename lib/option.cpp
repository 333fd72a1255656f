//  option.cpp -- scan option descriptions
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "scan2pdf/format.hpp"
#include "scan2pdf/option.hpp"
#include "scan2pdf/quantity.hpp"
#include "scan2pdf/toggle.hpp"

namespace scan2pdf {

option::option (const std::string& key, const value_type& type,
                const unit_type& unit, int count, int caps)
  : key_(key)
  , name_(key)
  , type_(type)
  , unit_(unit)
  , count_(count)
  , caps_(caps)
  , constraint_(make_shared< constraint > ())
{}

std::string
option::key () const
{
  return key_;
}

std::string
option::name () const
{
  return name_;
}

std::string
option::text () const
{
  return text_;
}

option::value_type
option::type () const
{
  return type_;
}

option::unit_type
option::unit () const
{
  return unit_;
}

int
option::count () const
{
  return count_;
}

int
option::capabilities () const
{
  return caps_;
}

constraint::ptr
option::domain () const
{
  return constraint_;
}

const value&
option::current () const
{
  return current_;
}

option&
option::name (const std::string& name)
{
  name_ = name;
  return *this;
}

option&
option::text (const std::string& text)
{
  text_ = text;
  return *this;
}

option&
option::capabilities (int caps)
{
  caps_ = caps;
  return *this;
}

option&
option::constrain (constraint *c)
{
  return constrain (constraint::ptr (c));
}

option&
option::constrain (const constraint::ptr& c)
{
  constraint_ = (c ? c : make_shared< constraint > ());
  return *this;
}

option&
option::current (const value& v)
{
  current_ = v;
  return *this;
}

bool
option::is_active () const
{
  return !(caps_ & inactive);
}

bool
option::is_automatic () const
{
  return caps_ & automatic;
}

bool
option::is_scalar () const
{
  return string == type_ || 1 == count_;
}

bool
option::is_configurable () const
{
  return ((caps_ & soft_select)
          && (caps_ & soft_detect)
          && !(caps_ & hard_select)
          && is_active ()
          && button != type_
          && group  != type_
          && is_scalar ());
}

bool
option::admits (const value& v) const
{
  switch (type_)
    {
    case boolean:
      return v.is< toggle > ();
    case integer:
      if (!v.is< quantity > ()) return false;
      {
        quantity q = v;
        if (!q.is_whole ()) return false;

        q = q.amount< quantity::integer_type > ();
        return constraint_->admits (q);
      }
    case fixed:
      return (v.is< quantity > ()
              && constraint_->admits (to_fixed_point (v)));
    case string:
      return v.is< std::string > () && constraint_->admits (v);
    default:
      return false;
    }
}

std::string
option::describe_constraint () const
{
  std::string rv;

  if (boolean == type_)
    {
      rv = "yes|no";
    }
  else if (!constraint_->is_unconstrained ())
    {
      rv = constraint_->describe (unit_symbol (unit_));
    }
  else
    {
      switch (type_)
        {
        case integer: rv = "<integer>" + unit_symbol (unit_); break;
        case fixed:   rv = "<number>"  + unit_symbol (unit_); break;
        case string:  rv = "<string>";  break;
        default:      break;
        }
    }

  if (is_automatic ()) rv = "auto|" + rv;

  return rv;
}

std::string
option::unit_symbol (const unit_type& unit)
{
  switch (unit)
    {
    case pixel:       return "px";
    case bit:         return "bit";
    case mm:          return "mm";
    case dpi:         return "dpi";
    case percent:     return "%";
    case microsecond: return "\xc2\xb5s";
    default:          return "";
    }
}

quantity
option::to_fixed_point (const quantity& q)
{
  const double scale = 1 << 16;
  const double amount = q.amount< double > ();

  // beyond what a fixed option can hold, leave it to the constraint
  if (32768 <= amount || -32768 >= amount) return q;

  return quantity (double (quantity::integer_type (amount * scale)) / scale);
}

bool
option::map::empty () const
{
  return options_.empty ();
}

option::map::size_type
option::map::size () const
{
  return options_.size ();
}

void
option::map::insert (const option& opt)
{
  if (end () != find (opt.key ()))
    BOOST_THROW_EXCEPTION
      (std::logic_error ((format ("duplicate option: %1%")
                          % opt.key ()).str ()));

  options_.push_back (opt);
}

option::map::iterator
option::map::find (const std::string& k)
{
  for (iterator it = begin (); end () != it; ++it)
    {
      if (k == it->key ()) return it;
    }
  return end ();
}

option::map::const_iterator
option::map::find (const std::string& k) const
{
  for (const_iterator it = begin (); end () != it; ++it)
    {
      if (k == it->key ()) return it;
    }
  return end ();
}

const option&
option::map::operator[] (const std::string& k) const
{
  const_iterator it = find (k);
  if (end () == it)
    BOOST_THROW_EXCEPTION (std::out_of_range (k));

  return *it;
}

option::map::iterator
option::map::begin ()
{
  return options_.begin ();
}

option::map::iterator
option::map::end ()
{
  return options_.end ();
}

option::map::const_iterator
option::map::begin () const
{
  return options_.begin ();
}

option::map::const_iterator
option::map::end () const
{
  return options_.end ();
}

}       // namespace scan2pdf
