//  value.cpp -- mediate between option values and SANE memory
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

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include <boost/static_assert.hpp>
#include <boost/throw_exception.hpp>

#include <scan2pdf/exception.hpp>
#include <scan2pdf/format.hpp>
#include <scan2pdf/quantity.hpp>
#include <scan2pdf/toggle.hpp>

#include "value.hpp"

namespace sane {

using scan2pdf::format;
using scan2pdf::quantity;
using scan2pdf::system_error;
using scan2pdf::toggle;
using std::logic_error;

BOOST_STATIC_ASSERT ((sizeof (SANE_Word) == sizeof (SANE_Int)));
BOOST_STATIC_ASSERT ((sizeof (SANE_Word) == sizeof (SANE_Fixed)));
BOOST_STATIC_ASSERT ((sizeof (SANE_Word) == sizeof (SANE_Bool)));

namespace {

bool
has_value (const SANE_Option_Descriptor& sod)
{
  if (SANE_TYPE_BUTTON == sod.type || SANE_TYPE_GROUP == sod.type)
    return false;

  return (SANE_TYPE_STRING == sod.type
          || SANE_Int (sizeof (SANE_Word)) == sod.size);
}

scan2pdf::value
default_value (const SANE_Option_Descriptor& sod)
{
  if (!has_value (sod)) return scan2pdf::value ();

  switch (sod.type)
    {
    case SANE_TYPE_BOOL:   return toggle ();
    case SANE_TYPE_INT:    return quantity (0);
    case SANE_TYPE_FIXED:  return quantity (0.0);
    case SANE_TYPE_STRING: return std::string ();
    default:
      return scan2pdf::value ();
    }
}

scan2pdf::value
convert (const scan2pdf::value& v, const SANE_Option_Descriptor& sod)
{
  const char *name = (sod.name ? sod.name : "");

  if (has_value (sod))
    {
      if (SANE_TYPE_BOOL == sod.type && v.is< toggle > ())
        return v;
      if (SANE_TYPE_STRING == sod.type && v.is< std::string > ())
        return v;
      if (SANE_TYPE_FIXED == sod.type && v.is< quantity > ())
        {
          quantity q = v;
          return quantity (q.amount< double > ());
        }
      if (SANE_TYPE_INT == sod.type && v.is< quantity > ())
        {
          quantity q = v;
          if (q.is_whole ())
            return quantity (q.amount< quantity::integer_type > ());
        }
    }

  BOOST_THROW_EXCEPTION
    (system_error (system_error::invalid_configuration,
                   (format ("%1%: unsupported value '%2%'")
                    % name % v).str ())
     << scan2pdf::option_name (name));
}

}       // namespace

//! Stuff SANE frontend managed memory into a bounded type
struct get
  : public scan2pdf::value::visitor<>
{
  const void *v_;
  const SANE_Value_Type& t_;
  const SANE_Int& size_;

  get (const void *v, const SANE_Value_Type& t, const SANE_Int& size)
    : v_(v), t_(t), size_(size)
  {}

  using scan2pdf::value::visitor<>::operator();

  void operator() (quantity& q) const
  {
    /**/ if (SANE_TYPE_INT   == t_)
      {
        q = quantity::integer_type (* static_cast< const SANE_Int * > (v_));
      }
    else if (SANE_TYPE_FIXED == t_)
      {
        q = SANE_UNFIX (* static_cast< const SANE_Fixed * > (v_));
      }
    else
      {
        BOOST_THROW_EXCEPTION
          (logic_error ("internal inconsistency"));
      }
  }

  void operator() (std::string& s) const
  {
    const char *p = static_cast< const char * > (v_);
    s.assign (p, strnlen (p, size_));
  }

  void operator() (toggle& t) const
  {
    t = (SANE_FALSE != * static_cast< const SANE_Bool * > (v_));
  }
};

//! Stuff a bounded type into SANE frontend managed memory
struct put
  : public scan2pdf::value::visitor<>
{
  void *v_;
  const SANE_Value_Type& t_;
  const SANE_Int& size_;

  put (void *v, const SANE_Value_Type& t, const SANE_Int& size)
    : v_(v), t_(t), size_(size)
  {}

  using scan2pdf::value::visitor<>::operator();

  void operator() (const quantity& q) const
  {
    if (SANE_TYPE_INT == t_)
      * static_cast< SANE_Int   * > (v_) = q.amount< SANE_Int > ();
    else
      * static_cast< SANE_Fixed * > (v_) = SANE_FIX (q.amount< double > ());
  }

  void operator() (const std::string& s) const
  {
    SANE_String v = static_cast< SANE_String > (v_);

    std::string::size_type n = std::min (s.size (),
                                         std::string::size_type (size_ - 1));
    s.copy (v, n);
    v[n] = '\0';
  }

  void operator() (const toggle& t) const
  {
    * static_cast< SANE_Bool * > (v_) = (t ? SANE_TRUE : SANE_FALSE);
  }
};

value::value (const SANE_Option_Descriptor& sod)
  : scan2pdf::value (default_value (sod))
  , type_(sod.type)
  , size_(sod.size)
{}

value::value (const scan2pdf::value& v, const SANE_Option_Descriptor& sod)
  : scan2pdf::value (convert (v, sod))
  , type_(sod.type)
  , size_(sod.size)
{}

SANE_Int
value::size () const
{
  return size_;
}

SANE_Value_Type
value::type () const
{
  return type_;
}

const value&
value::operator>> (void *v) const
{
  put visitor (v, type_, size_);
  apply (visitor);
  return *this;
}

value&
value::operator<< (const void *v)
{
  get visitor (v, type_, size_);
  apply (visitor);
  return *this;
}

}       // namespace sane
