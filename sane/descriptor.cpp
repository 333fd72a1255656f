//  descriptor.cpp -- translate SANE option descriptors
//  Copyright (C) 2026  scan2pdf developers
//
//  License: GPL-3.0+
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

#include <scan2pdf/quantity.hpp>
#include <scan2pdf/range.hpp>
#include <scan2pdf/store.hpp>

#include "descriptor.hpp"
#include "log.hpp"

namespace sane {

using scan2pdf::option;
using scan2pdf::quantity;

namespace {

option::value_type
to_type (const SANE_Value_Type& type)
{
  switch (type)
    {
    case SANE_TYPE_BOOL:   return option::boolean;
    case SANE_TYPE_INT:    return option::integer;
    case SANE_TYPE_FIXED:  return option::fixed;
    case SANE_TYPE_STRING: return option::string;
    case SANE_TYPE_BUTTON: return option::button;
    default:               return option::group;
    }
}

option::unit_type
to_unit (const SANE_Unit& unit)
{
  switch (unit)
    {
    case SANE_UNIT_PIXEL:       return option::pixel;
    case SANE_UNIT_BIT:         return option::bit;
    case SANE_UNIT_MM:          return option::mm;
    case SANE_UNIT_DPI:         return option::dpi;
    case SANE_UNIT_PERCENT:     return option::percent;
    case SANE_UNIT_MICROSECOND: return option::microsecond;
    default:                    return option::no_unit;
    }
}

quantity
to_quantity (const SANE_Word& w, const SANE_Value_Type& type)
{
  if (SANE_TYPE_FIXED == type)
    return quantity (SANE_UNFIX (w));

  return quantity (quantity::integer_type (w));
}

scan2pdf::constraint *
to_constraint (const SANE_Option_Descriptor& sod)
{
  switch (sod.constraint_type)
    {
    case SANE_CONSTRAINT_RANGE:
      {
        const SANE_Range *r = sod.constraint.range;
        if (!r) break;

        scan2pdf::range *rv = new scan2pdf::range;
        rv->bounds (to_quantity (r->min, sod.type),
                    to_quantity (r->max, sod.type))
          ->quant (0 != r->quant
                   ? to_quantity (r->quant, sod.type)
                   : quantity ());
        return rv;
      }
    case SANE_CONSTRAINT_WORD_LIST:
      {
        const SANE_Word *w = sod.constraint.word_list;
        if (!w) break;

        scan2pdf::store *rv = new scan2pdf::store;
        for (SANE_Word i = 1; i <= w[0]; ++i)
          {
            rv->alternative (to_quantity (w[i], sod.type));
          }
        return rv;
      }
    case SANE_CONSTRAINT_STRING_LIST:
      {
        const SANE_String_Const *s = sod.constraint.string_list;
        if (!s) break;

        scan2pdf::store *rv = new scan2pdf::store;
        for (; *s; ++s)
          {
            rv->alternative (std::string (*s));
          }
        return rv;
      }
    default:
      break;
    }
  return new scan2pdf::constraint;
}

}       // namespace

int
to_capabilities (const SANE_Int& cap)
{
  int rv = 0;

  if (cap & SANE_CAP_SOFT_SELECT) rv |= option::soft_select;
  if (cap & SANE_CAP_HARD_SELECT) rv |= option::hard_select;
  if (cap & SANE_CAP_SOFT_DETECT) rv |= option::soft_detect;
  if (cap & SANE_CAP_EMULATED)    rv |= option::emulated;
  if (cap & SANE_CAP_AUTOMATIC)   rv |= option::automatic;
  if (cap & SANE_CAP_INACTIVE)    rv |= option::inactive;
  if (cap & SANE_CAP_ADVANCED)    rv |= option::advanced;

  return rv;
}

option
to_option (const SANE_Option_Descriptor& sod)
{
  int count = 1;
  if (SANE_TYPE_BOOL  == sod.type
      || SANE_TYPE_INT   == sod.type
      || SANE_TYPE_FIXED == sod.type)
    {
      count = sod.size / SANE_Int (sizeof (SANE_Word));
    }

  option rv (sod.name ? sod.name : "",
             to_type (sod.type), to_unit (sod.unit),
             count, to_capabilities (sod.cap));

  if (sod.title) rv.name (sod.title);
  if (sod.desc)  rv.text (sod.desc);

  rv.constrain (to_constraint (sod));

  log::debug ("%1%: %2%") % rv.key () % rv.describe_constraint ();

  return rv;
}

}       // namespace sane
