//  value.cpp -- unit tests for the sane::value implementation
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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

#include <cstring>
#include <string>

#include <boost/test/unit_test.hpp>

#include <scan2pdf/exception.hpp>

#include "../value.hpp"

using scan2pdf::quantity;
using scan2pdf::system_error;
using scan2pdf::toggle;

static SANE_Option_Descriptor
descriptor (SANE_Value_Type type, SANE_Int size = sizeof (SANE_Word))
{
  SANE_Option_Descriptor sod;

  std::memset (&sod, 0, sizeof (sod));
  sod.name = "test-option";
  sod.type = type;
  sod.size = size;
  sod.cap  = SANE_CAP_SOFT_SELECT | SANE_CAP_SOFT_DETECT;

  return sod;
}

static bool
is_invalid_configuration (const system_error& e)
{
  return system_error::invalid_configuration == e.code ();
}

BOOST_AUTO_TEST_CASE (integer_from_quantity)
{
  sane::value sv (quantity (300), descriptor (SANE_TYPE_INT));

  BOOST_CHECK_EQUAL (SANE_TYPE_INT, sv.type ());

  SANE_Word v = 0;
  sv >> (void *) &v;

  BOOST_CHECK_EQUAL (300, v);
}

BOOST_AUTO_TEST_CASE (integer_from_whole_fraction)
{
  sane::value sv (quantity (150.0), descriptor (SANE_TYPE_INT));

  quantity q = sv;
  BOOST_CHECK (q.is_integral ());

  SANE_Word v = 0;
  sv >> (void *) &v;

  BOOST_CHECK_EQUAL (150, v);
}

BOOST_AUTO_TEST_CASE (integer_from_fraction)
{
  BOOST_CHECK_EXCEPTION (sane::value (quantity (1.5),
                                      descriptor (SANE_TYPE_INT)),
                         system_error, is_invalid_configuration);
}

BOOST_AUTO_TEST_CASE (fixed_from_integer)
{
  sane::value sv (quantity (100), descriptor (SANE_TYPE_FIXED));

  BOOST_CHECK_EQUAL (SANE_TYPE_FIXED, sv.type ());

  SANE_Word v = 0;
  sv >> (void *) &v;

  BOOST_CHECK_EQUAL (SANE_FIX (100), v);
}

BOOST_AUTO_TEST_CASE (fixed_into_value)
{
  sane::value sv (descriptor (SANE_TYPE_FIXED));
  SANE_Fixed v = SANE_FIX (215.9);

  sv << (const void *) &v;

  quantity q = sv;
  BOOST_CHECK (!q.is_integral ());
  BOOST_CHECK_CLOSE (215.9, q.amount< double > (), 0.001);
}

BOOST_AUTO_TEST_CASE (boolean_round_trip)
{
  sane::value sv (toggle (true), descriptor (SANE_TYPE_BOOL));

  SANE_Bool b = SANE_FALSE;
  sv >> (void *) &b;
  BOOST_CHECK_EQUAL (SANE_TRUE, b);

  b = SANE_FALSE;
  sv << (const void *) &b;

  toggle t = sv;
  BOOST_CHECK (!t);
}

BOOST_AUTO_TEST_CASE (string_is_truncated_to_size)
{
  sane::value sv (std::string ("ADF Duplex"),
                  descriptor (SANE_TYPE_STRING, 4));
  char buf[8];

  std::memset (buf, 'x', sizeof (buf));
  sv >> (void *) buf;

  BOOST_CHECK_EQUAL ("ADF", std::string (buf));
  BOOST_CHECK_EQUAL ('x', buf[4]);
}

BOOST_AUTO_TEST_CASE (string_from_unterminated_memory)
{
  sane::value sv (descriptor (SANE_TYPE_STRING, 4));
  const char buf[] = { 'G', 'r', 'a', 'y', 'X' };

  sv << (const void *) buf;

  std::string s = sv;
  BOOST_CHECK_EQUAL ("Gray", s);
}

BOOST_AUTO_TEST_CASE (type_mismatch)
{
  BOOST_CHECK_EXCEPTION (sane::value (std::string ("300"),
                                      descriptor (SANE_TYPE_INT)),
                         system_error, is_invalid_configuration);
  BOOST_CHECK_EXCEPTION (sane::value (quantity (1),
                                      descriptor (SANE_TYPE_BOOL)),
                         system_error, is_invalid_configuration);
}

BOOST_AUTO_TEST_CASE (valueless_descriptors)
{
  BOOST_CHECK (sane::value (descriptor (SANE_TYPE_BUTTON, 0)).is_none ());
  BOOST_CHECK (sane::value (descriptor (SANE_TYPE_GROUP, 0)).is_none ());
  BOOST_CHECK (sane::value (descriptor (SANE_TYPE_INT,
                                        256 * sizeof (SANE_Word)))
               .is_none ());
}

#include "scan2pdf/test/runner.ipp"
