//  option.cpp -- unit tests for the option implementation
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "scan2pdf/option.hpp"
#include "scan2pdf/range.hpp"
#include "scan2pdf/store.hpp"

using namespace scan2pdf;

BOOST_TEST_DONT_PRINT_LOG_VALUE (scan2pdf::option)

struct resolution_fixture
{
  option opt;

  resolution_fixture ()
    : opt ("resolution", option::integer, option::dpi)
  {
    opt.constrain (from< store > ()
                   ->alternative (75)
                   ->alternative (150)
                   ->alternative (300));
    opt.current (75);
  }
};

BOOST_FIXTURE_TEST_SUITE (integer_store, resolution_fixture);

BOOST_AUTO_TEST_CASE (admits_alternatives)
{
  BOOST_CHECK (opt.admits (value (150)));
  BOOST_CHECK (opt.admits (value (300.0)));
}

BOOST_AUTO_TEST_CASE (rejects_non_alternatives)
{
  BOOST_CHECK (!opt.admits (value (200)));
  BOOST_CHECK (!opt.admits (value (150.5)));
}

BOOST_AUTO_TEST_CASE (rejects_wrong_types)
{
  BOOST_CHECK (!opt.admits (value ("150")));
  BOOST_CHECK (!opt.admits (value (true)));
  BOOST_CHECK (!opt.admits (value ()));
}

BOOST_AUTO_TEST_CASE (describes_alternatives)
{
  BOOST_CHECK_EQUAL ("75|150|300dpi", opt.describe_constraint ());
}

BOOST_AUTO_TEST_CASE (is_configurable)
{
  BOOST_CHECK (opt.is_configurable ());
  BOOST_CHECK_EQUAL (opt.key (), opt.name ());
}

BOOST_AUTO_TEST_SUITE_END (/* integer_store */);

BOOST_AUTO_TEST_CASE (fixed_range)
{
  option opt ("br-x", option::fixed, option::mm);
  opt.constrain (from< range > ()->bounds (0.0, 215.9));

  BOOST_CHECK (opt.admits (value (100)));
  BOOST_CHECK (opt.admits (value (215.9)));
  BOOST_CHECK (!opt.admits (value (216)));
  BOOST_CHECK (!opt.admits (value (-0.1)));
  BOOST_CHECK_EQUAL ("0..215.9mm", opt.describe_constraint ());
}

BOOST_AUTO_TEST_CASE (fixed_point_bounds)
{
  option opt ("br-x", option::fixed, option::mm);
  opt.constrain (from< range > ()
                 ->bounds (0.0, option::to_fixed_point (quantity (215.9))));

  BOOST_CHECK (opt.admits (value (215.9)));
  BOOST_CHECK (opt.admits (value (0)));
  BOOST_CHECK (!opt.admits (value (215.91)));
  BOOST_CHECK_EQUAL ("0..215.9mm", opt.describe_constraint ());
}

BOOST_AUTO_TEST_CASE (fixed_point_truncation)
{
  const quantity q (option::to_fixed_point (quantity (215.9)));

  BOOST_CHECK_LE (q, quantity (215.9));
  BOOST_CHECK_LT (215.9 - q.amount< double > (), 1.0 / 65536);
  BOOST_CHECK_EQUAL (quantity (2.5), option::to_fixed_point (quantity (2.5)));
  BOOST_CHECK_EQUAL (quantity (-0.5),
                     option::to_fixed_point (quantity (-0.5)));
}

BOOST_AUTO_TEST_CASE (microsecond_unit)
{
  option opt ("exposure", option::integer, option::microsecond);

  BOOST_CHECK_EQUAL ("<integer>\xc2\xb5s", opt.describe_constraint ());
}

BOOST_AUTO_TEST_CASE (quantized_range)
{
  option opt ("threshold", option::integer);
  opt.constrain (from< range > ()->bounds (0, 255)->quant (5));

  BOOST_CHECK (opt.admits (value (0)));
  BOOST_CHECK (opt.admits (value (125)));
  BOOST_CHECK (!opt.admits (value (128)));
  BOOST_CHECK_EQUAL ("0..255 (in steps of 5)", opt.describe_constraint ());
}

BOOST_AUTO_TEST_CASE (string_store)
{
  option opt ("mode", option::string);
  opt.constrain (from< store > ()
                 ->alternative ("Color")
                 ->alternative ("Gray"));

  BOOST_CHECK (opt.admits (value ("Gray")));
  BOOST_CHECK (!opt.admits (value ("gray")));
  BOOST_CHECK_EQUAL ("'Color'|'Gray'", opt.describe_constraint ());
}

BOOST_AUTO_TEST_CASE (unconstrained_descriptions)
{
  BOOST_CHECK_EQUAL ("yes|no",
                     option ("preview", option::boolean)
                     .describe_constraint ());
  BOOST_CHECK_EQUAL ("<integer>%",
                     option ("contrast", option::integer, option::percent)
                     .describe_constraint ());
  BOOST_CHECK_EQUAL ("<string>",
                     option ("name", option::string)
                     .describe_constraint ());
  BOOST_CHECK_EQUAL ("auto|<number>mm",
                     option ("tl-x", option::fixed, option::mm, 1,
                             (option::soft_select | option::soft_detect
                              | option::automatic))
                     .describe_constraint ());
}

BOOST_AUTO_TEST_CASE (configurability)
{
  const int caps = option::soft_select | option::soft_detect;

  BOOST_CHECK ( option ("x", option::integer, option::no_unit, 1, caps)
                .is_configurable ());
  BOOST_CHECK (!option ("x", option::integer, option::no_unit, 1,
                        caps | option::inactive).is_configurable ());
  BOOST_CHECK (!option ("x", option::integer, option::no_unit, 1,
                        caps | option::hard_select).is_configurable ());
  BOOST_CHECK (!option ("x", option::integer, option::no_unit, 1,
                        option::soft_detect).is_configurable ());
  BOOST_CHECK (!option ("x", option::integer, option::no_unit, 256,
                        caps).is_configurable ());
  BOOST_CHECK ( option ("x", option::string, option::no_unit, 32,
                        caps).is_configurable ());
  BOOST_CHECK (!option ("x", option::button, option::no_unit, 0,
                        caps).is_configurable ());
  BOOST_CHECK (!option ("x", option::group, option::no_unit, 0,
                        caps).is_configurable ());
}

BOOST_AUTO_TEST_CASE (map_keeps_device_order)
{
  option::map m;

  m.insert (option ("resolution", option::integer));
  m.insert (option ("mode", option::string));
  m.insert (option ("br-x", option::fixed));

  BOOST_REQUIRE_EQUAL (3, m.size ());

  option::map::const_iterator it = m.begin ();
  BOOST_CHECK_EQUAL ("resolution", (it++)->key ());
  BOOST_CHECK_EQUAL ("mode", (it++)->key ());
  BOOST_CHECK_EQUAL ("br-x", (it++)->key ());
  BOOST_CHECK (m.end () == it);
}

BOOST_AUTO_TEST_CASE (map_lookup)
{
  option::map m;

  m.insert (option ("mode", option::string));

  BOOST_CHECK (m.end () != m.find ("mode"));
  BOOST_CHECK (m.end () == m.find ("source"));
  BOOST_CHECK_EQUAL ("mode", m["mode"].key ());
  BOOST_CHECK_THROW (m["source"], std::out_of_range);
  BOOST_CHECK_THROW (m.insert (option ("mode", option::integer)),
                     std::logic_error);
}

#include "scan2pdf/test/runner.ipp"
