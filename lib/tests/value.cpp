//  value.cpp -- unit tests for the value implementation
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

#include <sstream>
#include <string>

#include <boost/test/unit_test.hpp>

#include "scan2pdf/value.hpp"

using namespace scan2pdf;

BOOST_AUTO_TEST_CASE (default_is_none)
{
  value v;

  BOOST_CHECK (v.is_none ());
  BOOST_CHECK (!v.is< quantity > ());
  BOOST_CHECK (!v.is< std::string > ());
  BOOST_CHECK (!v.is< toggle > ());
  BOOST_CHECK_EQUAL (value (), v);
}

BOOST_AUTO_TEST_CASE (boolean_stays_a_toggle)
{
  value v (true);

  BOOST_CHECK (v.is< toggle > ());
  BOOST_CHECK (!v.is< quantity > ());

  toggle t = v;
  BOOST_CHECK (t);
}

BOOST_AUTO_TEST_CASE (literal_becomes_a_string)
{
  value v ("Flatbed");

  BOOST_CHECK (v.is< std::string > ());

  std::string s = v;
  BOOST_CHECK_EQUAL ("Flatbed", s);
}

BOOST_AUTO_TEST_CASE (numbers_become_quantities)
{
  value i (300);
  value d (215.9);

  BOOST_CHECK (i.is< quantity > ());
  BOOST_CHECK (d.is< quantity > ());

  quantity q = i;
  BOOST_CHECK (q.is_integral ());
  q = d;
  BOOST_CHECK (!q.is_integral ());
}

BOOST_AUTO_TEST_CASE (equality)
{
  BOOST_CHECK_EQUAL (value (300), value (300));
  BOOST_CHECK_EQUAL (value (300), value (300.0));
  BOOST_CHECK_NE (value (300), value ("300"));
  BOOST_CHECK_NE (value (true), value (1));
  BOOST_CHECK_NE (value (), value (""));
}

BOOST_AUTO_TEST_CASE (wrong_type_conversion)
{
  value v ("Color");

  BOOST_CHECK_THROW (quantity q = v, boost::bad_get);
}

BOOST_AUTO_TEST_CASE (ostream_operator)
{
  std::ostringstream os;

  os << value (150) << "," << value (true) << "," << value ("Gray")
     << "," << value ();

  BOOST_CHECK_EQUAL ("150,yes,Gray,", os.str ());
}

struct type_name
  : value::visitor< std::string >
{
  result_type operator() (const value::none&) const { return "none"; }
  result_type operator() (const quantity&) const { return "quantity"; }
  result_type operator() (const std::string&) const { return "string"; }
  result_type operator() (const toggle&) const { return "toggle"; }
};

BOOST_AUTO_TEST_CASE (visitation)
{
  type_name v;

  BOOST_CHECK_EQUAL ("none", value ().apply (v));
  BOOST_CHECK_EQUAL ("quantity", value (1).apply (v));
  BOOST_CHECK_EQUAL ("string", value ("1").apply (v));
  BOOST_CHECK_EQUAL ("toggle", value (false).apply (v));
}

#include "scan2pdf/test/runner.ipp"
