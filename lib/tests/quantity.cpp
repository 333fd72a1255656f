//  quantity.cpp -- unit tests for the quantity implementation
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

#include <limits>
#include <list>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/assign/list_inserter.hpp>
#include <boost/test/parameterized_test.hpp>
#include <boost/test/unit_test.hpp>

#include "scan2pdf/quantity.hpp"

using scan2pdf::quantity;

typedef quantity::integer_type     integer_type;
typedef quantity::non_integer_type non_integer_type;

BOOST_AUTO_TEST_SUITE (SANE_compatibility);

BOOST_AUTO_TEST_CASE (SANE_Int_requirements)
{
  BOOST_REQUIRE (std::numeric_limits< integer_type >::is_integer);
  BOOST_REQUIRE (std::numeric_limits< integer_type >::is_signed);

  if (std::numeric_limits< integer_type >::is_bounded)
    {
      BOOST_CHECK_GE ((-2147483647-1),  // -2^31
                      std::numeric_limits< integer_type >::min ());
      BOOST_CHECK_LE (( 2147483647  ),  //  2^31 - 1
                      std::numeric_limits< integer_type >::max ());
    }
}

BOOST_AUTO_TEST_CASE (SANE_Fixed_resolution)
{
  BOOST_REQUIRE (!std::numeric_limits< non_integer_type >::is_integer);

  non_integer_type resolution (1);
  resolution /= (1L << 16);

  BOOST_CHECK_LE (std::numeric_limits< non_integer_type >::epsilon (),
                  resolution);
}

BOOST_AUTO_TEST_SUITE_END (/* SANE_compatibility */);

void
test_addition (const std::pair< double, double >& arg)
{
  quantity lhs (arg.first);
  quantity rhs (arg.second);

  BOOST_CHECK_EQUAL (quantity (arg.first + arg.second), lhs + rhs);
}

void
test_multiplication (const std::pair< double, double >& arg)
{
  quantity lhs (arg.first);
  quantity rhs (arg.second);

  BOOST_CHECK_EQUAL (quantity (arg.first * arg.second), lhs * rhs);
}

BOOST_AUTO_TEST_CASE (exact_integer_arithmetic)
{
  quantity q = quantity (6) / quantity (3);

  BOOST_CHECK (q.is_integral ());
  BOOST_CHECK_EQUAL (quantity (2), q);

  q = quantity (300) - quantity (75);
  BOOST_CHECK (q.is_integral ());
  BOOST_CHECK_EQUAL (225, q.amount< int > ());
}

BOOST_AUTO_TEST_CASE (inexact_integer_division)
{
  quantity q = quantity (7) / quantity (2);

  BOOST_CHECK (!q.is_integral ());
  BOOST_CHECK (!q.is_whole ());
  BOOST_CHECK_EQUAL (quantity (3.5), q);
}

BOOST_AUTO_TEST_CASE (division_by_zero)
{
  quantity q (1);

  BOOST_CHECK_THROW (q /= quantity (), std::domain_error);
  BOOST_CHECK_THROW (q /= quantity (0.), std::domain_error);
  BOOST_CHECK_EQUAL (quantity (1), q);
}

BOOST_AUTO_TEST_CASE (promoting_multiplication)
{
  const quantity zahl (2);
  const quantity real (2.5);
  const quantity expect (5.0);

  BOOST_CHECK_EQUAL (expect, zahl * real);
  BOOST_CHECK_EQUAL (expect, real * zahl);
  BOOST_CHECK (!(zahl * real).is_integral ());
  BOOST_CHECK ( (zahl * real).is_whole ());
}

BOOST_AUTO_TEST_CASE (mixed_comparison)
{
  // A variant's own ordering would rank any double above any int.
  BOOST_CHECK (quantity (100.) < quantity (1200));
  BOOST_CHECK (quantity (75) < quantity (75.5));
  BOOST_CHECK_EQUAL (quantity (300), quantity (300.));
}

BOOST_AUTO_TEST_CASE (unary_negation)
{
  quantity q_nil;
  quantity q_pos ( 5.3);
  quantity q_neg (-5.3);

  BOOST_CHECK_EQUAL (+q_nil, -q_nil);
  BOOST_CHECK_EQUAL (-q_pos,  q_neg);
  BOOST_CHECK_EQUAL (-(-q_neg), q_neg);
  BOOST_CHECK_EQUAL (q_pos, abs (q_neg));
}

BOOST_AUTO_TEST_CASE (integral_query)
{
  BOOST_CHECK ( quantity (0 ).is_integral ());
  BOOST_CHECK (!quantity (0.).is_integral ());
  BOOST_CHECK ( quantity (0.).is_whole ());
}

BOOST_AUTO_TEST_CASE (narrowing_amount)
{
  quantity q (215.9);

  BOOST_CHECK_EQUAL (215, q.amount< int > ());
  BOOST_CHECK_CLOSE (215.9, q.amount< double > (), 0.0001);
}

void
test_ostream_operator (const std::pair< quantity, std::string >& args)
{
  quantity    q  (args.first);
  std::string s  (args.second);

  std::ostringstream os;
  os << q;

  if (q.is_integral ())
    BOOST_CHECK_EQUAL (std::string::npos, os.str ().find ('.'));
  else
    BOOST_CHECK_NE (std::string::npos, os.str ().find ('.'));

  BOOST_CHECK_EQUAL (s, os.str ());
}

bool
init_test_runner ()
{
  namespace but = ::boost::unit_test;

  std::list< std::pair< double, double > > args;
  //  any pair of non-trivial amounts will do
  args.push_back (std::pair< double, double > ( 5.20,  3.33));
  args.push_back (std::pair< double, double > ( 5.20, -3.33));
  args.push_back (std::pair< double, double > (-5.20,  3.33));
  args.push_back (std::pair< double, double > (-5.20, -3.33));

  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (test_addition,
                                 args.begin (), args.end ()));
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (test_multiplication,
                                 args.begin (), args.end ()));

  std::list< std::pair< quantity, std::string > > o_args;
  boost::assign::push_back (o_args)
    ( 5,  "5")
    (-5, "-5")
    ( 0,  "0")
    ( 5. ,  "5.0")
    (-5. , "-5.0")
    ( 5.5,  "5.5")
    (  .5,  "0.5")
    ( 0. ,  "0.0")
    ;
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (test_ostream_operator,
                                 o_args.begin (), o_args.end ()));

  return true;
}

#include "scan2pdf/test/runner.ipp"
