//  stream.cpp -- unit tests for the stream implementation
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

#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include "scan2pdf/device.hpp"
#include "scan2pdf/filter.hpp"
#include "scan2pdf/stream.hpp"
#include "scan2pdf/test/memory.hpp"

using namespace scan2pdf;
using namespace scan2pdf::test;

struct pattern_fixture
{
  const unsigned image_count;

  shared_ptr< pattern_idevice > iptr;
  shared_ptr< memory_odevice >  optr;
  stream str;

  pattern_fixture ()
    : image_count (3)
    , iptr (make_shared< pattern_idevice >
            (context (40, 30, context::GRAY8), image_count))
    , optr (make_shared< memory_odevice > ())
  {
    str.push (optr);
  }
};

BOOST_FIXTURE_TEST_SUITE (pattern, pattern_fixture);

BOOST_AUTO_TEST_CASE (input_operator)
{
  streamsize rv = iptr->marker ();
  BOOST_CHECK_EQUAL (traits::bos (), rv);
  rv = *iptr >> str;
  BOOST_CHECK_EQUAL (traits::eoi (), rv);
}

BOOST_AUTO_TEST_CASE (pipe_operator)
{
  streamsize rv = *iptr | str;
  BOOST_CHECK_EQUAL (traits::eos (), rv);
  BOOST_CHECK_EQUAL (traits::eos (), optr->last_marker ());
}

BOOST_AUTO_TEST_CASE (counting_images)
{
  unsigned count = 0;
  streamsize rv  = iptr->marker ();

  while (traits::eos () != rv) {
    rv = *iptr >> str;
    if (traits::eoi () == rv) ++count;
  }
  BOOST_CHECK_EQUAL (count, image_count);
}

BOOST_AUTO_TEST_CASE (image_content)
{
  *iptr | str;

  BOOST_REQUIRE_EQUAL (image_count, optr->images ().size ());
  BOOST_REQUIRE_EQUAL (40 * 30, optr->images ()[1].size ());
  BOOST_CHECK_EQUAL (pattern_idevice::expected (0, 1),
                     optr->images ()[1][0]);
  BOOST_CHECK_EQUAL (pattern_idevice::expected (1199, 1),
                     optr->images ()[1][1199]);
}

BOOST_AUTO_TEST_CASE (marker_order)
{
  *iptr | str;

  const std::vector< traits::int_type >& m (optr->markers ());

  BOOST_REQUIRE_EQUAL (2 + 2 * image_count, m.size ());
  BOOST_CHECK_EQUAL (traits::bos (), m.front ());
  BOOST_CHECK_EQUAL (traits::boi (), m[1]);
  BOOST_CHECK_EQUAL (traits::eoi (), m[2]);
  BOOST_CHECK_EQUAL (traits::eos (), m.back ());
}

BOOST_AUTO_TEST_CASE (cancellation_mid_image)
{
  BOOST_REQUIRE_EQUAL (traits::bos (), iptr->marker ());
  str.mark (traits::bos (), iptr->get_context ());

  iptr->cancel ();

  streamsize rv = *iptr >> str;
  BOOST_CHECK_EQUAL (traits::eof (), rv);
  BOOST_CHECK_EQUAL (traits::eof (), optr->last_marker ());
  BOOST_CHECK (optr->images ().empty ());
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_CASE (single_image_without_feeder)
{
  pattern_idevice dev (context (8, 2, context::RGB8));
  memory_odevice  out;

  BOOST_CHECK_EQUAL (traits::eos (), dev | out);
  BOOST_REQUIRE_EQUAL (1, out.images ().size ());
  BOOST_CHECK_EQUAL (8 * 2 * 3, out.images ()[0].size ());
}

BOOST_AUTO_TEST_CASE (filter_forwards_context)
{
  pattern_idevice dev (context (16, 4, context::GRAY8), 2);
  shared_ptr< memory_odevice > out = make_shared< memory_odevice > (5);
  stream str;

  str.push (make_shared< thru_filter > ());
  str.push (out);

  BOOST_CHECK_EQUAL (traits::eos (), dev | str);
  BOOST_REQUIRE_EQUAL (2, out->contexts ().size ());
  BOOST_CHECK_EQUAL (16, out->contexts ()[1].width ());
  BOOST_CHECK_EQUAL (4, out->contexts ()[1].height ());
  BOOST_CHECK_EQUAL (16 * 4, out->images ()[1].size ());
}

BOOST_AUTO_TEST_CASE (incomplete_stream)
{
  stream str;
  octet data[4] = { 0 };

  str.push (make_shared< thru_filter > ());

  BOOST_CHECK (!str.is_complete ());
  BOOST_CHECK_THROW (str.write (data, 4), std::logic_error);
  BOOST_CHECK_THROW (str.mark (traits::bos (), context ()),
                     std::logic_error);
}

BOOST_AUTO_TEST_CASE (complete_stream)
{
  stream str;

  str.push (make_shared< memory_odevice > ());

  BOOST_CHECK (str.is_complete ());
  BOOST_CHECK_THROW (str.push (make_shared< thru_filter > ()),
                     std::logic_error);
}

#include "scan2pdf/test/runner.ipp"
