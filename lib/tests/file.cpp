//  file.cpp -- unit tests for the file_odevice implementation
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

#include <string>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>

#include "scan2pdf/exception.hpp"
#include "scan2pdf/file.hpp"
#include "scan2pdf/test/memory.hpp"

using namespace scan2pdf;
using scan2pdf::test::pattern_idevice;

namespace fs = boost::filesystem;

static bool
is_write_error (const system_error& e)
{
  return system_error::write_error == e.code ();
}

struct file_fixture
{
  fs::path name;

  file_fixture ()
    : name (fs::temp_directory_path ()
            / fs::unique_path ("scan2pdf-%%%%-%%%%.out"))
  {}
  ~file_fixture ()
  {
    fs::remove (name);
  }
};

BOOST_FIXTURE_TEST_SUITE (file, file_fixture);

BOOST_AUTO_TEST_CASE (single_image)
{
  pattern_idevice dev (context (32, 4, context::GRAY8));
  file_odevice    out (name.string ());

  BOOST_CHECK_EQUAL (traits::eos (), dev | out);
  BOOST_CHECK_EQUAL (1, out.count ());
  BOOST_REQUIRE (fs::exists (name));
  BOOST_CHECK_EQUAL (32 * 4, fs::file_size (name));
}

BOOST_AUTO_TEST_CASE (multiple_images)
{
  pattern_idevice dev (context (32, 4, context::GRAY8), 3);
  file_odevice    out (name.string ());

  BOOST_CHECK_EQUAL (traits::eos (), dev | out);
  BOOST_CHECK_EQUAL (3, out.count ());
  BOOST_CHECK_EQUAL (3 * 32 * 4, fs::file_size (name));
}

BOOST_AUTO_TEST_CASE (truncates_existing_file)
{
  {
    fs::ofstream os (name);
    os << std::string (1024, 'x');
  }
  pattern_idevice dev (context (8, 2, context::GRAY8));
  file_odevice    out (name.string ());

  dev | out;
  BOOST_CHECK_EQUAL (8 * 2, fs::file_size (name));
}

BOOST_AUTO_TEST_CASE (no_images_removes_file)
{
  file_odevice out (name.string ());

  out.mark (traits::bos (), context ());
  BOOST_CHECK (fs::exists (name));
  out.mark (traits::eos (), context ());
  BOOST_CHECK (!fs::exists (name));
}

BOOST_AUTO_TEST_CASE (cancellation_removes_file)
{
  file_odevice out (name.string ());
  octet data[16] = { 0 };

  out.mark (traits::bos (), context ());
  out.mark (traits::boi (), context ());
  out.write (data, sizeof (data));
  out.mark (traits::eof (), context ());

  BOOST_CHECK (!fs::exists (name));
}

BOOST_AUTO_TEST_CASE (unwritable_location)
{
  file_odevice out ((name / "sub" / "dir.out").string ());

  BOOST_CHECK_EXCEPTION (out.mark (traits::bos (), context ()),
                         system_error, is_write_error);
}

BOOST_AUTO_TEST_CASE (write_before_open)
{
  file_odevice out (name.string ());
  octet data[4] = { 0 };

  BOOST_CHECK_EXCEPTION (out.write (data, sizeof (data)),
                         system_error, is_write_error);
  BOOST_CHECK (!fs::exists (name));
}

BOOST_AUTO_TEST_SUITE_END ();

#include "scan2pdf/test/runner.ipp"
