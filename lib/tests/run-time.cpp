//  run-time.cpp -- unit tests for the run_time implementation
//  Copyright (C) 2012, 2014  SEIKO EPSON CORPORATION
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

#include <boost/program_options/errors.hpp>
#include <boost/test/unit_test.hpp>

#include "scan2pdf/log.hpp"
#include "scan2pdf/test/environment.hpp"
#include "../run-time.ipp"

namespace {

using scan2pdf::run_time;
using scan2pdf::log;

struct fixture
  : scan2pdf::test::environment
{
  const char *program_name_;

  fixture ()
    : program_name_("run-time-unit-test-runner")
  {}

  ~fixture ()
  {
    delete run_time::impl::instance_;
    run_time::impl::instance_ = 0;
    log::threshold = log::ERROR;
  }
};

BOOST_FIXTURE_TEST_SUITE (singleton, fixture)

BOOST_AUTO_TEST_CASE (access_before_initialization)
{
  BOOST_CHECK_THROW (run_time (), std::logic_error);
}

BOOST_AUTO_TEST_CASE (repeated_initialization)
{
  const char *argv[] = { program_name_ };

  run_time rt (1, argv);

  BOOST_CHECK_NO_THROW (run_time ());
  BOOST_CHECK_THROW (run_time (1, argv), std::logic_error);
}

BOOST_AUTO_TEST_CASE (program_name)
{
  const char *argv[] = { "/tmp/builddir/.libs/lt-" PACKAGE_TARNAME };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (PACKAGE_TARNAME, rt.program ());
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_FIXTURE_TEST_SUITE (command_line_options, fixture)

BOOST_AUTO_TEST_CASE (unknown_options_are_left_alone)
{
  const char *argv[] = {
    program_name_,
    "--debug",
    "-C", "{\"mode\":\"Gray\"}",
    "test:0",
    "out.pdf",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (0, rt.count ("debug"));
  BOOST_REQUIRE_EQUAL (5, rt.arguments ().size ());
  BOOST_CHECK_EQUAL ("--debug", rt.arguments ()[0]);
  BOOST_CHECK_EQUAL ("-C", rt.arguments ()[1]);
  BOOST_CHECK_EQUAL ("{\"mode\":\"Gray\"}", rt.arguments ()[2]);
  BOOST_CHECK_EQUAL ("test:0", rt.arguments ()[3]);
  BOOST_CHECK_EQUAL ("out.pdf", rt.arguments ()[4]);
}

BOOST_AUTO_TEST_CASE (gnu_standard_options)
{
  const char *argv[] = {
    program_name_,
    "--help",
    "--version",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (1, rt.count ("help"));
  BOOST_CHECK_EQUAL (1, rt.count ("version"));
  BOOST_CHECK (rt.arguments ().empty ());
}

BOOST_AUTO_TEST_CASE (no_option_guessing)
{
  const char *argv[] = {
    program_name_,
    "--vers",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (0, rt.count ("version"));
  BOOST_CHECK_EQUAL (1, rt.arguments ().size ());
}

BOOST_AUTO_TEST_CASE (log_level)
{
  const char *argv[] = {
    program_name_,
    "--log-level=debug",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (log::DEBUG, log::threshold);
}

BOOST_AUTO_TEST_CASE (unknown_log_level)
{
  const char *argv[] = {
    program_name_,
    "--log-level=chatty",
  };

  BOOST_CHECK_THROW (run_time (sizeof (argv) / sizeof (*argv), argv),
                     boost::program_options::invalid_option_value);
}

BOOST_AUTO_TEST_CASE (help_text)
{
  const char *argv[] = { program_name_ };

  run_time rt (1, argv);
  std::string help (rt.help ("scan documents"));

  BOOST_CHECK_EQUAL (0, help.find (PACKAGE_TARNAME " -- scan documents\n"));
  BOOST_CHECK_NE (std::string::npos, help.find ("--help"));
  BOOST_CHECK_NE (std::string::npos, help.find ("--log-level"));
}

BOOST_AUTO_TEST_CASE (version_text)
{
  const char *argv[] = { program_name_ };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (0, rt.version ().find (PACKAGE_TARNAME " ("
                                            PACKAGE_NAME ") "
                                            PACKAGE_VERSION "\n"));
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_FIXTURE_TEST_SUITE (environment_variables, fixture)

BOOST_AUTO_TEST_CASE (log_level_variable)
{
  const char *argv[] = { program_name_ };

  setenv (PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL", "brief");

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (1, rt.count ("log-level"));
  BOOST_CHECK_EQUAL (log::BRIEF, log::threshold);
}

BOOST_AUTO_TEST_CASE (command_line_wins)
{
  const char *argv[] = {
    program_name_,
    "--log-level=trace",
  };

  setenv (PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL", "brief");

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (log::TRACE, log::threshold);
}

BOOST_AUTO_TEST_CASE (unrelated_variable)
{
  const char *argv[] = { program_name_ };

  setenv (PACKAGE_ENV_VAR_PREFIX "DEBUG", "1");

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (0, rt.count ("debug"));
  BOOST_CHECK_EQUAL (log::ERROR, log::threshold);
}

BOOST_AUTO_TEST_SUITE_END ()

} // namespace

#include "scan2pdf/test/runner.ipp"
