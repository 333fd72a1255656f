//  scan2pdf.cpp -- scan documents into a PDF file
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

#include <signal.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <scan2pdf/format.hpp>
#include <scan2pdf/log.hpp>
#include <scan2pdf/memory.hpp>
#include <scan2pdf/run-time.hpp>

#include "../sane/backend.hpp"
#include "commands.hpp"

namespace po = boost::program_options;

using scan2pdf::format;
using scan2pdf::log;
using scan2pdf::run_time;

namespace {

//! Command-line that does not make sense
class usage_error
  : public std::runtime_error
{
public:
  explicit usage_error (const std::string& message)
    : std::runtime_error (message)
  {}
};

const char *synopsis =
  "Usage:\n"
  "  " PACKAGE_TARNAME " -L | --list-devices\n"
  "  " PACKAGE_TARNAME " --create-configuration DEVICE [CONFIG]\n"
  "  " PACKAGE_TARNAME " [--debug] [-C CONFIG]... DEVICE TARGET\n";

void
request_cancellation (int)
{
  scan2pdf::cmd::cancel_scan ();
}

//! Wrap signal registration platform dependencies
void
set_signal (int sig, void (*handler) (int))
{
  const std::string msg_failed
    ("cannot set signal handler (%1%)");
  const std::string msg_revert
    ("restoring default signal ignore behaviour (%1%)");

#if HAVE_SIGACTION

  struct sigaction sa;
  sa.sa_handler = handler;
  sa.sa_flags = SA_RESTART;
  sigemptyset (&sa.sa_mask);

  struct sigaction rv;

  if (0 != sigaction (sig, &sa, &rv))
    {
      log::error (msg_failed) % sig;
      return;
    }
  if (SIG_IGN == rv.sa_handler && SIG_IGN != handler)
    {
      log::brief (msg_revert) % sig;
      sigaction (sig, &rv, 0);
    }

#else

  void (*rv) (int) = std::signal (sig, handler);

  if (SIG_ERR == rv)
    {
      log::error (msg_failed) % sig;
      return;
    }
  if (SIG_IGN == rv && SIG_IGN != handler)
    {
      log::brief (msg_revert) % sig;
      std::signal (sig, rv);
    }

#endif  /* HAVE_SIGACTION */
}

int
report_usage (const std::string& message)
{
  std::cerr << PACKAGE_TARNAME ": " << message << "\n"
            << "Try '" PACKAGE_TARNAME " --help' for more information.\n";
  return EXIT_FAILURE;
}

}       // namespace

int
main (int argc, char *argv[])
{
  bool debug = false;

  try
    {
      run_time rt (argc, argv);

      std::vector< std::string > configs;
      std::vector< std::string > args;
      std::string create;

      po::options_description cmd_opts ("Utility options");
      cmd_opts
        .add_options ()
        ("list-devices,L",
         "list the names of all available devices and exit")
        ("create-configuration",
         (po::value< std::string > (&create)->value_name ("DEVICE")),
         "save the settings of DEVICE as a JSON configuration file, in "
         "CONFIG if given.  Use '-' for standard output.")
        ("configuration,C",
         (po::value< std::vector< std::string > > (&configs)
          ->composing ()->value_name ("CONFIG")),
         "apply settings from a JSON configuration file or an inline "
         "JSON object.  Inline settings take precedence over those in "
         "files.  May be repeated.")
        ("debug",
         "log everything and report errors with full detail")
        ;

      po::options_description cmd_pos_opts;
      cmd_pos_opts
        .add_options ()
        ("argument", po::value< std::vector< std::string > > (&args))
        ;

      po::positional_options_description cmd_pos_args;
      cmd_pos_args.add ("argument", -1);

      if (rt.count ("help"))
        {
          std::cout << rt.help ("scan documents into a PDF file")
                    << "\n" << synopsis
                    << "\n" << cmd_opts;
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      po::options_description cmd_line;
      cmd_line
        .add (cmd_opts)
        .add (cmd_pos_opts)
        ;

      po::variables_map vm;
      po::store (po::command_line_parser (rt.arguments ())
                 .options (cmd_line)
                 .positional (cmd_pos_args)
                 .run (), vm);
      po::notify (vm);

      debug = vm.count ("debug");
      if (debug) log::threshold = log::DEBUG;

      const bool list = vm.count ("list-devices");
      const bool configure = vm.count ("create-configuration");

      if (list && configure)
        BOOST_THROW_EXCEPTION
          (usage_error ("--list-devices and --create-configuration"
                        " are mutually exclusive"));
      if ((list || configure) && !configs.empty ())
        BOOST_THROW_EXCEPTION
          (usage_error ("--configuration can only be used when scanning"));

      /**/ if (list)
        {
          if (!args.empty ())
            BOOST_THROW_EXCEPTION
              (usage_error ("--list-devices takes no arguments"));

          sane::backend be;
          scan2pdf::cmd::list_devices (be, std::cout);
        }
      else if (configure)
        {
          if (1 < args.size ())
            BOOST_THROW_EXCEPTION
              (usage_error ("too many arguments"));

          sane::backend be;
          scan2pdf::cmd::create_configuration
            (be, create, (args.empty () ? std::string () : args.front ()),
             std::cout);
        }
      else
        {
          if (2 != args.size ())
            BOOST_THROW_EXCEPTION
              (usage_error (args.size () < 2
                            ? "missing DEVICE or TARGET argument"
                            : "too many arguments"));

          scan2pdf::cmd::scan_request request;
          request.device = args[0];
          request.target = args[1];
          request.configurations = configs;

          set_signal (SIGTERM, request_cancellation);
          set_signal (SIGINT , request_cancellation);
          set_signal (SIGPIPE, request_cancellation);
          set_signal (SIGHUP , request_cancellation);

          sane::backend be;
          scan2pdf::cmd::scan (be, request);
        }
    }
  catch (const usage_error& e)
    {
      return report_usage (e.what ());
    }
  catch (const po::error& e)
    {
      return report_usage (e.what ());
    }
  catch (const std::exception& e)
    {
      return scan2pdf::cmd::report (e, debug, std::cerr);
    }

  return EXIT_SUCCESS;
}
