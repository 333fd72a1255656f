//  run-time.cpp -- run-time information and command-line handling
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
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "scan2pdf/format.hpp"
#include "scan2pdf/log.hpp"

#include "run-time.ipp"

namespace scan2pdf {

using std::logic_error;

run_time::impl *run_time::impl::instance_(0);

run_time::run_time (int argc, const char *const argv[])
{
  if (impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has been initialized already"));

  impl::instance_ = new impl (argc, argv);
}

run_time::run_time ()
{
  if (!impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has not been initialized yet"));
}

std::string
run_time::program () const
{
  return PACKAGE_TARNAME;
}

const run_time::sequence_type&
run_time::arguments () const
{
  return impl::instance_->cmd_args_;
}

run_time::size_type
run_time::count (const std::string& option) const
{
  return impl::instance_->vm_.count (option);
}

const run_time::value_type&
run_time::operator[] (const std::string& option) const
{
  return impl::instance_->vm_[option];
}

std::string
run_time::help (const std::string& summary) const
{
  std::stringstream ss;

  ss << format (!summary.empty ()
                ? "%1% -- %2%\n"
                : "%1%\n")
    % program ()
    % summary;

  ss << "\n"
     << impl::instance_->gnu_opts_
     << "\n"
     << impl::instance_->std_opts_;

  return ss.str ();
}

std::string
run_time::version (const std::string& legalese,
                   const std::string& disclaimer) const
{
  // This string should NOT be translated
  static const std::string default_legalese
    ("Copyright (C) 2012-2015  SEIKO EPSON CORPORATION\n"
     "Copyright (C) 2026  scan2pdf developers\n"
     "License: GPL-3.0+");

  format fmt ("%1% (%2%) %3%\n%4%\n%5%");
  std::string rv ((fmt
                   % program ()
                   % PACKAGE_NAME
                   % PACKAGE_VERSION
                   % (legalese.empty ()
                      ? default_legalese
                      : legalese)
                   % disclaimer).str ());

  if (!disclaimer.empty ()) rv += "\n";
  return rv;
}

//! Maps PREFIX_SOME_OPTION environment variables to some-option
struct run_time::impl::env_var_mapper
{
  po::options_description opts_;

  enum { approx = true, exact = false };

  env_var_mapper (const po::options_description& opts)
    : opts_(opts)
  {}

  std::string
  operator() (const std::string& env_var)
  {
    static const std::string prefix (PACKAGE_ENV_VAR_PREFIX);

    if (0 != env_var.find (prefix)) return std::string ();

    std::string option (env_var.substr (prefix.length ()));
    for (std::string::iterator it = option.begin ();
         option.end () != it; ++it)
      {
        *it = ('_' == *it
               ? '-'
               : std::tolower (static_cast< unsigned char > (*it)));
      }

    if (opts_.find_nothrow (option, exact))
      return option;

    return std::string ();
  }
};

run_time::impl::impl (int argc, const char *const argv[])
  : gnu_opts_("GNU standard options")
  , std_opts_("Standard options")
{
  args_.resize (argc - 1);
  std::copy (argv + 1, argv + argc, args_.begin ());

  gnu_opts_
    .add_options ()
    ("help"   , "display this help and exit")
    ("version", "output version information and exit")
    ;

  std_opts_
    .add_options ()
    ("log-level", po::value< std::string > (),
     "log messages of this priority and higher\n"
     "(fatal, alert, error, brief, trace, debug)")
    ;

  po::options_description cli_args;
  cli_args
    .add (gnu_opts_)
    .add (std_opts_)
    ;

  po::parsed_options cmd_line (po::command_line_parser (args_)
                               .options (cli_args)
                               .allow_unregistered ()
                               .style (po::command_line_style::default_style
                                       & ~po::command_line_style::allow_guessing)
                               .run ());

  po::store (cmd_line, vm_);
  po::store (po::parse_environment (std_opts_, env_var_mapper (std_opts_)),
             vm_);
  po::notify (vm_);

  cmd_args_ = po::collect_unrecognized (cmd_line.options,
                                        po::include_positional);

  if (vm_.count ("log-level"))
    {
      const std::string name (vm_["log-level"].as< std::string > ());
      log::priority level;

      if (!log::priority_from_name (name, level))
        BOOST_THROW_EXCEPTION
          (po::invalid_option_value (name));

      log::threshold = level;
    }
}

} // namespace scan2pdf
