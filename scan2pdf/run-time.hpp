//  run-time.hpp -- run-time information and command-line handling
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

#ifndef scan2pdf_run_time_hpp_
#define scan2pdf_run_time_hpp_

#include <map>
#include <string>
#include <vector>

#include <boost/program_options/variables_map.hpp>

namespace scan2pdf {

//! Singleton for access to a program's run-time information
/*! The run_time takes care of the options every program in the
 *  package supports, the GNU standard \c --help and \c --version as
 *  well as \c --log-level.  The latter may also be given through a
 *  \c SCAN2PDF_LOG_LEVEL environment variable.  Options it does not
 *  know about are left for the program to process and are available
 *  via arguments().
 */
class run_time
{
public:
  typedef std::vector< std::string > sequence_type;
  typedef boost::program_options::variable_value value_type;
  typedef std::map< std::string, value_type >::size_type size_type;

  //! Initialise program run-time environmental information
  /*! A program's \c main() should create a run_time instance using
   *  this constructor, passing all the command-line arguments that
   *  are available.
   *
   *  This constructor can only be used once.  Any additional use will
   *  throw a std::logic_error exception.  Use the default run_time()
   *  constructor instead.
   *
   *  \throws  boost::program_options::error for unusable standard
   *           option values
   */
  run_time (int argc, const char *const argv[]);

  //! Get access to run-time environmental information
  /*! Use of this constructor before the initialising constructor will
   *  result in a std::logic_error exception.
   */
  run_time ();

  //! Retrieve the canonical program name
  std::string
  program () const;

  //! Unprocessed command-line arguments, in command-line order
  const sequence_type&
  arguments () const;

  //! Number of times an \a option was encountered
  /*! Options may be given on the command-line or set via environment
   *  variables.
   */
  size_type
  count (const std::string& option) const;

  const value_type&
  operator[] (const std::string& option) const;

  //! Program name and \a summary followed by the standard options
  std::string
  help (const std::string& summary = std::string ()) const;

  std::string
  version (const std::string& legalese   = std::string (),
           const std::string& disclaimer = std::string ()) const;

  class impl;
};

} // namespace scan2pdf

#endif /* scan2pdf_run_time_hpp_ */
