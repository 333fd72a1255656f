//  commands.hpp -- list, configure and scan operations
//  Copyright (C) 2026  scan2pdf developers
//
//  License: GPL-3.0+
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

#ifndef src_commands_hpp_
#define src_commands_hpp_

#include <exception>
#include <iosfwd>
#include <string>
#include <vector>

#include <scan2pdf/backend.hpp>
#include <scan2pdf/context.hpp>

namespace scan2pdf {
namespace cmd {

//! Writes the names of all devices known to \a be, one per line
/*! \throws  system_error with backend_unavailable code
 */
void list_devices (backend& be, std::ostream& os);

//! Saves the current settings of a \a device as a configuration file
/*! The settings are written to \a path.  A \a path of "-" writes to
 *  \a os instead.  An empty \a path selects a file name derived from
 *  the \a device name and that name is reported on \a os.
 *
 *  \return  the path written to
 *  \throws  system_error with device_not_found or write_error code
 */
std::string create_configuration (backend& be, const std::string& device,
                                  const std::string& path,
                                  std::ostream& os);

//! What to scan where and how
struct scan_request
{
  std::string device;
  std::string target;

  //! Configuration file paths and inline JSON, in command-line order
  std::vector< std::string > configurations;
};

//! Acquires all images a device has to offer into a PDF file
/*! The device is opened first, then the configuration is assembled
 *  and applied.  Only then is the target file created.  Files are
 *  merged in the order given, inline JSON objects are merged on top
 *  of them in the order given.
 *
 *  A target that does not hold at least one complete image is not
 *  left behind.
 *
 *  \return  the number of pages in the PDF file
 *  \throws  system_error with device_not_found, invalid_configuration,
 *           write_error or scan_failed code
 */
context::size_type scan (backend& be, const scan_request& request);

//! Requests cancellation of a scan() in progress
/*! This is safe to call from a signal handler.  It has no effect if
 *  no scan() is in progress.
 */
void cancel_scan ();

//! Tells the user what went wrong with a command
/*! The \a e.what() message is written to \a os on a line of its own
 *  unless \a debug is set.  In that case, everything known about the
 *  exception is written, including the location it was thrown from
 *  and any additional error information it carries.
 *
 *  \return  the exit status for a failed command
 */
int report (const std::exception& e, bool debug, std::ostream& os);

}       // namespace cmd
}       // namespace scan2pdf

#endif  /* src_commands_hpp_ */
