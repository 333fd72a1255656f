//  configuration.hpp -- scan option settings kept as JSON
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

#ifndef scan2pdf_configuration_hpp_
#define scan2pdf_configuration_hpp_

#include <iosfwd>
#include <string>

#include "scanner.hpp"
#include "value.hpp"

namespace scan2pdf {

//! Scan option settings by option name
/*! A %configuration is a flat collection of option values.  On disk
 *  and on the command-line it takes the form of a single JSON object
 *  whose members map option names to booleans, numbers or strings.
 *
 *  Configurations are layered with merge().  The settings of the
 *  argument win so one starts from the lowest precedence layer and
 *  merges the higher ones on top of it.  Settings not mentioned in
 *  any layer keep the device's current value.
 *
 *  All parse errors and all settings that a device does not accept
 *  are reported as a system_error with the
 *  system_error::invalid_configuration code.
 */
class configuration
{
public:
  configuration ();

  //! Reads a configuration from the JSON file at \a path
  static configuration from_file (const std::string& path);

  //! Parses a configuration from JSON \a text
  /*! The \a origin is used in error messages only.
   */
  static configuration from_json (const std::string& text,
                                  const std::string& origin = "inline");

  //! Collects the current values of a device's configurable options
  static configuration from_device (const scanner& device);

  //! Tells whether a command-line argument holds JSON text
  /*! This is the case when its first non-blank character is a '{'.
   */
  static bool is_inline (const std::string& arg);

  //! File name to use when none was given for a \a device
  /*! Characters outside [A-Za-z0-9._-] are replaced by underscores
   *  and a ".json" extension is added.
   */
  static std::string default_path (const std::string& device);

  //! Adds the settings in \a overrides, replacing existing ones
  configuration& merge (const configuration& overrides);

  //! Puts all settings into effect on \a device
  /*! Settings are applied in the order of the device's options, not
   *  in the order in which they were given.  Options are re-read
   *  after every change so that dependent settings are checked
   *  against the device's current state.  A string value of "auto"
   *  lets the device choose for options that support that.
   */
  void apply (scanner& device) const;

  //! Writes the settings as a JSON object
  void write (std::ostream& os) const;

  //! Writes the settings to the file at \a path
  /*! \throws  system_error with system_error::write_error code
   */
  void write (const std::string& path) const;

  const value::map& values () const;
  bool empty () const;

private:
  value::map values_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_configuration_hpp_ */
