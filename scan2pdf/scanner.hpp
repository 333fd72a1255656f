//  scanner.hpp -- interface for configurable image acquisition devices
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

#ifndef scan2pdf_scanner_hpp_
#define scan2pdf_scanner_hpp_

#include <string>

#include "device.hpp"
#include "option.hpp"
#include "value.hpp"

namespace scan2pdf {

//! Image data producers with device settings
/*! On top of the idevice image acquisition API, a %scanner exposes
 *  its settings as an option::map.  Settings are changed one at a
 *  time.  Changing one may affect the availability, constraints and
 *  values of others, so callers need to re-read options() after each
 *  change.
 */
class scanner
  : public idevice
{
public:
  typedef shared_ptr< scanner > ptr;

  class info;

  virtual ~scanner ();

  //! Snapshot of the device's current settings
  virtual option::map options () const = 0;

  //! Changes the setting called \a key to \a v
  /*! \throws  system_error with system_error::invalid_configuration
   *           code when the device does not accept the setting
   */
  virtual void assign (const std::string& key, const value& v) = 0;

  //! Lets the device choose a value for the setting called \a key
  /*! \throws  system_error with system_error::invalid_configuration
   *           code when the setting cannot be automated
   */
  virtual void automate (const std::string& key) = 0;

protected:
  scanner ();
};

//! Scanner identification as reported by a backend
/*! The name() is what uniquely identifies a device within a backend
 *  and is what users pass on the command-line.  The other parts are
 *  informational only.
 */
class scanner::info
{
public:
  info (const std::string& name,
        const std::string& vendor = std::string (),
        const std::string& model  = std::string (),
        const std::string& type   = std::string ());

  std::string name () const;
  std::string vendor () const;
  std::string model () const;
  std::string type () const;

  bool operator== (const scanner::info& rhs) const;

private:
  std::string name_;
  std::string vendor_;
  std::string model_;
  std::string type_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_scanner_hpp_ */
