//  backend.hpp -- scanning devices made available via SANE
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

#ifndef sane_backend_hpp_
#define sane_backend_hpp_

#include <string>
#include <vector>

#include <scan2pdf/backend.hpp>

#include "session.hpp"

namespace sane {

//! Access to the devices of the installed SANE backends
/*! Creating an instance initialises SANE.  Enumeration and opening
 *  of devices go through sane_get_devices() and sane_open().
 */
class backend
  : public scan2pdf::backend
{
public:
  //! \throws  scan2pdf::system_error with backend_unavailable code
  backend ();

  std::vector< scan2pdf::scanner::info > devices ();
  scan2pdf::scanner::ptr open (const std::string& name);

private:
  session::ptr session_;
};

}       // namespace sane

#endif  /* sane_backend_hpp_ */
