//  backend.hpp -- access to a collection of scanning devices
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

#ifndef scan2pdf_backend_hpp_
#define scan2pdf_backend_hpp_

#include <string>
#include <vector>

#include "memory.hpp"
#include "scanner.hpp"

namespace scan2pdf {

//! Entry point to the devices of a scanning subsystem
/*! A %backend enumerates the devices it knows about and hands out
 *  scanner objects for them.  The scanner keeps whatever backend
 *  resources it needs alive for as long as it exists, so it may well
 *  outlive the %backend object that created it.
 */
class backend
{
public:
  typedef shared_ptr< backend > ptr;

  virtual ~backend ();

  //! Devices currently available, in backend order
  /*! \throws  system_error with system_error::backend_unavailable
   *           code when devices cannot be enumerated
   */
  virtual std::vector< scanner::info > devices () = 0;

  //! Opens the device called \a name
  /*! \throws  system_error with system_error::device_not_found code
   *           for device names the backend does not know
   */
  virtual scanner::ptr open (const std::string& name) = 0;

protected:
  backend ();
};

}       // namespace scan2pdf

#endif  /* scan2pdf_backend_hpp_ */
