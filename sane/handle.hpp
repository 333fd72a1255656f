//  handle.hpp -- RAII wrapper for SANE device handles
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

#ifndef sane_handle_hpp_
#define sane_handle_hpp_

extern "C" {                    // needed until sane-backends-1.0.14
#include <sane/sane.h>
}

#include <string>

#include <boost/noncopyable.hpp>

#include <scan2pdf/memory.hpp>

#include "session.hpp"

namespace sane {

//! Owns an open SANE device handle
/*! The device is opened on construction and closed on destruction.
 *  An acquisition that is still in progress at that point is
 *  cancelled first.  The handle keeps its session alive so the SANE
 *  library outlives all open handles.
 *
 *  The member functions are thin wrappers around the corresponding
 *  SANE API calls and report the SANE_Status they get.  Translating
 *  a status into an error is left to the caller.
 */
class handle
  : private boost::noncopyable
{
public:
  typedef scan2pdf::shared_ptr< handle > ptr;

  //! Opens the device called \a name
  /*! \throws  scan2pdf::system_error with device_not_found code if
   *           the device cannot be opened
   */
  handle (const session::ptr& session, const std::string& name);
  ~handle ();

  std::string name () const;

  //! Returns the number of options, option 0 included
  SANE_Int size () const;

  //! Grabs a hold of the SANE option descriptor at \a index
  const SANE_Option_Descriptor * descriptor (SANE_Int index) const;

  //! Handles \c SANE_ACTION_GET_VALUE option control requests
  SANE_Status get (SANE_Int index, void *value) const;
  //! Handles \c SANE_ACTION_SET_VALUE option control requests
  SANE_Status set (SANE_Int index, void *value, SANE_Int *info);
  //! Handles \c SANE_ACTION_SET_AUTO option control requests
  SANE_Status set (SANE_Int index, SANE_Int *info);

  SANE_Status start ();
  SANE_Status parameters (SANE_Parameters *p) const;
  SANE_Status read (SANE_Byte *buffer, SANE_Int max_length,
                    SANE_Int *length);
  void cancel ();

  bool is_scanning () const;

private:
  session::ptr session_;
  std::string  name_;
  SANE_Handle  h_;
  bool         scanning_;
};

}       // namespace sane

#endif  /* sane_handle_hpp_ */
