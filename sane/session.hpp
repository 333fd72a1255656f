//  session.hpp -- SANE library initialisation
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

#ifndef sane_session_hpp_
#define sane_session_hpp_

extern "C" {                    // needed until sane-backends-1.0.14
#include <sane/sane.h>
}

#include <boost/noncopyable.hpp>

#include <scan2pdf/memory.hpp>

namespace sane {

//! Keeps the SANE library initialised while it is in use
/*! The SANE API allows only a single sane_init() / sane_exit() pair
 *  to be active at any one time.  All users share a single session
 *  object that calls sane_exit() when the last reference goes away.
 *  Device handles hold on to the session so that they are always
 *  closed before the library is shut down.
 */
class session
  : private boost::noncopyable
{
public:
  typedef scan2pdf::shared_ptr< session > ptr;

  //! Returns the active session, initialising SANE if necessary
  /*! \throws  scan2pdf::system_error with backend_unavailable code
   *           when sane_init() fails
   */
  static ptr acquire ();

  ~session ();

  //! Version code as reported by the SANE implementation
  SANE_Int version () const;

private:
  session ();

  SANE_Int version_;

  static scan2pdf::weak_ptr< session > instance_;
};

}       // namespace sane

#endif  /* sane_session_hpp_ */
