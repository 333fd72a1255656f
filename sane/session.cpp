//  session.cpp -- SANE library initialisation
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <boost/throw_exception.hpp>

#include <scan2pdf/exception.hpp>

#include "log.hpp"
#include "session.hpp"

namespace sane {

using scan2pdf::system_error;

scan2pdf::weak_ptr< session > session::instance_;

session::ptr
session::acquire ()
{
  ptr rv = instance_.lock ();

  if (!rv)
    {
      rv = ptr (new session);
      instance_ = rv;
    }
  return rv;
}

session::session ()
  : version_(0)
{
  SANE_Status status = sane_init (&version_, NULL);

  if (SANE_STATUS_GOOD != status)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::backend_unavailable,
                       "cannot initialise SANE")
         << scan2pdf::backend_status (sane_strstatus (status)));
    }

  log::debug ("SANE %1%.%2%.%3% initialised")
    % SANE_VERSION_MAJOR (version_)
    % SANE_VERSION_MINOR (version_)
    % SANE_VERSION_BUILD (version_);
}

session::~session ()
{
  sane_exit ();
  log::debug ("SANE finalised");
}

SANE_Int
session::version () const
{
  return version_;
}

}       // namespace sane
