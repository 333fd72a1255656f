//  handle.cpp -- RAII wrapper for SANE device handles
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
#include <scan2pdf/format.hpp>

#include "handle.hpp"
#include "log.hpp"

namespace sane {

using scan2pdf::format;
using scan2pdf::system_error;

handle::handle (const session::ptr& session, const std::string& name)
  : session_(session)
  , name_(name)
  , h_(NULL)
  , scanning_(false)
{
  SANE_Status status = (name_.empty ()
                        ? SANE_STATUS_INVAL
                        : sane_open (name_.c_str (), &h_));

  if (SANE_STATUS_GOOD != status || !h_)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::device_not_found,
                       (format ("%1%: no such device") % name_).str ())
         << scan2pdf::backend_status (sane_strstatus (status)));
    }
  log::trace ("%1%: opened") % name_;
}

handle::~handle ()
{
  if (scanning_) sane_cancel (h_);
  sane_close (h_);
  log::trace ("%1%: closed") % name_;
}

std::string
handle::name () const
{
  return name_;
}

SANE_Int
handle::size () const
{
  SANE_Int n = 0;

  if (SANE_STATUS_GOOD != get (0, &n))
    return 0;
  return n;
}

const SANE_Option_Descriptor *
handle::descriptor (SANE_Int index) const
{
  return sane_get_option_descriptor (h_, index);
}

SANE_Status
handle::get (SANE_Int index, void *value) const
{
  return sane_control_option (h_, index, SANE_ACTION_GET_VALUE,
                              value, NULL);
}

SANE_Status
handle::set (SANE_Int index, void *value, SANE_Int *info)
{
  return sane_control_option (h_, index, SANE_ACTION_SET_VALUE,
                              value, info);
}

SANE_Status
handle::set (SANE_Int index, SANE_Int *info)
{
  return sane_control_option (h_, index, SANE_ACTION_SET_AUTO,
                              NULL, info);
}

SANE_Status
handle::start ()
{
  SANE_Status status = sane_start (h_);

  if (SANE_STATUS_GOOD == status) scanning_ = true;
  return status;
}

SANE_Status
handle::parameters (SANE_Parameters *p) const
{
  return sane_get_parameters (h_, p);
}

SANE_Status
handle::read (SANE_Byte *buffer, SANE_Int max_length, SANE_Int *length)
{
  return sane_read (h_, buffer, max_length, length);
}

void
handle::cancel ()
{
  sane_cancel (h_);
  scanning_ = false;
}

bool
handle::is_scanning () const
{
  return scanning_;
}

}       // namespace sane
