//  backend.cpp -- scanning devices made available via SANE
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <boost/throw_exception.hpp>

#include <scan2pdf/exception.hpp>

#include "backend.hpp"
#include "device.hpp"
#include "handle.hpp"
#include "log.hpp"

namespace sane {

using scan2pdf::scanner;
using scan2pdf::system_error;

namespace {

std::string
safe (SANE_String_Const s)
{
  return (s ? s : "");
}

}       // namespace

backend::backend ()
  : session_(session::acquire ())
{}

std::vector< scanner::info >
backend::devices ()
{
  const SANE_Device **list = NULL;
  SANE_Status status = sane_get_devices (&list, SANE_FALSE);

  if (SANE_STATUS_GOOD != status)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::backend_unavailable,
                       "cannot enumerate devices")
         << scan2pdf::backend_status (sane_strstatus (status)));
    }

  std::vector< scanner::info > rv;
  for (const SANE_Device **dev = list; dev && *dev; ++dev)
    {
      rv.push_back (scanner::info (safe ((*dev)->name),
                                   safe ((*dev)->vendor),
                                   safe ((*dev)->model),
                                   safe ((*dev)->type)));
      log::trace ("found %1% (%2% %3%)")
        % rv.back ().name ()
        % rv.back ().vendor ()
        % rv.back ().model ();
    }
  return rv;
}

scanner::ptr
backend::open (const std::string& name)
{
  handle::ptr h = scan2pdf::make_shared< handle > (session_, name);

  return scan2pdf::make_shared< device > (h);
}

}       // namespace sane
