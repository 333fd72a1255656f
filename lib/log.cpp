//  log.cpp -- log message destinations and thresholds
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

#include <iostream>

#include "scan2pdf/log.hpp"

namespace scan2pdf {

log::priority log::threshold = log::ERROR;
log::category log::matching  = log::ALL;
std::ostream *log::sink      = &std::clog;

namespace {

const char *priority_names[] = {
  "fatal", "alert", "error", "brief", "trace", "debug",
};

}       // namespace

const char *
log::priority_name (int level)
{
  if (FATAL > level || DEBUG < level) return "?";
  return priority_names[level];
}

bool
log::priority_from_name (const std::string& name, priority& level)
{
  for (int i = FATAL; i <= DEBUG; ++i)
    {
      if (name == priority_names[i])
        {
          level = priority (i);
          return true;
        }
    }
  return false;
}

}       // namespace scan2pdf
