//  log.hpp -- log SANE backend feedback in a concise manner
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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
#ifndef sane_log_hpp_
#define sane_log_hpp_

#include <scan2pdf/log.hpp>

namespace sane {

//! Puts all SANE client feedback in the log::BACKEND category
class log
{
public:
  typedef scan2pdf::log::message message;

#define SANE_LOG_NAMED_CTOR(name)                               \
  template< typename F >                                        \
  static message name (const F& fmt)                            \
  { return scan2pdf::log::name (scan2pdf::log::BACKEND, fmt); } \
  /**/

  SANE_LOG_NAMED_CTOR (fatal)
  SANE_LOG_NAMED_CTOR (alert)
  SANE_LOG_NAMED_CTOR (error)
  SANE_LOG_NAMED_CTOR (brief)
  SANE_LOG_NAMED_CTOR (trace)
  SANE_LOG_NAMED_CTOR (debug)

#undef SANE_LOG_NAMED_CTOR
};

}       // namespace sane

#endif  /* sane_log_hpp_ */
