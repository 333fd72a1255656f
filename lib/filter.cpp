//  filter.cpp -- interface implementations for image data filters
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "scan2pdf/filter.hpp"

namespace scan2pdf {

void
filter::mark (traits::int_type c, const context& ctx)
{
  if (!output_)
    BOOST_THROW_EXCEPTION
      (std::logic_error ("filter has not been opened"));

  output::mark (c, ctx);
  if (traits::is_marker (c))
    {
      last_marker_ = c;
      output_->mark (c, ctx_);
    }
}

void
filter::open (output::ptr output)
{
  output_ = output;
}

}       // namespace scan2pdf
