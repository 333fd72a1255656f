//  scanner.cpp -- interface for configurable image acquisition devices
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

#include "scan2pdf/scanner.hpp"

namespace scan2pdf {

scanner::scanner ()
{}

scanner::~scanner ()
{}

scanner::info::info (const std::string& name, const std::string& vendor,
                     const std::string& model, const std::string& type)
  : name_(name)
  , vendor_(vendor)
  , model_(model)
  , type_(type)
{}

std::string
scanner::info::name () const
{
  return name_;
}

std::string
scanner::info::vendor () const
{
  return vendor_;
}

std::string
scanner::info::model () const
{
  return model_;
}

std::string
scanner::info::type () const
{
  return type_;
}

bool
scanner::info::operator== (const scanner::info& rhs) const
{
  return (name_ == rhs.name_
          && vendor_ == rhs.vendor_
          && model_ == rhs.model_
          && type_ == rhs.type_);
}

}       // namespace scan2pdf
