//  descriptor.hpp -- translate SANE option descriptors
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

#ifndef sane_descriptor_hpp_
#define sane_descriptor_hpp_

extern "C" {                    // needed until sane-backends-1.0.14
#include <sane/sane.h>
}

#include <scan2pdf/option.hpp>

namespace sane {

//! Creates an option matching the SANE option descriptor \a sod
/*! Type, unit, capabilities and constraint are carried over.  Values
 *  are not, the option's current value is left undefined.
 */
scan2pdf::option
to_option (const SANE_Option_Descriptor& sod);

//! Maps SANE_CAP_* flags onto scan2pdf::option::capability flags
int
to_capabilities (const SANE_Int& cap);

}       // namespace sane

#endif  /* sane_descriptor_hpp_ */
