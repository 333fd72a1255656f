//  memory.hpp -- managed memory pointers
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#ifndef scan2pdf_memory_hpp_
#define scan2pdf_memory_hpp_

/*! \file
 *  \brief Inject managed memory pointers into the package namespace
 *
 *  Lets the code base use \c shared_ptr and friends as if they were
 *  part of the \c scan2pdf namespace.
 */

#include <memory>

namespace scan2pdf {

using std::dynamic_pointer_cast;
using std::static_pointer_cast;
using std::make_shared;
using std::shared_ptr;
using std::weak_ptr;

//! Support conversion to \c shared_ptr<T> for pointers that aren't
/*! Sometimes API requirements dictate the use of a \c shared_ptr<T>.
 *  Naively converting a raw pointer to a shared one will result in
 *  deletion of that raw pointer when the shared pointer goes out of
 *  scope.  To prevent this from happening, just pass a null_deleter
 *  with the raw pointer to the \c shared_ptr<T> constructor.
 */
struct null_deleter
{
  void operator() (const void *) const {}
};

}       // namespace scan2pdf

#endif  /* scan2pdf_memory_hpp_ */
