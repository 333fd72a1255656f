//  bit-depth.hpp -- reduce image sample size
//  Copyright (C) 2015  SEIKO EPSON CORPORATION
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

#ifndef filters_bit_depth_hpp_
#define filters_bit_depth_hpp_

#include <scan2pdf/filter.hpp>

namespace scan2pdf {
namespace _flt_ {

//! Reduces 16-bit raster images to 8 bits per sample
/*! Samples are expected in host byte order, which is what SANE uses.
 *  Only the most significant octet of each sample is kept.  Images
 *  at other bit depths pass through unchanged.
 */
class bit_depth
  : public filter
{
public:
  bit_depth ();

  streamsize write (const octet *data, streamsize n);

protected:
  void boi (const context& ctx);
  void eoi (const context& ctx);

private:
  bool reduce_;

  //! First octet of a sample split across write() calls
  octet carry_;
  bool  carrying_;
};

}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_bit_depth_hpp_ */
