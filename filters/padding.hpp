//  padding.hpp -- remove scan line padding
//  Copyright (C) 2012, 2013, 2015  SEIKO EPSON CORPORATION
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

#ifndef filters_padding_hpp_
#define filters_padding_hpp_

#include <scan2pdf/filter.hpp>

namespace scan2pdf {
namespace _flt_ {

//! Strips padding octets and scan lines from raster images
/*! Devices may deliver scan lines that are longer than the image
 *  data they carry and images with more scan lines than the image
 *  height.  Downstream consumers only ever see the image data.
 */
class padding
  : public filter
{
public:
  padding ();

  //! Consumes all of the \a n octets of \a data
  streamsize write (const octet *data, streamsize n);

protected:
  //! Takes note of the padding and announces an unpadded image
  void boi (const context& ctx);

  //! Reconciles the final image size with what was announced
  /*! Should the image have turned out smaller than announced, the
   *  surplus octets are flagged as padding in our output context.
   */
  void eoi (const context& ctx);

private:
  context::size_type w_padding_;

  //! Number of scan lines written so far
  context::size_type lines_;

  //! Position within the current padded scan line
  context::size_type offset_;
};

}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_padding_hpp_ */
