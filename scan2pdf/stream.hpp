//  stream.hpp -- image data consuming streams
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

#ifndef scan2pdf_stream_hpp_
#define scan2pdf_stream_hpp_

#include "device.hpp"
#include "filter.hpp"

namespace scan2pdf {

//!  Store an image data sequence
/*!  A %stream chains zero or more filters in front of an %odevice.
 *   The filter that was pushed \e first faces the stream's API user.
 *   Image data is not usable until a %device has been pushed.  After
 *   that the %stream is complete and no more elements can be pushed.
 */
class stream
  : public output
{
public:
  typedef shared_ptr< stream > ptr;

  streamsize write (const octet *data, streamsize n);
  void mark (traits::int_type c, const context& ctx);

  //!  Pushes a \a %device onto the object's %output stack
  /*!  This completes the object's stack and one can now write() image
   *   data to the \a %device.
   */
  void push (odevice::ptr device);

  //!  Pushes a \a %filter onto the object's %output stack
  /*!  Image data passed to write() will be processed by all filters
   *   on the stack, starting with the \a %filter that was pushed \e
   *   first, before it is consumed by the object's %device.
   */
  void push (filter::ptr filter);

  streamsize buffer_size () const;

  odevice::ptr get_device () const;

  bool is_complete () const;

private:
  output::ptr  out_bottom_;     //!< %output facing the API user
  odevice::ptr device_;         //!< %device that caps the stack
  filter::ptr  filter_;         //!< top-most %filter on the stack

  void attach (output::ptr out);
};

}       // namespace scan2pdf

#endif  /* scan2pdf_stream_hpp_ */
