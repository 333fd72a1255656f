//  device.hpp -- image acquisition from a SANE device
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

#ifndef sane_device_hpp_
#define sane_device_hpp_

extern "C" {                    // needed until sane-backends-1.0.14
#include <sane/sane.h>
}

#include <map>
#include <string>
#include <vector>

#include <scan2pdf/scanner.hpp>

#include "handle.hpp"

namespace sane {

//! Exposes an open SANE device as a scan2pdf::scanner
/*! Options are read from the device on construction and re-read as
 *  the device indicates after every change.  Only options with a
 *  non-empty name are exposed.  Buttons, groups, vector options and
 *  inactive options carry an undefined value.
 *
 *  A scan sequence maps onto SANE frames as follows.  Every image is
 *  started with sane_start() and read until SANE_STATUS_EOF.  When
 *  the "source" option names a document feeder, sane_start() is
 *  called again after each image until it reports that there are no
 *  more documents.  The sequence is terminated with sane_cancel().
 *
 *  Frames are expected to be SANE_FRAME_GRAY or SANE_FRAME_RGB.  For
 *  frames of unknown height the image data is read into memory in
 *  its entirety before the image is begun so that consumers always
 *  know the image size.
 */
class device
  : public scan2pdf::scanner
{
public:
  explicit device (const handle::ptr& h);

  scan2pdf::option::map options () const;
  void assign (const std::string& key, const scan2pdf::value& v);
  void automate (const std::string& key);

protected:
  bool is_consecutive () const;
  bool obtain_media ();
  bool set_up_image ();
  void finish_image ();
  void finish_sequence ();

  scan2pdf::streamsize sgetn (scan2pdf::octet *data,
                              scan2pdf::streamsize n);

private:
  //! Reads all option descriptors and values afresh
  void reload ();
  //! Re-reads the option at \a index
  void refresh (SANE_Int index);
  void update (SANE_Int index, SANE_Int info);

  scan2pdf::option load (SANE_Int index) const;
  SANE_Int index (const std::string& key) const;

  scan2pdf::streamsize read_(scan2pdf::octet *data,
                             scan2pdf::streamsize n);
  bool buffer_frame ();
  scan2pdf::context::size_type resolution () const;

  handle::ptr handle_;

  scan2pdf::option::map opts_;
  std::map< std::string, SANE_Int > index_;

  bool buffered_;
  std::vector< scan2pdf::octet > frame_;
  std::vector< scan2pdf::octet >::size_type offset_;
};

}       // namespace sane

#endif  /* sane_device_hpp_ */
