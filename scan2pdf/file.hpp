//  file.hpp -- image data sequence output to file
//  Copyright (C) 2012-2014  SEIKO EPSON CORPORATION
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

#ifndef scan2pdf_file_hpp_
#define scan2pdf_file_hpp_

#include <cstddef>
#include <string>

#include "device.hpp"

namespace scan2pdf {

//!  Save an image data sequence to a single file
/*!  The file is created, or truncated, when the scan sequence begins.
 *   It is removed again when the sequence is cancelled or when it
 *   completes without producing any images so that no unusable file
 *   is left behind.
 *
 *   Failure to open or write the file is reported as a system_error
 *   with system_error::write_error code.
 */
class file_odevice
  : public odevice
{
public:
  //!  Creates a device that saves all image data in \a filename
  /*!  \note  The file will not be opened until the sequence of scans
   *          begins.
   */
  explicit file_odevice (const std::string& filename);

  ~file_odevice ();

  streamsize write (const octet *data, streamsize n);

  //!  Number of images seen in the current scan sequence
  std::size_t count () const;

protected:
  virtual void open ();
  virtual void close ();

  void bos (const context& ctx);
  void eoi (const context& ctx);
  void eos (const context& ctx);
  void eof (const context& ctx);

  void remove ();

  std::string filename_;

  int fd_;
  int fd_flags_;

  std::size_t count_;
};

}       // namespace scan2pdf

#endif  /* scan2pdf_file_hpp_ */
