//  writer.hpp -- putting PDF objects in a file
//  Copyright (C) 2012, 2014, 2015  SEIKO EPSON CORPORATION
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

#ifndef filters_pdf_writer_hpp_
#define filters_pdf_writer_hpp_

#include <cstddef>
#include <map>
#include <sstream>
#include <string>

#include <scan2pdf/iobase.hpp>

#include "dictionary.hpp"
#include "object.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

//! Serialises PDF objects into the basic PDF file structure
/*! The writer hands out object numbers, keeps the cross-reference
 *  table and buffers everything it produces until flush() passes it
 *  on to an output.
 *
 *  There are two modes.  In object mode, indirect objects are output
 *  all at once with write(std::size_t, const object&).  Between calls
 *  to begin_stream() and end_stream() the writer is in stream mode
 *  and accepts stream data piece by piece.  The stream's \c /Length
 *  is output as a separate indirect object at the end of the stream
 *  so that its value need not be known up front.
 *
 *  Calling a member function in the wrong mode is a logic error.
 */
class writer
{
public:
  writer ();

  //! Forgets everything so a new document can be started
  void reset ();

  //! Hands out the next unused object number
  std::size_t reserve ();

  //! Outputs the PDF header
  void header ();

  //! Outputs \a obj as indirect object number \a num
  void write (std::size_t num, const object& obj);

  //! Starts a stream object \a num described by \a dict
  /*! The \c /Length entry is added to (a copy of) \a dict.
   */
  void begin_stream (std::size_t num, const dictionary& dict);

  //! Appends \a n octets of \a data to the current stream
  void write (const octet *data, streamsize n);
  //! Appends \a s to the current stream
  void write (const std::string& s);

  void end_stream ();

  //! Outputs cross-reference table and file trailer
  /*! The \c /Size entry is added to \a trailer_dict.
   */
  void trailer (const dictionary& trailer_dict);

  //! Passes buffered PDF data on to \a output
  void flush (output& output);

  //! Number of octets produced since the header
  std::size_t octets_seen () const;

private:
  void check_mode (bool in_stream, const char *what) const;

  std::ostringstream buffer_;
  std::size_t octets_seen_;

  std::size_t next_num_;
  std::map< std::size_t, std::size_t > xref_;

  bool in_stream_;
  std::size_t stream_start_;
  std::size_t length_num_;
};

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf

#endif  /* filters_pdf_writer_hpp_ */
