//  writer.cpp -- putting PDF objects in a file
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iomanip>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "primitive.hpp"
#include "writer.hpp"

namespace scan2pdf {
namespace _flt_ {
namespace _pdf_ {

using std::logic_error;

writer::writer ()
  : octets_seen_(0)
  , next_num_(1)
  , in_stream_(false)
  , stream_start_(0)
  , length_num_(0)
{}

void
writer::reset ()
{
  buffer_.str ("");
  octets_seen_ = 0;
  next_num_ = 1;
  xref_.clear ();
  in_stream_ = false;
  stream_start_ = 0;
  length_num_ = 0;
}

std::size_t
writer::reserve ()
{
  return next_num_++;
}

void
writer::header ()
{
  check_mode (false, "header");

  // The second line tells file transfer tools the content is binary
  std::string s ("%PDF-1.4\n%\xe2\xe3\xcf\xd3\n");
  buffer_ << s;
  octets_seen_ += s.size ();
}

void
writer::write (std::size_t num, const object& obj)
{
  check_mode (false, "object");

  xref_[num] = octets_seen_;

  std::ostringstream ss;
  ss << num << " 0 obj\n" << obj << "\nendobj\n";
  buffer_ << ss.str ();
  octets_seen_ += ss.str ().size ();
}

void
writer::begin_stream (std::size_t num, const dictionary& dict)
{
  check_mode (false, "begin_stream");

  length_num_ = reserve ();

  dictionary d (dict);
  d.insert ("Length", reference (length_num_));

  xref_[num] = octets_seen_;

  std::ostringstream ss;
  ss << num << " 0 obj\n" << d << "\nstream\n";
  buffer_ << ss.str ();
  octets_seen_ += ss.str ().size ();

  stream_start_ = octets_seen_;
  in_stream_ = true;
}

void
writer::write (const octet *data, streamsize n)
{
  check_mode (true, "stream data");

  buffer_.write (reinterpret_cast< const char * > (data), n);
  octets_seen_ += n;
}

void
writer::write (const std::string& s)
{
  check_mode (true, "stream data");

  buffer_ << s;
  octets_seen_ += s.size ();
}

void
writer::end_stream ()
{
  check_mode (true, "end_stream");

  std::size_t length = octets_seen_ - stream_start_;
  std::string s ("\nendstream\nendobj\n");
  buffer_ << s;
  octets_seen_ += s.size ();

  in_stream_ = false;
  write (length_num_, primitive (length));
}

void
writer::trailer (const dictionary& trailer_dict)
{
  check_mode (false, "trailer");

  std::size_t size = next_num_;
  std::size_t xref_pos = octets_seen_;

  // Every entry is exactly 20 octets, end-of-line included
  std::ostringstream ss;
  ss << "xref\n"
     << "0 " << size << "\n"
     << "0000000000 65535 f \n";
  for (std::size_t num = 1; num < size; ++num)
    {
      std::map< std::size_t, std::size_t >::const_iterator
        it = xref_.find (num);

      if (xref_.end () == it)
        ss << "0000000000 00000 f \n";
      else
        ss << std::setw (10) << std::setfill ('0') << it->second
           << " 00000 n \n";
    }

  dictionary d (trailer_dict);
  d.insert ("Size", primitive (size));

  ss << "trailer\n" << d << "\n"
     << "startxref\n" << xref_pos << "\n"
     << "%%EOF\n";

  buffer_ << ss.str ();
  octets_seen_ += ss.str ().size ();
}

void
writer::flush (output& output)
{
  std::string s (buffer_.str ());
  buffer_.str ("");

  const octet *p = reinterpret_cast< const octet * > (s.data ());
  streamsize n = s.size ();

  while (0 < n)
    {
      streamsize m = output.write (p, n);
      p += m;
      n -= m;
    }
}

std::size_t
writer::octets_seen () const
{
  return octets_seen_;
}

void
writer::check_mode (bool in_stream, const char *what) const
{
  if (in_stream_ != in_stream)
    {
      BOOST_THROW_EXCEPTION
        (logic_error (std::string ("PDF writer: unexpected ") + what
                      + (in_stream_ ? " in stream mode" : " in object mode")));
    }
}

}       // namespace _pdf_
}       // namespace _flt_
}       // namespace scan2pdf
