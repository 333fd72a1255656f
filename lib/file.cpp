//  file.cpp -- image data sequence output to file
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/throw_exception.hpp>

#include "scan2pdf/exception.hpp"
#include "scan2pdf/file.hpp"
#include "scan2pdf/log.hpp"

namespace scan2pdf {

file_odevice::file_odevice (const std::string& filename)
  : filename_(filename)
  , fd_(-1)
  , fd_flags_(O_WRONLY | O_CREAT | O_CLOEXEC)
  , count_(0)
{}

file_odevice::~file_odevice ()
{
  close ();
}

std::size_t
file_odevice::count () const
{
  return count_;
}

void
file_odevice::open ()
{
  if (-1 != fd_)
    {
      log::trace ("file_odevice: may be leaking a file descriptor");
    }

  // Create non-executable files.  Note that these permission flags
  // are still subject to umask().

  const int fd_perms = (  S_IRUSR | S_IWUSR
                        | S_IRGRP | S_IWGRP
                        | S_IROTH | S_IWOTH
                        );

  fd_ = ::open (filename_.c_str (), fd_flags_ | O_TRUNC, fd_perms);
  if (-1 == fd_)
    {
      int ec = errno;
      BOOST_THROW_EXCEPTION
        (system_error (system_error::write_error, strerror (ec))
         << errinfo_file_name (filename_));
    }
  log::trace ("file_odevice: opened %1%") % filename_;
}

void
file_odevice::close ()
{
  if (-1 == fd_) return;

  if (-1 == ::close (fd_))
    {
      // Error conditions upon closing of a file descriptor are for
      // diagnostic purposes only.  Do NOT throw an exception here.

      log::alert (strerror (errno));
    }
  fd_ = -1;
}

streamsize
file_odevice::write (const octet *data, streamsize n)
{
  if (-1 == fd_)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::write_error, strerror (EBADF))
         << errinfo_file_name (filename_));
    }

  errno = 0;
  ssize_t rv = ::write (fd_, data, n);
  int ec = errno;

  if (0 < rv) return rv;

  // Nothing was written.  EAGAIN and EINTR are worth another try,
  // anything else is fatal.

  if (0 == rv || EINTR == ec || EAGAIN == ec)
    return 0;

  eof (ctx_);
  BOOST_THROW_EXCEPTION
    (system_error (system_error::write_error, strerror (ec))
     << errinfo_file_name (filename_));
}

void
file_odevice::bos (const context&)
{
  count_ = 0;
  open ();
}

void
file_odevice::eoi (const context&)
{
  ++count_;
}

void
file_odevice::eos (const context&)
{
  close ();
  if (0 == count_)
    {
      log::alert
        ("removing %1% because no images were produced")
        % filename_;
      remove ();
    }
}

void
file_odevice::eof (const context&)
{
  if (-1 == fd_) return;

  close ();
  remove ();
}

void
file_odevice::remove ()
{
  if (-1 == ::remove (filename_.c_str ()))
    {
      log::alert ("%1%: %2%") % filename_ % strerror (errno);
    }
}

}       // namespace scan2pdf
