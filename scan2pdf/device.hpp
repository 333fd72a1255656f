//  device.hpp -- interface declarations for image data producers and consumers
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

#ifndef scan2pdf_device_hpp_
#define scan2pdf_device_hpp_

#include <csignal>

#include "iobase.hpp"
#include "memory.hpp"

namespace scan2pdf {

//! Keeps track of the sequence marker an image data endpoint is at
template< typename IO >
class device
{
public:
  typedef shared_ptr< device > ptr;

  virtual ~device () {}

  //! Most recent sequence marker seen by the device
  traits::int_type last_marker () const
  {
    return last_marker_;
  }

protected:
  device ()
    : last_marker_(traits::eof ())
  {}

  traits::int_type last_marker_;
};

//!  Interface for image data producers
class idevice
  : public device< input >
  , public input
{
public:
  typedef shared_ptr< idevice > ptr;

  streamsize read (octet *data, streamsize n);
  streamsize marker ();

  //! Asks for the scan sequence in progress to end in traits::eof()
  /*! Only sets a flag, so it may be called from a signal handler.
   *  The request is ignored when no sequence is in progress.  A
   *  sequence that still ends in traits::eos() finished before the
   *  request could be honoured.
   *
   *  Subclasses can react mid-image by returning traits::eof() from
   *  sgetn() once cancel_requested() is true.  Otherwise the request
   *  turns the sequence's final traits::eos() into traits::eof().
   */
  void cancel ();

protected:
  idevice (const context& ctx = context ());

  //  Hooks driving the marker sequence.  A sequence starts with
  //  set_up_sequence() and obtain_media().  Each image starts with
  //  set_up_image() and is read with sgetn() until that returns 0.
  //  Further images are only attempted for is_consecutive() devices
  //  and only if obtain_media() succeeds again.

  //! \c false ends the sequence before it started, in traits::eof()
  virtual bool set_up_sequence ();
  //! \c true if a sequence may hold more than one image
  virtual bool is_consecutive () const;
  //! \c false means there is nothing (more) to scan
  virtual bool obtain_media ();
  //! \c false means no further image, the default
  virtual bool set_up_image ();
  virtual void finish_image ();

  //! Called exactly once when a started sequence ends
  /*! This includes sequences that end because a hook or sgetn()
   *  threw an exception.
   */
  virtual void finish_sequence ();

  //! Copies up to \a n octets of the current image into \a data
  /*! \return  the number of octets copied, \c 0 at the end of the
   *           image or traits::eof() to abandon the sequence
   */
  virtual streamsize sgetn (octet *data, streamsize n);

  //! Whether cancel() was called during the current sequence
  bool cancel_requested () const;

private:
  streamsize read_(octet *data, streamsize n);
  streamsize next_marker_(streamsize prev);
  void end_sequence_(streamsize prev);

  //! Set from the attempt to reach traits::bos() until the sequence ends
  volatile sig_atomic_t work_in_progress_;
  //! Only ever assigned a copy of work_in_progress_
  volatile sig_atomic_t cancel_requested_;
};

//!  Interface for image data consumers
class odevice
  : public device< output >
  , public output
{
public:
  typedef shared_ptr< odevice > ptr;

  void mark (traits::int_type c, const context& ctx);
};

}       // namespace scan2pdf

#endif  /* scan2pdf_device_hpp_ */
