//  iobase.hpp -- input and output API for image data sequences
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

#ifndef scan2pdf_iobase_hpp_
#define scan2pdf_iobase_hpp_

#include "context.hpp"
#include "memory.hpp"
#include "octet.hpp"

namespace scan2pdf {

//!  Common aspects of image data production
class input
{
public:
  typedef shared_ptr< input > ptr;

  virtual ~input ();

  //! Produces up to \a n octets of image \a data
  /*! Each invocation reads up to \a n octets into the caller supplied
   *  \a data buffer.  At the state transitions of the acquisition
   *  process no image data is read but a marker is returned instead.
   *
   *  Inputs start out in the traits::eos() state.  A scan sequence
   *  passes through traits::bos() and then, for every image, through
   *  traits::boi() and traits::eoi().  It finishes successfully with
   *  traits::eos().  A sequence may hold no images at all, in which
   *  case traits::bos() is followed directly by traits::eos().
   *
   *  Whenever image data cannot be acquired completely, read() ends
   *  the sequence with traits::eof() instead.  That is, traits::eof()
   *  signals \e failure or cancellation whereas traits::eos() means
   *  \e success.
   *
   *  Only while at traits::boi() will read() produce image \a data.
   *  The return value is then non-negative and counts the octets put
   *  in the buffer.
   *
   *  \sa marker(), traits
   */
  virtual streamsize read (octet *data, streamsize n) = 0;

  //! Returns the value of the current sequence marker
  /*! Equivalent to
   *  \code
   *  read (NULL, 0);
   *  \endcode
   */
  virtual streamsize marker () = 0;

  virtual void cancel () {};

  virtual streamsize buffer_size () const;
  virtual context get_context () const;

protected:
  input (const context& ctx = context ());

  streamsize buffer_size_;
  context ctx_;
};

//!  Common aspects of image data consumption
class output
{
public:
  typedef shared_ptr< output > ptr;

  virtual ~output ();

  //!  Consumes up to \a n octets of image \a data
  /*!  \return the number of image data octets consumed.  If no octets
   *   were consumed, zero will be returned.
   */
  virtual streamsize write (const octet *data, streamsize n) = 0;

  //!  Puts a sequence marker in the %output
  /*!  Dispatches to one of the protected hooks based on the value of
   *   \a c.  Implementations that delegate to another %output need to
   *   override this function so the marker reaches their delegate.
   */
  virtual void mark (traits::int_type c, const context& ctx);

  virtual streamsize buffer_size () const;
  virtual context get_context () const;

protected:
  output ();

  //!  Marks the beginning of a scan sequence
  virtual void bos (const context& ctx);
  //!  Marks the beginning of an image
  virtual void boi (const context& ctx);
  //!  Marks the end of an image
  virtual void eoi (const context& ctx);
  //!  Marks the end of a scan sequence
  virtual void eos (const context& ctx);
  //!  Marks the cancellation of image data production
  virtual void eof (const context& ctx);

  streamsize buffer_size_;
  context ctx_;
};

//!  Pipes all image data from \a iref to \a oref
/*!  Provided \a iref is at the beginning of a scan sequence, images
 *   are acquired and sent to \a oref until \a iref signals the end
 *   of the sequence.  Both begin and end are marked on \a oref.
 *
 *   \return a sequence marker, traits::eos() on successful completion
 *
 *   \sa operator>>
 */
streamsize operator|  (input& iref, output& oref);

//!  Acquires a single image from \a iref and sends it to \a oref
/*!  Provided \a iref is at the beginning of an image, its data is
 *   acquired and sent to \a oref until \a iref signals the end of
 *   the image.  Both begin and end are marked on \a oref.
 *
 *   \return a sequence marker, traits::eoi() on successful completion
 *
 *   \sa operator|
 */
streamsize operator>> (input& iref, output& oref);

enum constants {
  default_buffer_size = 8192
};

}       // namespace scan2pdf

#endif  /* scan2pdf_iobase_hpp_ */
