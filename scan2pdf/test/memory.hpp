//  memory.hpp -- in-memory image data producers and consumers
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

#ifndef scan2pdf_test_memory_hpp_
#define scan2pdf_test_memory_hpp_

#include <algorithm>
#include <string>
#include <vector>

#include <boost/throw_exception.hpp>

#include <stdexcept>

#include "../device.hpp"
#include "../filter.hpp"

namespace scan2pdf {
namespace test {

//!  Devices that produce a predictable octet sequence
/*!  Every image consists of ctx.octets_per_image() octets, each set
 *   to the lower eight bits of the sum of its offset in the image and
 *   the image's zero-offset index.  A device constructed for more than
 *   a single image behaves like one with a document feeder.
 */
class pattern_idevice : public idevice
{
  const unsigned image_count_;

  streamsize octets_left_;
  unsigned   images_left_;
  unsigned   image_;

protected:
  bool is_consecutive () const
  { return 1 < image_count_; }
  bool set_up_sequence ()
  {
    images_left_ = image_count_;
    image_ = 0;
    return true;
  }
  bool obtain_media ()
  { return 0 < images_left_; }
  bool set_up_image ()
  {
    if (0 == images_left_) return false;
    --images_left_;
    octets_left_ = ctx_.octets_per_image ();
    return true;
  }
  void finish_image ()
  { ++image_; }
  streamsize sgetn (octet *data, streamsize n)
  {
    if (cancel_requested ()) return traits::eof ();

    streamsize rv = std::min (octets_left_, n);
    streamsize offset = ctx_.octets_per_image () - octets_left_;
    for (streamsize i = 0; i < rv; ++i)
      data[i] = octet ((offset + i + image_) & 0xff);
    octets_left_ -= rv;
    return rv;
  }

public:
  pattern_idevice (const context& ctx, unsigned image_count = 1)
    : idevice (ctx)
    , image_count_(image_count)
    , octets_left_(0)
    , images_left_(0)
    , image_(0)
  {
    if (context::unknown_size == ctx_.width ()
        || context::unknown_size == ctx_.height ())
      {
        BOOST_THROW_EXCEPTION
          (std::domain_error ("cannot handle unknown sizes"));
      }
  }

  //!  Octet at \a offset in the zero-offset \a image
  static octet expected (streamsize offset, unsigned image = 0)
  { return octet ((offset + image) & 0xff); }
};

//!  Devices that keep everything they are given
/*!  Image data is collected per image, together with the context it
 *   was announced with.  All markers are recorded in order.  A \a
 *   max_write limits the number of octets accepted per write() so
 *   that callers' handling of partial writes gets exercised.
 */
class memory_odevice : public odevice
{
public:
  explicit memory_odevice (streamsize max_write = 0)
    : max_write_(max_write)
  {}

  streamsize write (const octet *data, streamsize n)
  {
    if (max_write_ && max_write_ < n) n = max_write_;
    data_.append (data, n);
    return n;
  }

  //!  All octets received since the beginning of the sequence
  const std::string& data () const { return data_; }

  //!  Octets of each completed image
  const std::vector< std::string >& images () const { return images_; }

  //!  Contexts as announced at the beginning of each image
  const std::vector< context >& contexts () const { return contexts_; }

  const std::vector< traits::int_type >& markers () const
  { return markers_; }

protected:
  void bos (const context&)
  {
    data_.clear ();
    images_.clear ();
    contexts_.clear ();
    markers_.clear ();
    markers_.push_back (traits::bos ());
  }
  void boi (const context& ctx)
  {
    start_ = data_.size ();
    contexts_.push_back (ctx);
    markers_.push_back (traits::boi ());
  }
  void eoi (const context&)
  {
    images_.push_back (data_.substr (start_));
    markers_.push_back (traits::eoi ());
  }
  void eos (const context&)
  { markers_.push_back (traits::eos ()); }
  void eof (const context&)
  { markers_.push_back (traits::eof ()); }

private:
  streamsize max_write_;
  std::string::size_type start_;

  std::string data_;
  std::vector< std::string > images_;
  std::vector< context > contexts_;
  std::vector< traits::int_type > markers_;
};

//!  Filters that %output their %input unchanged
class thru_filter : public filter
{
public:
  streamsize write (const octet *data, streamsize n)
  { return output_->write (data, n); }

protected:
  void bos (const context& ctx) { ctx_ = ctx; }
  void boi (const context& ctx) { ctx_ = ctx; }
};

}       // namespace test
}       // namespace scan2pdf

#endif  /* scan2pdf_test_memory_hpp_ */
