//  fake-backend.hpp -- in-memory scanning devices for testing
//  Copyright (C) 2026  scan2pdf developers
//
//  License: GPL-3.0+
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

#ifndef scan2pdf_test_fake_backend_hpp_
#define scan2pdf_test_fake_backend_hpp_

#include <algorithm>
#include <csignal>
#include <string>
#include <utility>
#include <vector>

#include <boost/throw_exception.hpp>

#include <scan2pdf/backend.hpp>
#include <scan2pdf/exception.hpp>
#include <scan2pdf/format.hpp>
#include <scan2pdf/memory.hpp>
#include <scan2pdf/option.hpp>
#include <scan2pdf/range.hpp>
#include <scan2pdf/scanner.hpp>
#include <scan2pdf/store.hpp>

namespace scan2pdf {
namespace test {

//! What a fake device does when asked to scan
struct fake_device
{
  explicit fake_device (const std::string& name_)
    : name (name_)
    , documents (1)
    , fail_at (-1)
    , interrupt_at (-1)
    , interrupt_on_assign (false)
    , width (16)
    , height (8)
  {}

  std::string name;

  //! Number of documents in the feeder, at most one is used otherwise
  int documents;
  //! Zero-offset image at which acquisition fails half-way, if any
  int fail_at;
  //! Zero-offset image at which SIGTERM is raised, if any
  int interrupt_at;
  //! Raises SIGTERM whenever a setting is assigned
  bool interrupt_on_assign;

  context::size_type width;
  context::size_type height;
};

//! Observations shared between a fake_backend and its scanners
struct fake_state
{
  fake_state ()
    : open_handles (0)
  {}

  int open_handles;

  //! Settings in the order they reached a device, "auto" for automate()
  std::vector< std::pair< std::string, value > > assigned;
};

//! A scanner with a SANE-like set of options and generated images
/*! The "mode" option determines the pixel type.  Its "Lineart"
 *  setting activates the "threshold" option, which is listed after
 *  it.  A "source" with "ADF" in its name makes the device scan all
 *  documents.
 */
class fake_scanner
  : public scanner
{
public:
  fake_scanner (const fake_device& device, const shared_ptr< fake_state >& s)
    : device_(device)
    , state_(s)
    , left_(0)
    , image_(0)
    , octets_(0)
  {
    ++state_->open_handles;

    const int resolutions[] = { 75, 150, 300 };
    const quantity max_br_x (option::to_fixed_point (quantity (215.9)));
    store *res = from< store > ()->alternatives (resolutions,
                                                 resolutions + 3);

    opts_.insert (option ("resolution", option::integer, option::dpi)
                  .constrain (res).current (quantity (75)));
    opts_.insert (option ("mode", option::string)
                  .constrain (from< store > ()
                              ->alternative (std::string ("Color"))
                              ->alternative (std::string ("Gray"))
                              ->alternative (std::string ("Lineart")))
                  .current (std::string ("Color")));
    opts_.insert (option ("threshold", option::integer, option::no_unit, 1,
                          (option::soft_select | option::soft_detect
                           | option::inactive))
                  .constrain (from< range > ()
                              ->bounds (quantity (0), quantity (255)))
                  .current (quantity (128)));
    opts_.insert (option ("source", option::string)
                  .constrain (from< store > ()
                              ->alternative (std::string ("Flatbed"))
                              ->alternative (std::string ("ADF Front")))
                  .current (std::string ("Flatbed")));
    opts_.insert (option ("preview", option::boolean)
                  .current (toggle (false)));
    opts_.insert (option ("br-x", option::fixed, option::mm)
                  .constrain (from< range > ()
                              ->bounds (quantity (0.0), max_br_x))
                  .current (max_br_x));
    opts_.insert (option ("brightness", option::integer, option::no_unit, 1,
                          (option::soft_select | option::soft_detect
                           | option::automatic))
                  .constrain (from< range > ()
                              ->bounds (quantity (-100), quantity (100)))
                  .current (quantity (0)));
    opts_.insert (option ("calibrate", option::button));
    opts_.insert (option ("lamp", option::boolean, option::no_unit, 1,
                          option::hard_select | option::soft_detect)
                  .current (toggle (true)));
    opts_.insert (option ("gamma-table", option::integer, option::no_unit,
                          256));
  }

  ~fake_scanner ()
  {
    --state_->open_handles;
  }

  option::map options () const
  {
    return opts_;
  }

  void assign (const std::string& key, const value& v)
  {
    option::map::iterator it = lookup (key);

    if (!it->is_configurable () || !it->admits (v))
      {
        BOOST_THROW_EXCEPTION
          (system_error (system_error::invalid_configuration,
                         (format ("%1%: invalid argument") % key).str ())
           << option_name (key));
      }
    it->current (v);
    state_->assigned.push_back (std::make_pair (key, v));
    if (device_.interrupt_on_assign) std::raise (SIGTERM);

    if ("mode" == key)
      {
        option::map::iterator t = opts_.find ("threshold");
        std::string mode = v;
        int caps = t->capabilities () & ~option::inactive;
        if ("Lineart" != mode) caps |= option::inactive;
        t->capabilities (caps);
      }
  }

  void automate (const std::string& key)
  {
    option::map::iterator it = lookup (key);

    if (!it->is_automatic ())
      {
        BOOST_THROW_EXCEPTION
          (system_error (system_error::invalid_configuration,
                         (format ("%1%: not automatic") % key).str ())
           << option_name (key));
      }
    it->current (quantity (42));
    state_->assigned.push_back
      (std::make_pair (key, value (std::string ("auto"))));
  }

protected:
  bool is_consecutive () const
  {
    std::string source = opts_["source"].current ();
    return std::string::npos != source.find ("ADF");
  }

  bool set_up_sequence ()
  {
    left_  = (is_consecutive ()
              ? device_.documents
              : std::min (device_.documents, 1));
    image_ = 0;
    return true;
  }

  bool obtain_media ()
  {
    if (cancel_requested ()) return false;
    return 0 < left_;
  }

  bool set_up_image ()
  {
    std::string mode = opts_["mode"].current ();
    context::pixel_type type = context::RGB8;
    /**/ if ("Gray" == mode)    type = context::GRAY8;
    else if ("Lineart" == mode) type = context::MONO;

    quantity res = opts_["resolution"].current ();

    ctx_ = context (device_.width, device_.height, type);
    ctx_.resolution (res.amount< int > ());

    octets_ = ctx_.octets_per_image ();
    --left_;
    return true;
  }

  void finish_image ()
  {
    ++image_;
  }

  streamsize sgetn (octet *data, streamsize n)
  {
    if (image_ == device_.interrupt_at) std::raise (SIGTERM);
    if (cancel_requested ()) return traits::eof ();

    if (image_ == device_.fail_at
        && 2 * octets_ <= ctx_.octets_per_image ())
      {
        BOOST_THROW_EXCEPTION
          (system_error (system_error::scan_failed, "paper jam"));
      }

    streamsize rv = std::min< streamsize > (n, octets_);
    for (streamsize i = 0; i < rv; ++i)
      data[i] = octet ((image_ * 31 + i) & 0xff);
    octets_ -= rv;
    return rv;
  }

private:
  option::map::iterator lookup (const std::string& key)
  {
    option::map::iterator it = opts_.find (key);
    if (opts_.end () == it)
      {
        BOOST_THROW_EXCEPTION
          (system_error (system_error::invalid_configuration,
                         (format ("unknown option: %1%") % key).str ())
           << option_name (key));
      }
    return it;
  }

  fake_device device_;
  shared_ptr< fake_state > state_;
  option::map opts_;

  int left_;
  int image_;
  streamsize octets_;
};

//! A backend that knows a configurable set of fake devices
class fake_backend
  : public backend
{
public:
  fake_backend ()
    : state_(make_shared< fake_state > ())
    , unavailable_(false)
  {}

  fake_backend& add (const fake_device& device)
  {
    devices_.push_back (device);
    return *this;
  }

  //! Makes device enumeration fail
  void unavailable (bool yes)
  {
    unavailable_ = yes;
  }

  std::vector< scanner::info > devices ()
  {
    if (unavailable_)
      {
        BOOST_THROW_EXCEPTION
          (system_error (system_error::backend_unavailable,
                         "fake backend switched off"));
      }

    std::vector< scanner::info > rv;
    for (size_t i = 0; i < devices_.size (); ++i)
      rv.push_back (scanner::info (devices_[i].name, "Fake", "Scanner"));
    return rv;
  }

  scanner::ptr open (const std::string& name)
  {
    for (size_t i = 0; i < devices_.size (); ++i)
      {
        if (name == devices_[i].name)
          return make_shared< fake_scanner > (devices_[i], state_);
      }
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_not_found,
                     (format ("%1%: no such device") % name).str ()));
  }

  const fake_state& state () const
  {
    return *state_;
  }

private:
  shared_ptr< fake_state > state_;
  std::vector< fake_device > devices_;
  bool unavailable_;
};

}       // namespace test
}       // namespace scan2pdf

#endif  /* scan2pdf_test_fake_backend_hpp_ */
