//  device.cpp -- image acquisition from a SANE device
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>

#include <boost/throw_exception.hpp>

#include <scan2pdf/exception.hpp>
#include <scan2pdf/format.hpp>
#include <scan2pdf/quantity.hpp>

#include "descriptor.hpp"
#include "device.hpp"
#include "log.hpp"
#include "value.hpp"

namespace sane {

using scan2pdf::context;
using scan2pdf::format;
using scan2pdf::octet;
using scan2pdf::option;
using scan2pdf::quantity;
using scan2pdf::streamsize;
using scan2pdf::system_error;
using scan2pdf::traits;

namespace {

//! Word aligned scratch memory for a SANE option value
std::vector< SANE_Word >
scratch (const SANE_Option_Descriptor& sod)
{
  SANE_Int words = (sod.size + sizeof (SANE_Word) - 1) / sizeof (SANE_Word);
  return std::vector< SANE_Word > (std::max (words, SANE_Int (1)) + 1, 0);
}

system_error
scan_failed (const std::string& message, SANE_Status status)
{
  system_error e (system_error::scan_failed, message);
  e << scan2pdf::backend_status (sane_strstatus (status));
  return e;
}

std::string
lower (std::string s)
{
  for (std::string::iterator it = s.begin (); s.end () != it; ++it)
    {
      *it = std::tolower (static_cast< unsigned char > (*it));
    }
  return s;
}

}       // namespace

device::device (const handle::ptr& h)
  : handle_(h)
  , buffered_(false)
  , offset_(0)
{
  reload ();
}

option::map
device::options () const
{
  return opts_;
}

void
device::assign (const std::string& key, const scan2pdf::value& v)
{
  SANE_Int i = index (key);
  const SANE_Option_Descriptor *sod = handle_->descriptor (i);

  if (!sod || !SANE_OPTION_IS_SETTABLE (sod->cap)
      || !SANE_OPTION_IS_ACTIVE (sod->cap))
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::invalid_configuration,
                       (format ("%1%: option cannot be set") % key).str ())
         << scan2pdf::option_name (key));
    }

  value sv (v, *sod);
  std::vector< SANE_Word > buf (scratch (*sod));
  sv >> &buf[0];

  SANE_Int info = 0;
  SANE_Status status = handle_->set (i, &buf[0], &info);

  if (SANE_STATUS_GOOD != status)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::invalid_configuration,
                       (format ("%1%: value '%2%' rejected")
                        % key % v).str ())
         << scan2pdf::option_name (key)
         << scan2pdf::backend_status (sane_strstatus (status)));
    }

  update (i, info);

  if (info & SANE_INFO_INEXACT)
    {
      log::brief ("%1%: value adjusted from '%2%' to '%3%'")
        % key % v % opts_[key].current ();
    }
}

void
device::automate (const std::string& key)
{
  SANE_Int i = index (key);
  const SANE_Option_Descriptor *sod = handle_->descriptor (i);

  if (!sod || !(sod->cap & SANE_CAP_AUTOMATIC))
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::invalid_configuration,
                       (format ("%1%: option cannot be automated")
                        % key).str ())
         << scan2pdf::option_name (key));
    }

  SANE_Int info = 0;
  SANE_Status status = handle_->set (i, &info);

  if (SANE_STATUS_GOOD != status)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::invalid_configuration,
                       (format ("%1%: automatic value rejected")
                        % key).str ())
         << scan2pdf::option_name (key)
         << scan2pdf::backend_status (sane_strstatus (status)));
    }

  update (i, info);
}

bool
device::is_consecutive () const
{
  option::map::const_iterator it = opts_.find ("source");

  if (opts_.end () == it
      || !it->current ().is< std::string > ())
    return false;

  std::string source = it->current ();
  source = lower (source);

  return (std::string::npos != source.find ("adf")
          || std::string::npos != source.find ("feeder")
          || std::string::npos != source.find ("duplex"));
}

bool
device::obtain_media ()
{
  if (cancel_requested ()) return false;

  SANE_Status status = handle_->start ();

  if (SANE_STATUS_GOOD == status) return true;

  if (SANE_STATUS_NO_DOCS == status)
    {
      log::brief ("%1%: no more documents") % handle_->name ();
      handle_->cancel ();
      return false;
    }
  if (SANE_STATUS_CANCELLED == status)
    {
      log::brief ("%1%: cancelled") % handle_->name ();
      handle_->cancel ();
      return false;
    }

  BOOST_THROW_EXCEPTION
    (scan_failed ((format ("%1%: cannot start scan")
                   % handle_->name ()).str (), status));
}

bool
device::set_up_image ()
{
  SANE_Parameters p;
  SANE_Status status = handle_->parameters (&p);

  if (SANE_STATUS_GOOD != status)
    {
      BOOST_THROW_EXCEPTION
        (scan_failed ("cannot get scan parameters", status));
    }

  if (!(SANE_FRAME_GRAY == p.format || SANE_FRAME_RGB == p.format))
    {
      BOOST_THROW_EXCEPTION
        (scan_failed ("unsupported frame format", SANE_STATUS_UNSUPPORTED));
    }

  context::pixel_type type = context::unknown_type;
  /**/ if (SANE_FRAME_GRAY == p.format && 1 == p.depth)
    type = context::MONO;
  else if (SANE_FRAME_GRAY == p.format && 8 == p.depth)
    type = context::GRAY8;
  else if (SANE_FRAME_GRAY == p.format && 16 == p.depth)
    type = context::GRAY16;
  else if (SANE_FRAME_RGB == p.format && 8 == p.depth)
    type = context::RGB8;
  else if (SANE_FRAME_RGB == p.format && 16 == p.depth)
    type = context::RGB16;
  else
    {
      BOOST_THROW_EXCEPTION
        (scan_failed ((format ("unsupported bit depth: %1%")
                       % p.depth).str (), SANE_STATUS_UNSUPPORTED));
    }

  context ctx (p.pixels_per_line, p.lines, type);
  ctx.width (p.pixels_per_line, p.bytes_per_line - ctx.scan_width ());
  ctx.resolution (resolution ());
  ctx_ = ctx;

  log::debug ("%1%: %2%x%3% pixels, depth %4%, %5% octets per line")
    % handle_->name ()
    % p.pixels_per_line % p.lines % p.depth % p.bytes_per_line;

  buffered_ = false;
  if (0 > p.lines)
    {
      if (!buffer_frame ()) return false;

      if (0 == p.bytes_per_line)
        {
          BOOST_THROW_EXCEPTION
            (scan_failed ("zero length scan lines", SANE_STATUS_IO_ERROR));
        }
      ctx_.height (frame_.size () / p.bytes_per_line);
      buffered_ = true;
    }
  return true;
}

void
device::finish_image ()
{
  frame_.clear ();
  offset_ = 0;
  buffered_ = false;
}

void
device::finish_sequence ()
{
  finish_image ();
  if (handle_->is_scanning ()) handle_->cancel ();
}

streamsize
device::sgetn (octet *data, streamsize n)
{
  if (!buffered_) return read_(data, n);

  if (cancel_requested ())
    {
      handle_->cancel ();
      return traits::eof ();
    }

  streamsize rv = std::min (n, streamsize (frame_.size () - offset_));
  std::copy (frame_.begin () + offset_,
             frame_.begin () + offset_ + rv, data);
  offset_ += rv;

  return rv;
}

streamsize
device::read_(octet *data, streamsize n)
{
  const SANE_Int max_length
    = std::min (n, streamsize (std::numeric_limits< SANE_Int >::max ()));

  while (true)
    {
      if (cancel_requested ())
        {
          handle_->cancel ();
          return traits::eof ();
        }

      SANE_Int length = 0;
      SANE_Status status
        = handle_->read (reinterpret_cast< SANE_Byte * > (data),
                         max_length, &length);

      if (SANE_STATUS_GOOD == status)
        {
          if (0 < length) return length;
          continue;
        }
      if (SANE_STATUS_EOF == status)
        {
          return 0;
        }
      if (SANE_STATUS_CANCELLED == status)
        {
          log::brief ("%1%: cancelled") % handle_->name ();
          return traits::eof ();
        }

      BOOST_THROW_EXCEPTION
        (scan_failed ((format ("%1%: scan failed")
                       % handle_->name ()).str (), status));
    }
}

bool
device::buffer_frame ()
{
  frame_.clear ();
  offset_ = 0;

  std::vector< octet > buf (buffer_size ());
  streamsize n = 0;

  while (0 < (n = read_(&buf[0], buf.size ())))
    {
      frame_.insert (frame_.end (), buf.begin (), buf.begin () + n);
    }
  return traits::eof () != n;
}

context::size_type
device::resolution () const
{
  const char *keys[] = { "resolution", "x-resolution", "y-resolution" };

  for (size_t i = 0; i < sizeof (keys) / sizeof (*keys); ++i)
    {
      option::map::const_iterator it = opts_.find (keys[i]);
      if (opts_.end () != it && it->current ().is< quantity > ())
        {
          quantity q = it->current ();
          return q.amount< double > () + 0.5;
        }
    }
  return 0;
}

void
device::reload ()
{
  option::map opts;
  std::map< std::string, SANE_Int > index;

  SANE_Int n = handle_->size ();
  for (SANE_Int i = 1; i < n; ++i)
    {
      const SANE_Option_Descriptor *sod = handle_->descriptor (i);

      if (!sod || !sod->name || 0 == strlen (sod->name)) continue;
      if (SANE_TYPE_GROUP == sod->type) continue;
      if (index.count (sod->name))
        {
          log::alert ("%1%: duplicate option ignored") % sod->name;
          continue;
        }

      opts.insert (load (i));
      index[sod->name] = i;
    }

  opts_ = opts;
  index_ = index;
}

void
device::refresh (SANE_Int i)
{
  option opt (load (i));
  option::map::iterator it = opts_.find (opt.key ());

  if (opts_.end () == it)
    {
      reload ();
      return;
    }
  *it = opt;
}

void
device::update (SANE_Int i, SANE_Int info)
{
  if (info & SANE_INFO_RELOAD_OPTIONS)
    {
      log::debug ("%1%: reloading options") % handle_->name ();
      reload ();
    }
  else
    {
      refresh (i);
    }
}

option
device::load (SANE_Int i) const
{
  const SANE_Option_Descriptor *sod = handle_->descriptor (i);
  option rv (to_option (*sod));

  value v (*sod);
  if (!v.is_none ()
      && SANE_OPTION_IS_ACTIVE (sod->cap)
      && (sod->cap & SANE_CAP_SOFT_DETECT))
    {
      std::vector< SANE_Word > buf (scratch (*sod));
      SANE_Status status = handle_->get (i, &buf[0]);

      if (SANE_STATUS_GOOD == status)
        {
          v << &buf[0];
          rv.current (v);
        }
      else
        {
          log::error ("%1%: cannot get value (%2%)")
            % rv.key () % sane_strstatus (status);
        }
    }
  return rv;
}

SANE_Int
device::index (const std::string& key) const
{
  std::map< std::string, SANE_Int >::const_iterator it = index_.find (key);

  if (index_.end () == it)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::invalid_configuration,
                       (format ("unknown option: %1%") % key).str ())
         << scan2pdf::option_name (key));
    }
  return it->second;
}

}       // namespace sane
