//  commands.cpp -- list, configure and scan operations
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>

#include <scan2pdf/configuration.hpp>
#include <scan2pdf/exception.hpp>
#include <scan2pdf/file.hpp>
#include <scan2pdf/log.hpp>
#include <scan2pdf/memory.hpp>
#include <scan2pdf/stream.hpp>

#include "../filters/bit-depth.hpp"
#include "../filters/jpeg.hpp"
#include "../filters/padding.hpp"
#include "../filters/pdf.hpp"

#include "commands.hpp"

namespace scan2pdf {
namespace cmd {

namespace {

//! Device for cancel_scan() to act on
idevice * volatile active_device = NULL;

volatile sig_atomic_t interrupted = false;

//! Makes a device available to cancel_scan() for as long as it lives
class activation
{
public:
  explicit activation (idevice& device)
  {
    active_device = &device;
  }

  ~activation ()
  {
    active_device = NULL;
  }
};

system_error
scan_failed (const std::string& message)
{
  return system_error (system_error::scan_failed, message);
}

configuration
assemble (const std::vector< std::string >& args)
{
  configuration files;
  configuration inlined;

  std::vector< std::string >::const_iterator it;
  for (it = args.begin (); args.end () != it; ++it)
    {
      if (configuration::is_inline (*it))
        {
          inlined.merge (configuration::from_json (*it));
        }
      else
        {
          log::brief ("reading configuration from %1%") % *it;
          files.merge (configuration::from_file (*it));
        }
    }
  return files.merge (inlined);
}

}       // namespace

void
list_devices (backend& be, std::ostream& os)
{
  std::vector< scanner::info > devices (be.devices ());

  std::vector< scanner::info >::const_iterator it;
  for (it = devices.begin (); devices.end () != it; ++it)
    {
      log::debug ("%1%: %2% %3% (%4%)")
        % it->name () % it->vendor () % it->model () % it->type ();
      os << it->name () << "\n";
    }
  os.flush ();
}

std::string
create_configuration (backend& be, const std::string& device,
                      const std::string& path, std::ostream& os)
{
  scanner::ptr dev (be.open (device));
  configuration cfg (configuration::from_device (*dev));

  if ("-" == path)
    {
      cfg.write (os);
      os.flush ();
      return path;
    }

  std::string rv (path.empty ()
                  ? configuration::default_path (device)
                  : path);

  cfg.write (rv);
  log::brief ("wrote %1% settings to %2%") % cfg.values ().size () % rv;

  if (path.empty ()) os << rv << std::endl;

  return rv;
}

context::size_type
scan (backend& be, const scan_request& request)
{
  interrupted = false;

  scanner::ptr dev (be.open (request.device));

  assemble (request.configurations).apply (*dev);

  shared_ptr< _flt_::pdf > pdf (make_shared< _flt_::pdf > ());
  shared_ptr< file_odevice > odev
    (make_shared< file_odevice > (request.target));

  stream str;
  str.push (make_shared< _flt_::padding > ());
  str.push (make_shared< _flt_::bit_depth > ());
  str.push (make_shared< _flt_::jpeg::compressor > ());
  str.push (pdf);
  str.push (odev);

  activation guard (*dev);

  // requests that arrived while no device was active
  if (interrupted)
    {
      BOOST_THROW_EXCEPTION (scan_failed ("scan cancelled"));
    }

  streamsize rv = dev->marker ();
  if (traits::bos () != rv)
    {
      BOOST_THROW_EXCEPTION
        (scan_failed (interrupted ? "scan cancelled" : "nothing to scan"));
    }

  try
    {
      str.mark (traits::bos (), dev->get_context ());
      while (   traits::eos () != rv
             && traits::eof () != rv)
        {
          if (interrupted) dev->cancel ();
          rv = *dev >> str;
        }
      str.mark (rv, dev->get_context ());
    }
  catch (const system_error&)
    {
      odev->mark (traits::eof (), context ());
      throw;
    }
  catch (const std::exception& e)
    {
      odev->mark (traits::eof (), context ());
      BOOST_THROW_EXCEPTION (scan_failed (e.what ()));
    }

  if (traits::eof () == rv)
    {
      BOOST_THROW_EXCEPTION (scan_failed ("scan cancelled"));
    }
  if (0 == pdf->page_count ())
    {
      BOOST_THROW_EXCEPTION (scan_failed ("nothing scanned"));
    }

  log::brief ("%1%: %2% pages") % request.target % pdf->page_count ();
  return pdf->page_count ();
}

void
cancel_scan ()
{
  interrupted = true;
  idevice *device = active_device;
  if (device) device->cancel ();
}

int
report (const std::exception& e, bool debug, std::ostream& os)
{
  if (debug)
    os << boost::diagnostic_information (e);
  else
    os << PACKAGE_TARNAME ": " << e.what () << "\n";
  return EXIT_FAILURE;
}

}       // namespace cmd
}       // namespace scan2pdf
