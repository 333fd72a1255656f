//  configuration.cpp -- scan option settings kept as JSON
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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <boost/throw_exception.hpp>

#include <json/json.h>

#include "scan2pdf/configuration.hpp"
#include "scan2pdf/exception.hpp"
#include "scan2pdf/format.hpp"
#include "scan2pdf/log.hpp"
#include "scan2pdf/quantity.hpp"
#include "scan2pdf/toggle.hpp"

namespace scan2pdf {

namespace {

const std::string auto_value ("auto");

system_error
invalid (const std::string& message)
{
  return system_error (system_error::invalid_configuration, message);
}

//! Converts a scalar JSON member into an option value
value
to_value (const std::string& key, const Json::Value& json)
{
  switch (json.type ())
    {
    case Json::booleanValue:
      return toggle (json.asBool ());
    case Json::intValue:
    case Json::uintValue:
      if (!json.isInt ())
        BOOST_THROW_EXCEPTION
          (invalid ((format ("%1%: value out of range") % key).str ())
           << option_name (key));
      return quantity (quantity::integer_type (json.asInt ()));
    case Json::realValue:
      return quantity (json.asDouble ());
    case Json::stringValue:
      return json.asString ();
    default:
      BOOST_THROW_EXCEPTION
        (invalid ((format ("%1%: not a boolean, number or string")
                   % key).str ())
         << option_name (key));
    }
}

//! Converts an option value into its JSON representation
struct to_json
  : public value::visitor< Json::Value >
{
  Json::Value operator() (const value::none&) const
  {
    return Json::Value ();
  }

  Json::Value operator() (const quantity& q) const
  {
    if (q.is_integral ())
      return Json::Value (Json::Int (q.amount< quantity::integer_type > ()));
    return Json::Value (q.amount< double > ());
  }

  Json::Value operator() (const std::string& s) const
  {
    return Json::Value (s);
  }

  Json::Value operator() (const toggle& t) const
  {
    return Json::Value (bool (t));
  }
};

//! Integer options are given whole numbers in any representation
//! and fixed options the value the backend will actually store
value
coerce (const option& opt, const value& v)
{
  if (!v.is< quantity > ()) return v;

  quantity q = v;
  if (option::integer == opt.type ())
    {
      if (!q.is_integral () && q.is_whole ())
        return quantity (q.amount< quantity::integer_type > ());
    }
  else if (option::fixed == opt.type ())
    {
      return option::to_fixed_point (q);
    }
  return v;
}

}       // namespace

configuration::configuration ()
{}

configuration
configuration::from_file (const std::string& path)
{
  std::ifstream is (path.c_str ());
  if (!is)
    {
      int ec = errno;
      BOOST_THROW_EXCEPTION
        (invalid ((format ("cannot read %1%: %2%")
                   % path % strerror (ec)).str ())
         << errinfo_file_name (path));
    }

  std::stringstream ss;
  ss << is.rdbuf ();

  try
    {
      return from_json (ss.str (), path);
    }
  catch (boost::exception& e)
    {
      e << errinfo_file_name (path);
      throw;
    }
}

configuration
configuration::from_json (const std::string& text, const std::string& origin)
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = true;

  Json::Value root;
  std::string errors;
  std::istringstream is (text);

  if (!Json::parseFromStream (builder, is, &root, &errors))
    {
      log::debug ("%1%: %2%") % origin % errors;
      BOOST_THROW_EXCEPTION
        (invalid ((format ("%1%: malformed JSON") % origin).str ())
         << backend_status (errors));
    }
  if (!root.isObject ())
    {
      BOOST_THROW_EXCEPTION
        (invalid ((format ("%1%: not a JSON object") % origin).str ()));
    }

  configuration rv;
  Json::Value::Members keys = root.getMemberNames ();
  for (Json::Value::Members::const_iterator it = keys.begin ();
       keys.end () != it; ++it)
    {
      rv.values_[*it] = to_value (*it, root[*it]);
    }
  return rv;
}

configuration
configuration::from_device (const scanner& device)
{
  configuration rv;
  option::map opts = device.options ();

  for (option::map::const_iterator it = opts.begin ();
       opts.end () != it; ++it)
    {
      if (!it->is_configurable ()) continue;
      if (it->current ().is_none ()) continue;

      rv.values_[it->key ()] = it->current ();
    }
  return rv;
}

bool
configuration::is_inline (const std::string& arg)
{
  std::string::size_type pos = arg.find_first_not_of (" \t\r\n");

  return (std::string::npos != pos && '{' == arg[pos]);
}

std::string
configuration::default_path (const std::string& device)
{
  std::string rv (device);

  for (std::string::iterator it = rv.begin (); rv.end () != it; ++it)
    {
      char c = *it;
      if (!(('A' <= c && c <= 'Z')
            || ('a' <= c && c <= 'z')
            || ('0' <= c && c <= '9')
            || '.' == c || '_' == c || '-' == c))
        *it = '_';
    }
  return rv + ".json";
}

configuration&
configuration::merge (const configuration& overrides)
{
  for (value::map::const_iterator it = overrides.values_.begin ();
       overrides.values_.end () != it; ++it)
    {
      values_[it->first] = it->second;
    }
  return *this;
}

void
configuration::apply (scanner& device) const
{
  value::map pending (values_);

  {
    option::map opts = device.options ();
    for (value::map::const_iterator it = pending.begin ();
         pending.end () != it; ++it)
      {
        if (opts.end () == opts.find (it->first))
          BOOST_THROW_EXCEPTION
            (invalid ((format ("unknown option: %1%")
                       % it->first).str ())
             << option_name (it->first));
      }
  }

  for (option::map::size_type i = 0; !pending.empty (); ++i)
    {
      option::map opts = device.options ();
      if (opts.size () <= i) break;

      const option opt = *(opts.begin () + i);
      value::map::iterator it = pending.find (opt.key ());
      if (pending.end () == it) continue;

      const value v = coerce (opt, it->second);
      pending.erase (it);

      if (!opt.is_active ())
        BOOST_THROW_EXCEPTION
          (invalid ((format ("%1%: option is not active")
                     % opt.key ()).str ())
           << option_name (opt.key ()));

      if (!opt.is_configurable ())
        BOOST_THROW_EXCEPTION
          (invalid ((format ("%1%: option cannot be configured")
                     % opt.key ()).str ())
           << option_name (opt.key ()));

      if (opt.is_automatic () && v.is< std::string > ())
        {
          std::string s = v;
          if (auto_value == s)
            {
              log::brief ("%1%: automatic") % opt.key ();
              device.automate (opt.key ());
              continue;
            }
        }

      if (!opt.admits (v))
        BOOST_THROW_EXCEPTION
          (invalid ((format ("%1%: invalid value '%2%' (expected %3%)")
                     % opt.key () % v % opt.describe_constraint ()).str ())
           << option_name (opt.key ()));

      log::brief ("%1%: %2%") % opt.key () % v;
      device.assign (opt.key (), v);
    }

  if (!pending.empty ())
    {
      const std::string& key (pending.begin ()->first);
      BOOST_THROW_EXCEPTION
        (invalid ((format ("unknown option: %1%") % key).str ())
         << option_name (key));
    }
}

void
configuration::write (std::ostream& os) const
{
  Json::Value root (Json::objectValue);
  to_json convert;

  for (value::map::const_iterator it = values_.begin ();
       values_.end () != it; ++it)
    {
      if (it->second.is_none ()) continue;
      root[it->first] = it->second.apply (convert);
    }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";

  std::unique_ptr< Json::StreamWriter > writer (builder.newStreamWriter ());
  writer->write (root, &os);
  os << std::endl;
}

void
configuration::write (const std::string& path) const
{
  std::ofstream os (path.c_str (), std::ios_base::out | std::ios_base::trunc);
  if (!os)
    {
      int ec = errno;
      BOOST_THROW_EXCEPTION
        (system_error (system_error::write_error, strerror (ec))
         << errinfo_file_name (path));
    }

  write (os);
  os.close ();

  if (!os)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::write_error, "write failed")
         << errinfo_file_name (path));
    }
  log::brief ("wrote configuration to %1%") % path;
}

const value::map&
configuration::values () const
{
  return values_;
}

bool
configuration::empty () const
{
  return values_.empty ();
}

}       // namespace scan2pdf
