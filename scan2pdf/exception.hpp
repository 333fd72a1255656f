//  exception.hpp -- error conditions reported to the user
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#ifndef scan2pdf_exception_hpp_
#define scan2pdf_exception_hpp_

#include <stdexcept>
#include <string>

#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/exception/exception.hpp>
#include <boost/exception/info.hpp>

namespace scan2pdf {

//! Device and utility related error conditions
/*! Inspired by C++11's std::system_error.  Every condition that is
 *  reported to the user of the utility maps onto exactly one of the
 *  error_code values.  The what() message is meant for end users and
 *  kept short.  Backend specific detail is attached separately, as
 *  Boost.Exception error information, so that it only shows up when
 *  diagnostic information is requested.
 *
 *  \code
 *  BOOST_THROW_EXCEPTION
 *    (system_error (system_error::scan_failed, "jammed")
 *     << backend_status ("Document feeder jammed"));
 *  \endcode
 */
class system_error
  : public std::runtime_error
  , public virtual boost::exception
{
public:
  enum error_code {
    no_error = 0,

    device_not_found,           //!< backend does not know the device
    backend_unavailable,        //!< backend cannot be used at all
    invalid_configuration,      //!< option settings cannot be applied
    write_error,                //!< output cannot be created or written
    scan_failed,                //!< image acquisition did not complete

    unknown_error               // keep this last
  };

  system_error ();
  system_error (error_code ec, const std::string& message);
  system_error (error_code ec, const char *message);

  const error_code& code () const;

private:
  error_code ec_;
};

//! Status message as reported by the scanning backend
typedef boost::error_info< struct tag_backend_status, std::string >
backend_status;

//! Name of the scan option involved in an error condition
typedef boost::error_info< struct tag_option_name, std::string >
option_name;

using boost::errinfo_file_name;

}       // namespace scan2pdf

#endif  /* scan2pdf_exception_hpp_ */
