//  log.hpp -- formatted messages based on priority and category
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
#ifndef scan2pdf_log_hpp_
#define scan2pdf_log_hpp_

#include <ostream>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>
#include <boost/throw_exception.hpp>

#include "format.hpp"

#ifndef SCAN2PDF_LOG_ARGUMENT_COUNT_CHECK_ENABLED
#define SCAN2PDF_LOG_ARGUMENT_COUNT_CHECK_ENABLED true
#endif

namespace scan2pdf {

//! Prioritised diagnostics with boost::format style arguments
/*! Messages are created with one of the named constructors, fed their
 *  arguments with operator%() and written to log::sink when they go
 *  out of scope, as in
 *
 *  \code
 *  log::error ("%1%: cannot open") % name;
 *  \endcode
 *
 *  Messages that are not important enough given log::threshold, or
 *  that are outside the log::matching categories, only count their
 *  arguments.  Argument count mismatches raise boost::io exceptions
 *  if log::arg_count_checking is enabled.
 */
class log
{
public:
  enum priority {
    FATAL,                      //!< famous last words
    ALERT,                      //!< something is amiss but we carry on
    ERROR,                      //!< something went wrong
    BRIEF,                      //!< short informational notes
    TRACE,                      //!< progress of an operation
    DEBUG,                      //!< the gory details
  };

  enum category {
    NOTHING = 0,
    BACKEND = 1 << 0,           //!< scanning backend interaction
    ALL     = ~0,
  };

  static const bool
  arg_count_checking = SCAN2PDF_LOG_ARGUMENT_COUNT_CHECK_ENABLED;

  //! The least important priority that still gets logged
  static priority threshold;
  //! Categories that get logged, ALL by default
  static category matching;
  //! Where messages are written, std::clog by default
  static std::ostream *sink;

  //! The lower case name of a priority \a level
  static const char * priority_name (int level);

  //! Looks up the priority named \a name
  /*! Names are the lower case versions of the priority enumerators.
   *  Returns \c false, leaving \a level alone, for unknown names.
   */
  static bool
  priority_from_name (const std::string& name, priority& level);

  class message
  {
  public:
    typedef boost::format format_type;

    //! Creates a message that is never output
    message ()
      : level_(DEBUG), arg_(0), cnt_(0), dumped_(false)
    {}

    //! Creates a message that will be output at \a level
    message (priority level, const format_type& fmt)
      : timestamp_(boost::posix_time::microsec_clock::local_time ())
      , fmt_(fmt)
      , level_(level), arg_(fmt.cur_arg_), cnt_(fmt.num_args_)
      , dumped_(false)
    {
      if (!arg_count_checking)
        fmt_->exceptions (fmt_->exceptions ()
                          & ~(boost::io::too_many_args_bit
                              | boost::io::too_few_args_bit));
    }

    //! Creates a message that only checks its argument count
    explicit message (const format_type& fmt)
      : level_(DEBUG), arg_(fmt.cur_arg_), cnt_(fmt.num_args_)
      , dumped_(false)
    {}

    //! Supplies placeholders for missing arguments and outputs
    ~message ()
    {
      if (dumped_) return;

      if (arg_ < cnt_ && arg_count_checking)
        log::error ("log message lacks arguments: %1% < %2%")
          % arg_ % cnt_;

      while (arg_ < cnt_)
        {
          *this % (format ("%%%1%%%") % (arg_ + 1)).str ();
        }
      if (fmt_) *sink << str ();
    }

    template< typename T >
    message& operator% (const T& t)
    {
      ++arg_;
      if (fmt_)
        {
          *fmt_ % t;
        }
      else if (arg_count_checking && arg_ > cnt_)
        {
          BOOST_THROW_EXCEPTION (boost::io::too_many_args (arg_, cnt_));
        }
      return *this;
    }

    //! The timestamped log line, empty for suppressed messages
    std::string str () const
    {
      std::string rv;

      if (fmt_)
        {
          std::ostringstream os;
          os << *timestamp_ << " [" << priority_name (level_) << "]: "
             << *fmt_ << "\n";
          rv = os.str ();
        }
      else if (arg_count_checking && arg_ < cnt_)
        {
          BOOST_THROW_EXCEPTION (boost::io::too_few_args (arg_, cnt_));
        }
      dumped_ = true;
      return rv;
    }

  private:
    boost::optional< boost::posix_time::ptime > timestamp_;
    boost::optional< format_type > fmt_;
    priority level_;
    int arg_;
    int cnt_;
    mutable bool dumped_;
  };

  //! Creates a message at \a level in category \a cat
  /*! The \a fmt may be anything a boost::format can be constructed
   *  from.  It is only parsed when the message will be output or its
   *  arguments need counting.
   */
  template< typename F >
  static message
  make (priority level, int cat, const F& fmt)
  {
    if (make_noise (level, cat))
      return message (level, message::format_type (fmt));
    if (arg_count_checking)
      return message (message::format_type (fmt));
    return message ();
  }

#define SCAN2PDF_LOG_NAMED_CTOR(name,level)                     \
  template< typename F >                                        \
  static message name (const F& fmt)                            \
  { return make (level, ALL, fmt); }                            \
  template< typename F >                                        \
  static message name (int cat, const F& fmt)                   \
  { return make (level, cat, fmt); }                            \
  /**/

  SCAN2PDF_LOG_NAMED_CTOR (fatal, FATAL)
  SCAN2PDF_LOG_NAMED_CTOR (alert, ALERT)
  SCAN2PDF_LOG_NAMED_CTOR (error, ERROR)
  SCAN2PDF_LOG_NAMED_CTOR (brief, BRIEF)
  SCAN2PDF_LOG_NAMED_CTOR (trace, TRACE)
  SCAN2PDF_LOG_NAMED_CTOR (debug, DEBUG)

#undef SCAN2PDF_LOG_NAMED_CTOR

private:
  static bool make_noise (int level, int cat)
  {
    return threshold >= level && (matching & cat);
  }
};

inline std::ostream&
operator<< (std::ostream& os, const log::message& msg)
{
  return os << msg.str ();
}

}       // namespace scan2pdf

#endif  /* scan2pdf_log_hpp_ */
