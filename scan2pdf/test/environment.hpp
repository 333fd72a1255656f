//  environment.hpp -- control environment variables during testing
//  Copyright (C) 2012  SEIKO EPSON CORPORATION
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

#ifndef scan2pdf_test_environment_hpp_
#define scan2pdf_test_environment_hpp_

#include <cstdlib>

#include <algorithm>
#include <functional>
#include <map>
#include <regex>
#include <set>
#include <string>

extern "C" {
extern char **environ;
}

namespace scan2pdf {
namespace test {

//! Sanitize environment variables for testing purposes
/*! All package specific environment variables are removed when the
 *  fixture is instantiated and the environment's state is restored
 *  to what it was at that point on destruction.
 *
 *  The API mimicks the POSIX C APIs to get and set environment
 *  variables but is defined in terms of standard \c string objects.
 */
class environment
{
public:
  environment ()
  {
    clearenv_("(" PACKAGE_ENV_VAR_PREFIX "[^=]*)=.*");
  }

  //! Restore the original environment
  ~environment ()
  {
    using std::placeholders::_1;

    std::for_each (vars_set_.begin (), vars_set_.end (),
                   std::bind (&environment::unsetenv_, this, _1));
    std::for_each (mod_vars_.begin (), mod_vars_.end (),
                   std::bind (&environment::setenv_, this, _1));
  }

  const char *
  getenv (const std::string& variable) const
  {
    return ::getenv (variable.c_str ());
  }

  int
  setenv (const std::string& variable, const std::string& value)
  {
    maybe_save_current_(variable);
    vars_set_.insert (variable);

    return ::setenv (variable.c_str (), value.c_str (), 1);
  }

  int
  unsetenv (const std::string& variable)
  {
    maybe_save_current_(variable);

    return ::unsetenv (variable.c_str ());
  }

protected:
  typedef std::map< std::string, std::string > env_var_map;
  typedef std::set< std::string > env_var_set;

  void
  clearenv_(const std::string& regular_expression)
  {
    std::regex re (regular_expression);
    std::cmatch var;
    env_var_set matches;

    // Collect first, unsetting invalidates environ
    for (char **p = environ; p && *p; ++p)
      {
        if (std::regex_match (*p, var, re))
          matches.insert (var[1]);
      }
    std::for_each (matches.begin (), matches.end (),
                   std::bind (&environment::unsetenv, this,
                              std::placeholders::_1));
  }

  void
  maybe_save_current_(const std::string& variable)
  {
    const char *env_var (getenv (variable));

    if (env_var && !mod_vars_.count (variable))
      mod_vars_[variable] = env_var;
  }

  void
  setenv_(const env_var_map::value_type& v) const
  {
    ::setenv (v.first.c_str (), v.second.c_str (), 1);
  }

  void
  unsetenv_(const env_var_set::value_type& v) const
  {
    ::unsetenv (v.c_str ());
  }

  env_var_map mod_vars_;
  env_var_set vars_set_;
};

} // namespace test
} // namespace scan2pdf

#endif /* scan2pdf_test_environment_hpp_ */
