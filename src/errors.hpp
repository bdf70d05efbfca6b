/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace accu2git
{

class conversion_error: public std::runtime_error
  {
  public:
    explicit conversion_error(std::string const& message)
        : std::runtime_error(message)
      {
      }
  };

// An external command failed or answered with something unreadable.
// Worth another try.
class transient_error: public conversion_error
  {
  public:
    explicit transient_error(std::string const& message)
        : conversion_error(message)
      {
      }
  };

// Stops the whole run.
class fatal_error: public conversion_error
  {
  public:
    explicit fatal_error(std::string const& message)
        : conversion_error(message)
      {
      }
  };

// The persisted state contradicts itself.  Never retried.
class invariant_violation: public fatal_error
  {
  public:
    explicit invariant_violation(std::string const& message)
        : fatal_error("invariant violation: " + message)
      {
      }
  };

// Unknown transaction kinds, bad configuration values.
class unrecognized_input: public fatal_error
  {
  public:
    explicit unrecognized_input(std::string const& message)
        : fatal_error(message)
      {
      }
  };

inline void check_invariant(bool condition, std::string const& message)
  {
  if (!condition)
    {
    throw invariant_violation(message);
    }
  }

} // namespace accu2git

#endif /* ERRORS_HPP */
