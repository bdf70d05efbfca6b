/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
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

#include "user_map.hpp"
#include "errors.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

namespace accu2git
{

static boost::regex timezone_regex("([+-])(\\d\\d)(\\d\\d)");

void user_map::add(std::string const& accurev_user, git_identity const& identity)
  {
  if (!map.insert(std::make_pair(accurev_user, identity)).second)
    {
    throw unrecognized_input("duplicate user mapping for " + accurev_user);
    }
  }

bool user_map::contains(std::string const& accurev_user) const
  {
  return map.find(accurev_user) != map.end();
  }

git_identity user_map::operator[](std::string const& accurev_user) const
  {
  typedef boost::unordered_map<std::string, git_identity> map_t;
  map_t::const_iterator it = map.find(accurev_user);
  if (it == map.end())
    {
    git_identity fallback;
    fallback.name = accurev_user;
    return fallback;
    }
  return it->second;
  }

std::vector<std::string> user_map::missing(std::vector<std::string> const& users) const
  {
  std::vector<std::string> result;
  for (std::string const& user : users)
    {
    if (!contains(user))
      {
      result.push_back(user);
      }
    }
  return result;
  }

int parse_timezone(std::string const& text)
  {
  if (text.empty())
    {
    return 0;
    }
  boost::smatch match;
  if (!regex_match(text, match, timezone_regex))
    {
    throw unrecognized_input("time zone '" + text + "' is not of the form +HHMM");
    }
  int hours = boost::lexical_cast<int>(match[2].str());
  int minutes = boost::lexical_cast<int>(match[3].str());
  if (minutes >= 60)
    {
    throw unrecognized_input("time zone '" + text + "' has more than 59 minutes");
    }
  int offset = hours * 60 + minutes;
  return match[1] == "-" ? -offset : offset;
  }

} // namespace accu2git
