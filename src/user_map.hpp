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

#ifndef USER_MAP_HPP
#define USER_MAP_HPP

#include <boost/unordered_map.hpp>
#include <string>
#include <vector>

namespace accu2git
{

struct git_identity
  {
  git_identity()
      : tz_minutes(0)
    {
    }

  std::string name;
  std::string email;
  int tz_minutes;   // east of UTC
  };

class user_map
  {
  public:
    void add(std::string const& accurev_user, git_identity const& identity);
    bool contains(std::string const& accurev_user) const;

    // Unmapped users keep their depot name, an empty email and UTC.
    git_identity operator[](std::string const& accurev_user) const;

    // The users in users that have no mapping
    std::vector<std::string> missing(std::vector<std::string> const& users) const;

  private:
    boost::unordered_map<std::string, git_identity> map;
  };

// "+0100" -> 60, "-0330" -> -210, "" -> 0
int parse_timezone(std::string const& text);

} // namespace accu2git

#endif /* USER_MAP_HPP */
