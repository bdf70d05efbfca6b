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

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "retry.hpp"
#include "user_map.hpp"
#include <string>
#include <vector>

namespace accu2git
{

// How the content of each stream is pulled out of the depot.
enum class retrieval_method
  {
  pop,
  diff,
  deep_hist,
  skip
  };

// How the retrieved histories become branches.
enum class merge_strategy
  {
  normal,
  orphanage,
  skip
  };

enum class message_style
  {
  normal,
  clean,
  notes
  };

struct stream_mapping
  {
  std::string stream;
  // Empty means "derive from the stream name"; renames then follow
  // the stream.
  std::string branch;
  };

struct remote_spec
  {
  std::string name;
  std::string url;
  std::string push_url;
  };

struct Options
  {
  Options()
      : start_transaction("1")
      , end_transaction("now")
      , style(message_style::normal)
      , method(retrieval_method::deep_hist)
      , strategy(merge_strategy::normal)
      , restart(false)
      , finalize(false)
      , track(false)
      , intermission(300)
    {
    }

  // <accurev>
  std::string depot;
  std::string username;
  std::string password;
  std::string start_transaction;
  std::string end_transaction;
  std::vector<stream_mapping> streams;

  // <git>
  std::string repo_path;
  message_style style;
  std::vector<remote_spec> remotes;

  retrieval_method method;
  merge_strategy strategy;
  std::string log_file;
  user_map users;

  // command line only
  bool restart;
  bool finalize;
  bool track;
  int intermission;
  std::string accurev_executable;
  std::string git_executable;
  retry_policy retry;
  };

retrieval_method parse_retrieval_method(std::string const& text);
merge_strategy parse_merge_strategy(std::string const& text);
message_style parse_message_style(std::string const& text);

char const* to_string(retrieval_method x);
char const* to_string(merge_strategy x);
char const* to_string(message_style x);

} // namespace accu2git

#endif /* OPTIONS_HPP */
