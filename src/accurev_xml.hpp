// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef ACCUREV_XML_DWA2013702_HPP
# define ACCUREV_XML_DWA2013702_HPP

# include "accurev_types.hpp"
# include <string>
# include <vector>

namespace accu2git {

// Readers for the XML the depot answers with.  Anything that is not
// well-formed, or lacks a required attribute, throws
// unrecognized_input.

// hist: transactions sorted by ascending id
std::vector<transaction> parse_history(std::string const& xml);

// show streams
stream_listing parse_streams(std::string const& xml);

// diff: the sorted, unique, depot-relative paths it mentions
std::vector<std::string> parse_diff(std::string const& xml);

// show depots
std::vector<depot_info> parse_depots(std::string const& xml);

// show users
std::vector<std::string> parse_users(std::string const& xml);

// "\.\dir\a.txt" and "/./dir/a.txt" both become "dir/a.txt"
std::string normalize_depot_path(std::string const& path);

// TaskId attributes change between otherwise identical queries; zero
// them so that equal history produces equal objects.
std::string normalize_task_ids(std::string const& xml);

} // namespace accu2git

#endif // ACCUREV_XML_DWA2013702_HPP
