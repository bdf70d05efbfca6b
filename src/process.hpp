// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef PROCESS_DWA2013614_HPP
# define PROCESS_DWA2013614_HPP

# include <boost/filesystem/path.hpp>
# include <string>
# include <utility>
# include <vector>

namespace accu2git {

struct command_result
{
    int exit_code;
    std::string out;
    std::string err;
};

typedef std::vector<std::pair<std::string, std::string> > environment_overrides;

// The full path of the named executable, or of the explicitly
// configured one when that is not empty.
std::string find_executable(std::string const& name, std::string const& configured);

// Runs exe with args in dir, feeding it input, and collects both
// output streams.  Only failing to start the process throws.
command_result run_command(
    std::string const& exe,
    std::vector<std::string> const& args,
    boost::filesystem::path const& dir,
    std::string const& input = std::string(),
    environment_overrides const& env = environment_overrides());

// "exe arg1 arg2" for log messages
std::string command_line(std::string const& exe, std::vector<std::string> const& args);

} // namespace accu2git

#endif // PROCESS_DWA2013614_HPP
