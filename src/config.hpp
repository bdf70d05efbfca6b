// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CONFIG_DWA2013702_HPP
# define CONFIG_DWA2013702_HPP

# include "options.hpp"
# include <iosfwd>
# include <string>

namespace accu2git {

extern char const* const default_config_file;

// Fills opts from the XML configuration in filename.  Values missing
// from the file keep what opts already holds.
void read_config(std::string const& filename, Options& opts);

// The same, from an already open stream.
void read_config(std::istream& in, std::string const& source_name, Options& opts);

void write_example_config(std::ostream& out);

// Throws unrecognized_input for settings that cannot be used
// together.  Stitching rewrites the branches, so it never runs while
// tracking keeps adding to them.
void check_options(Options const& opts);

// "now", "highest" or a transaction number
bool is_transaction_spec(std::string const& text);

} // namespace accu2git

#endif // CONFIG_DWA2013702_HPP
