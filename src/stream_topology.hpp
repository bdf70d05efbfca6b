// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef STREAM_TOPOLOGY_DWA2013702_HPP
# define STREAM_TOPOLOGY_DWA2013702_HPP

# include "accurev_types.hpp"
# include <vector>

namespace accu2git {

// Every stream after its basis.  A stream whose basis is not listed
// counts as a root.  A basis cycle is an invariant violation.
std::vector<stream_info> topological_order(stream_listing const& listing);

// The basis chain above number, nearest first.
std::vector<stream_info> ancestors(stream_listing const& listing, int number);

// True iff ancestor is somewhere on descendant's basis chain.  A
// stream is not its own ancestor.
bool is_ancestor(stream_listing const& listing, int ancestor, int descendant);

// Every stream below number, in topological order.
std::vector<stream_info> descendants(stream_listing const& listing, int number);

// Streams listed in after but not in before, by number.
std::vector<stream_info> new_streams(stream_listing const& before, stream_listing const& after);

} // namespace accu2git

#endif // STREAM_TOPOLOGY_DWA2013702_HPP
