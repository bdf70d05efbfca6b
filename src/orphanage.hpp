// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef ORPHANAGE_DWA2013702_HPP
# define ORPHANAGE_DWA2013702_HPP

# include "branches.hpp"
# include <vector>

namespace accu2git {

// Replays the content history of every tracked stream onto its own
// branch as a linear history without a common root, one annotated
// commit per content entry.  Returns the number of commits written.
int replay_orphaned(context& ctx, std::vector<tracked_stream> const& tracked);

} // namespace accu2git

#endif // ORPHANAGE_DWA2013702_HPP
