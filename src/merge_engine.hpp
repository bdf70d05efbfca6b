// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef MERGE_ENGINE_DWA2013702_HPP
# define MERGE_ENGINE_DWA2013702_HPP

# include "accurev_types.hpp"
# include "branches.hpp"
# include <boost/optional.hpp>
# include <string>

namespace accu2git {

enum class promotion_outcome
{
    merged,
    cherry_picked,
    skipped
};

char const* to_string(promotion_outcome x);

// One side of a promotion: the stream and the branch it goes to.
struct promotion_side
{
    stream_info stream;
    std::string branch;
};

// Decides whether a promotion is a merge or a cherry-pick.  The
// destination's new content is compared with the source branch: only
// when the destination ends up with exactly the source's tree did it
// take all of the source's history, and the commit becomes a merge.
// Anything else is a single-parent cherry-pick.
class merge_engine
{
 public:
    merge_engine(context& ctx, branch_writer& branches);

    // tree is the destination's content after tr.  reason completes
    // the friendly line, e.g. "accurev promote.".  A destination that
    // already recorded tr is skipped.
    promotion_outcome promote(
        promotion_side const& dst,
        boost::optional<promotion_side> const& src,
        transaction const& tr,
        std::string const& tree,
        std::string const& reason,
        annotation const& note);

 private:
    context& ctx;
    branch_writer& branches;
};

} // namespace accu2git

#endif // MERGE_ENGINE_DWA2013702_HPP
