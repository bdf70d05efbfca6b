// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef STITCHER_DWA2013702_HPP
# define STITCHER_DWA2013702_HPP

# include "context.hpp"
# include <boost/container/flat_map.hpp>
# include <ctime>
# include <functional>
# include <iosfwd>
# include <string>
# include <vector>

namespace accu2git {

// A branch commit as the stitcher sees it.
struct stitch_node
{
    stitch_node() : time(0), transaction(0), stream(0), topo_index(0), tip(false) {}

    std::string id;
    std::string tree;
    std::vector<std::string> parents;
    std::time_t time;
    int transaction;
    int stream;
    // position of the stream in the basis order; ancestors come first
    int topo_index;
    bool tip;
};

// True iff stream ancestor was on stream descendant's basis chain at
// transaction tr.
typedef std::function<bool(int ancestor, int descendant, int tr)> ancestry_test;

struct rewrite_plan
{
    // dropped commit -> the commit that replaces it; never chained
    boost::container::flat_map<std::string, std::string> aliases;

    // kept commit -> its new parents, for commits whose parents change
    boost::container::flat_map<std::string, std::vector<std::string> > parents;

    // every kept commit, parents before children
    std::vector<std::string> order;

    bool empty() const { return aliases.empty() && parents.empty(); }
};

// Groups nodes by tree and decides, for each commit that repeats an
// earlier commit's tree on another stream, whether it is a duplicate
// to drop or a merge edge to add.  Throws invariant_violation on an
// alias cycle or a cyclic result.
rewrite_plan plan_stitching(std::vector<stitch_node> const& nodes, ancestry_test const& is_ancestor);

// "drop <commit> -> <alias>" and "parents <commit> <parent>..." lines
void write_rewrite_script(std::ostream& out, rewrite_plan const& plan);

// Stitches every annotated branch of the repository: plans the
// rewrite, records its script in the Git directory, recreates the
// changed commits with their notes and moves the branches.  Returns
// the number of commits recreated.
int stitch_branches(context& ctx);

} // namespace accu2git

#endif // STITCHER_DWA2013702_HPP
