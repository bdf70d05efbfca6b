// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CONVERTER_DWA2013614_HPP
# define CONVERTER_DWA2013614_HPP

# include "branches.hpp"
# include "depot_client.hpp"
# include "options.hpp"
# include "source_depot.hpp"
# include "state_store.hpp"
# include "target_repository.hpp"
# include <string>
# include <vector>

namespace accu2git {

class logger;

// One conversion pass over the configured depot: retrieval of every
// tracked stream, then branch processing under the configured merge
// strategy, then (when finalizing) stitching.
class converter
{
 public:
    converter(Options const& opts, logger& log, depot_client& client, target_repository& repo);

    void run();

    // Deletes all converter state, the converted branches and the
    // notes, so that the next run starts over.
    void restart();

 private:
    void add_remotes();
    int record_depots();
    void retrieve(context& ctx, std::vector<tracked_stream> const& tracked, int start, int end);
    void process(context& ctx, std::vector<tracked_stream> const& tracked);

    // Pushes refspecs to every configured remote; failures are logged.
    void push_all(std::vector<std::string> const& refspecs);
    std::vector<std::string> branch_refspecs(context& ctx, bool force);

 private:
    Options const& opts;
    logger& log;
    target_repository& repo;
    source_depot depot;
    state_store store;
};

} // namespace accu2git

#endif // CONVERTER_DWA2013614_HPP
