// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CONTEXT_DWA2013702_HPP
# define CONTEXT_DWA2013702_HPP

namespace accu2git {

struct Options;
class logger;
class source_depot;
struct target_repository;
class state_store;

// Everything a conversion step works with, handed down explicitly.
struct context
{
    context(
        Options const& opts, logger& log, source_depot& depot,
        target_repository& repo, state_store& store, int depot_number)
        : opts(opts), log(log), depot(depot), repo(repo), store(store)
        , depot_number(depot_number)
    {}

    Options const& opts;
    logger& log;
    source_depot& depot;
    target_repository& repo;
    state_store& store;
    int depot_number;
};

} // namespace accu2git

#endif // CONTEXT_DWA2013702_HPP
