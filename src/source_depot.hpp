// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SOURCE_DEPOT_DWA2013702_HPP
# define SOURCE_DEPOT_DWA2013702_HPP

# include "accurev_types.hpp"
# include "depot_client.hpp"
# include "retry.hpp"
# include <boost/optional.hpp>
# include <map>
# include <string>
# include <vector>

namespace accu2git {

class logger;

// One depot, seen through a depot_client.  Every query is retried
// under the retry policy; an answer that cannot be parsed counts as a
// failed attempt.  Answers keep their raw XML so that it can be
// recorded verbatim.
class source_depot
{
 public:
    struct history_result
    {
        std::string xml;
        std::vector<transaction> transactions;
    };

    struct transaction_record
    {
        std::string xml;
        transaction tr;
    };

    struct streams_result
    {
        std::string xml;
        stream_listing listing;
    };

    struct diff_result
    {
        std::string xml;
        std::vector<std::string> paths;
    };

    source_depot(
        depot_client& client, std::string const& depot,
        logger& log, retry_policy const& retry);

    std::string const& name() const { return depot; }

    // The depot-wide history record of transaction tr.
    transaction_record transaction_at(int tr);

    // The transactions of kind (any when empty) in stream (any when
    // empty) with ids in [from, to].  stream is a name or a number.
    history_result history(std::string const& stream, int from, int to, std::string const& kind = "");

    // "now" and "highest" become the highest transaction id; anything
    // else must be a number.
    int resolve_transaction(std::string const& spec);

    // Streams are renamed, so the queries below address them by
    // number.

    // The stream's mkstream transaction; none for a depot's root.
    boost::optional<transaction_record> creation(int stream);

    // The stream tree as of transaction tr.  Memoized.
    streams_result const& streams_at(int tr);

    boost::optional<stream_info> stream(std::string const& name, int tr);
    boost::optional<stream_info> stream(int number, int tr);

    diff_result diff(int stream, int from, int to);

    // Ids in [from, to] of every transaction that can change the
    // content of stream: its own and those of its ancestors up to the
    // time locks along the basis chain.
    std::vector<int> deep_history(int stream, int from, int to);

    // The destination stream of tr and every stream below it whose
    // content changed across tr, in topological order.
    std::vector<stream_info> affected_streams(int tr);

    void populate(int stream, int tr, boost::filesystem::path const& location, bool overwrite);

    std::vector<depot_info> depots(std::string* xml = nullptr);
    std::vector<std::string> users();

    std::string principal();
    void login(std::string const& user, std::string const& password);
    void logout();

 private:
    depot_client& client;
    std::string depot;
    logger& log;
    retry_policy retry;
    std::map<int, streams_result> streams_cache;
};

} // namespace accu2git

#endif // SOURCE_DEPOT_DWA2013702_HPP
