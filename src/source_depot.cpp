// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "source_depot.hpp"
#include "accurev_xml.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "stream_topology.hpp"

#include <boost/container/flat_set.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace accu2git {

using boost::lexical_cast;

namespace
{
  std::string range(int from, int to)
  {
      return lexical_cast<std::string>(from) + "-" + lexical_cast<std::string>(to);
  }

  // Runs query until its answer parses.
  template <class Result, class Query, class Parse>
  Result ask(retry_policy const& retry, logger& log, std::string const& what, Query query, Parse parse)
  {
      return with_retry(
          retry, log, what,
          [&]() -> Result
          {
              std::string xml = query();
              try
              {
                  return parse(std::move(xml));
              }
              catch (unrecognized_input const& e)
              {
                  throw transient_error(what + " answered with garbage: " + e.what());
              }
          });
  }
}

source_depot::source_depot(
    depot_client& client, std::string const& depot,
    logger& log, retry_policy const& retry)
    : client(client), depot(depot), log(log), retry(retry)
{
}

source_depot::transaction_record source_depot::transaction_at(int tr)
{
    std::string spec = lexical_cast<std::string>(tr);
    return ask<transaction_record>(
        retry, log, "accurev hist -t " + spec,
        [&] { return client.history(depot, spec, "", ""); },
        [&](std::string xml) -> transaction_record
        {
            transaction_record r;
            for (auto const& t : parse_history(xml))
            {
                if (t.id == tr)
                {
                    r.tr = t;
                    r.xml = normalize_task_ids(xml);
                    return r;
                }
            }
            throw transient_error("no history for transaction " + spec);
        });
}

source_depot::history_result source_depot::history(
    std::string const& stream, int from, int to, std::string const& kind)
{
    history_result none;
    if (from > to)
        return none;

    std::string spec = range(from, to);
    return ask<history_result>(
        retry, log, "accurev hist -t " + spec + (stream.empty() ? "" : " -s " + stream),
        [&] { return client.history(depot, spec, stream, kind); },
        [&](std::string xml) -> history_result
        {
            history_result r;
            r.transactions = parse_history(xml);
            r.xml = normalize_task_ids(xml);
            return r;
        });
}

int source_depot::resolve_transaction(std::string const& spec)
{
    if (spec == "now" || spec == "highest")
    {
        return ask<int>(
            retry, log, "accurev hist -t highest",
            [&] { return client.history(depot, "highest", "", ""); },
            [&](std::string xml) -> int
            {
                std::vector<transaction> h = parse_history(xml);
                if (h.empty())
                    throw transient_error("depot " + depot + " reported no highest transaction");
                return h.back().id;
            });
    }
    try
    {
        return lexical_cast<int>(spec);
    }
    catch (boost::bad_lexical_cast const&)
    {
        throw unrecognized_input("'" + spec + "' is not a transaction number");
    }
}

boost::optional<source_depot::transaction_record> source_depot::creation(int stream)
{
    std::string number = lexical_cast<std::string>(stream);
    auto r = ask<history_result>(
        retry, log, "accurev hist -k mkstream -s " + number,
        [&] { return client.history(depot, "now", number, "mkstream"); },
        [&](std::string xml) -> history_result
        {
            history_result h;
            h.transactions = parse_history(xml);
            h.xml = normalize_task_ids(xml);
            return h;
        });

    if (r.transactions.empty())
        return boost::none;
    if (r.transactions.size() > 1)
        log.error() << "stream " << stream << " has " << r.transactions.size()
                    << " mkstream transactions, using " << r.transactions.front().id << std::endl;

    transaction_record result;
    result.tr = r.transactions.front();
    result.xml = r.xml;
    return result;
}

source_depot::streams_result const& source_depot::streams_at(int tr)
{
    auto cached = streams_cache.find(tr);
    if (cached != streams_cache.end())
        return cached->second;

    std::string spec = lexical_cast<std::string>(tr);
    streams_result r = ask<streams_result>(
        retry, log, "accurev show streams -t " + spec,
        [&] { return client.streams(depot, spec, ""); },
        [&](std::string xml) -> streams_result
        {
            streams_result s;
            s.listing = parse_streams(xml);
            s.xml = normalize_task_ids(xml);
            return s;
        });
    return streams_cache.emplace(tr, std::move(r)).first->second;
}

boost::optional<stream_info> source_depot::stream(std::string const& name, int tr)
{
    if (stream_info const* s = streams_at(tr).listing.find(name))
        return *s;
    return boost::none;
}

boost::optional<stream_info> source_depot::stream(int number, int tr)
{
    if (stream_info const* s = streams_at(tr).listing.find(number))
        return *s;
    return boost::none;
}

source_depot::diff_result source_depot::diff(int stream, int from, int to)
{
    std::string number = lexical_cast<std::string>(stream);
    return ask<diff_result>(
        retry, log, "accurev diff -v " + number + " -t " + range(from, to),
        [&] { return client.diff(number, from, to); },
        [&](std::string xml) -> diff_result
        {
            diff_result d;
            d.paths = parse_diff(xml);
            d.xml = normalize_task_ids(xml);
            return d;
        });
}

std::vector<int> source_depot::deep_history(int stream, int from, int to)
{
    boost::container::flat_set<int> ids;
    if (from > to)
        return std::vector<int>();

    for (auto const& t : history(lexical_cast<std::string>(stream), from, to).transactions)
        ids.insert(t.id);

    stream_listing const& listing = streams_at(to).listing;
    stream_info const* s = listing.find(stream);
    if (!s)
    {
        log.debug() << "stream " << stream << " does not exist at transaction " << to
                    << "; deep history is its own history" << std::endl;
        return std::vector<int>(ids.begin(), ids.end());
    }

    // Changes to an ancestor reach the stream only up to the earliest
    // time lock between them.
    boost::optional<std::time_t> cutoff = s->time_lock;
    for (auto const& a : ancestors(listing, s->number))
    {
        for (auto const& t : history(lexical_cast<std::string>(a.number), from, to).transactions)
        {
            if (!cutoff || t.time <= *cutoff)
                ids.insert(t.id);
        }
        if (a.time_lock && (!cutoff || *a.time_lock < *cutoff))
            cutoff = a.time_lock;
    }
    return std::vector<int>(ids.begin(), ids.end());
}

std::vector<stream_info> source_depot::affected_streams(int tr)
{
    std::vector<stream_info> result;
    transaction t = transaction_at(tr).tr;
    if (!t.stream_number || tr <= 1)
        return result;

    stream_listing const& listing = streams_at(tr).listing;
    stream_info const* dst = listing.find(*t.stream_number);
    if (!dst)
        return result;

    std::vector<stream_info> candidates(1, *dst);
    for (auto const& d : descendants(listing, dst->number))
        candidates.push_back(d);

    for (auto const& s : candidates)
    {
        if (!diff(s.number, tr - 1, tr).paths.empty())
            result.push_back(s);
    }
    return result;
}

void source_depot::populate(
    int stream, int tr, boost::filesystem::path const& location, bool overwrite)
{
    std::string number = lexical_cast<std::string>(stream);
    with_retry(
        retry, log, "accurev pop -v " + number + " -t " + lexical_cast<std::string>(tr),
        [&] { client.populate(number, tr, location, overwrite); });
}

std::vector<depot_info> source_depot::depots(std::string* xml)
{
    return ask<std::vector<depot_info> >(
        retry, log, "accurev show depots",
        [&] { return client.depots(); },
        [&](std::string answer) -> std::vector<depot_info>
        {
            std::vector<depot_info> r = parse_depots(answer);
            if (xml)
                *xml = std::move(answer);
            return r;
        });
}

std::vector<std::string> source_depot::users()
{
    return ask<std::vector<std::string> >(
        retry, log, "accurev show users",
        [&] { return client.users(); },
        [&](std::string xml) { return parse_users(xml); });
}

std::string source_depot::principal()
{
    return with_retry(retry, log, "accurev info", [&] { return client.principal(); });
}

void source_depot::login(std::string const& user, std::string const& password)
{
    with_retry(retry, log, "accurev login", [&] { client.login(user, password); });
}

void source_depot::logout()
{
    with_retry(retry, log, "accurev logout", [&] { client.logout(); });
}

} // namespace accu2git
