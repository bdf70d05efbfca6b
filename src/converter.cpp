// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "converter.hpp"
#include "accurev_xml.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "orphanage.hpp"
#include "retrieval.hpp"
#include "stitcher.hpp"
#include "transaction_processor.hpp"

#include <algorithm>
#include <ctime>

namespace accu2git {

namespace
{
  // Keeps git from collecting garbage in the middle of a run.
  struct gc_suspension
  {
      gc_suspension(target_repository& repo, logger& log)
          : repo(repo), log(log)
      {
          repo.set_config("gc.auto", "0");
      }

      ~gc_suspension()
      {
          try
          {
              repo.unset_config("gc.auto");
          }
          catch (conversion_error const& e)
          {
              log.warn() << "cannot restore gc.auto: " << e.what() << std::endl;
          }
      }

      target_repository& repo;
      logger& log;
  };

  // Logs out at the end of the run if the run logged in.
  struct depot_session
  {
      depot_session(source_depot& depot, Options const& opts, logger& log)
          : depot(depot), log(log), logged_in(false)
      {
          if (!depot.principal().empty())
              return;
          if (opts.username.empty())
              throw fatal_error("not logged in to the depot and no username is configured");
          depot.login(opts.username, opts.password);
          logged_in = true;
          log.info() << "Logged in as " << opts.username << std::endl;
      }

      ~depot_session()
      {
          if (!logged_in)
              return;
          try
          {
              depot.logout();
          }
          catch (conversion_error const& e)
          {
              log.warn() << "cannot log out: " << e.what() << std::endl;
          }
      }

      source_depot& depot;
      logger& log;
      bool logged_in;
  };
}

converter::converter(Options const& opts, logger& log, depot_client& client, target_repository& repo)
    : opts(opts), log(log), repo(repo)
    , depot(client, opts.depot, log, opts.retry)
    , store(repo)
{
}

void converter::run()
{
    if (opts.depot.empty())
        throw fatal_error("no depot configured");
    check_options(opts);

    if (opts.restart)
        restart();
    add_remotes();

    depot_session session(depot, opts, log);
    gc_suspension no_gc(repo, log);

    int depot_number = record_depots();
    context ctx(opts, log, depot, repo, store, depot_number);

    int start = depot.resolve_transaction(opts.start_transaction);
    int end = depot.resolve_transaction(opts.end_transaction);
    if (start > end)
        throw unrecognized_input("start transaction " + opts.start_transaction
                                 + " comes after end transaction " + opts.end_transaction);

    std::vector<tracked_stream> tracked = select_streams(opts, depot.streams_at(end).listing);
    log.info() << "Converting depot " << opts.depot << " (" << depot_number << "), "
               << tracked.size() << " streams, transactions " << start << " - " << end << std::endl;

    if (opts.method != retrieval_method::skip)
        retrieve(ctx, tracked, start, end);

    process(ctx, tracked);

    if (opts.finalize)
    {
        int n = stitch_branches(ctx);
        log.info() << "Stitching recreated " << n << " commits" << std::endl;
        push_all(branch_refspecs(ctx, true));
    }
}

void converter::restart()
{
    log.info() << "Restarting: deleting all converter state" << std::endl;

    // Converted branches are the ones with annotated tips.
    for (auto const& r : repo.list_refs("refs/heads/"))
    {
        if (repo.read_note(annotation_notes_ref, r.second))
            repo.delete_ref(r.first, r.second);
    }
    for (auto const& r : repo.list_refs(state_key::prefix))
        store.reset(r.first);
    store.reset(annotation_notes_ref);
    store.reset(footer_notes_ref);
}

void converter::add_remotes()
{
    std::vector<std::string> existing = repo.remotes();
    for (auto const& r : opts.remotes)
    {
        if (std::find(existing.begin(), existing.end(), r.name) != existing.end())
            continue;
        repo.add_remote(r.name, r.url, r.push_url);
        log.info() << "Added remote " << r.name << " (" << r.url << ")" << std::endl;
    }
}

// The depot listing is recorded once, by the first run.
int converter::record_depots()
{
    std::string xml;
    if (boost::optional<std::string> tip = repo.resolve(state_key::depots))
    {
        boost::optional<std::string> recorded = repo.read_file(repo.read_commit(*tip).tree, "depots.xml");
        check_invariant(!!recorded, state_key::depots + " does not hold depots.xml");
        xml = *recorded;
    }
    else
    {
        depot.depots(&xml);
        std::vector<std::pair<std::string, std::string> > files;
        files.emplace_back("depots.xml", xml);

        commit_spec spec;
        spec.tree = repo.write_tree(files);
        spec.author = signature("accu2git", "accu2git@localhost", std::time(nullptr));
        spec.committer = spec.author;
        spec.message = "depots";
        repo.update_ref(state_key::depots, repo.commit(spec), null_sha);
    }

    for (auto const& d : parse_depots(xml))
    {
        if (d.name == opts.depot)
            return d.number;
    }
    throw unrecognized_input("depot " + opts.depot + " does not exist");
}

void converter::retrieve(context& ctx, std::vector<tracked_stream> const& tracked, int start, int end)
{
    stream_retriever retriever(ctx);
    stream_listing const& listing = depot.streams_at(end).listing;
    for (auto const& ts : tracked)
    {
        stream_info const* s = listing.find(ts.number);
        check_invariant(s != nullptr, "stream " + ts.name + " vanished from the listing");
        retriever.retrieve(*s, start, end);

        std::vector<std::string> refspecs;
        for (auto const& key : { state_key::metadata(ctx.depot_number, ts.number),
                                 state_key::content(ctx.depot_number, ts.number),
                                 state_key::high_water_mark(ctx.depot_number, ts.number) })
        {
            if (repo.resolve(key))
                refspecs.push_back(key + ":" + key);
        }
        push_all(refspecs);
    }
}

void converter::process(context& ctx, std::vector<tracked_stream> const& tracked)
{
    switch (opts.strategy)
    {
    case merge_strategy::normal:
    {
        transaction_processor processor(ctx, tracked);
        int n = processor.run();
        log.info() << "Processed " << n << " transactions" << std::endl;
        break;
    }
    case merge_strategy::orphanage:
    {
        int n = replay_orphaned(ctx, tracked);
        log.info() << "Wrote " << n << " orphaned commits" << std::endl;
        break;
    }
    case merge_strategy::skip:
        return;
    }
    push_all(branch_refspecs(ctx, false));
}

void converter::push_all(std::vector<std::string> const& refspecs)
{
    if (refspecs.empty())
        return;
    for (auto const& r : opts.remotes)
    {
        try
        {
            repo.push(r.name, refspecs);
        }
        catch (conversion_error const& e)
        {
            log.error() << "push to " << r.name << " failed: " << e.what() << std::endl;
        }
    }
}

std::vector<std::string> converter::branch_refspecs(context& ctx, bool force)
{
    std::vector<std::string> result;
    branch_writer branches(ctx);
    for (auto const& r : repo.list_refs("refs/heads/"))
    {
        if (branches.annotation_of(r.second))
            result.push_back((force ? "+" : "") + r.first + ":" + r.first);
    }
    for (auto const& ref : { annotation_notes_ref, footer_notes_ref })
    {
        if (repo.resolve(ref))
            result.push_back((force ? "+" : "") + ref + ":" + ref);
    }
    return result;
}

} // namespace accu2git
