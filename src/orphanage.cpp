// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "orphanage.hpp"
#include "accurev_xml.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "source_depot.hpp"
#include "state_store.hpp"

namespace accu2git {

namespace
{
  // The transaction and stream a metadata entry recorded.
  void read_metadata(
      context& ctx, state_store::entry const& e, int stream_number,
      transaction& tr, boost::optional<stream_info>& stream)
  {
      boost::optional<std::string> hist = ctx.repo.read_file(e.tree, "hist.xml");
      boost::optional<std::string> streams = ctx.repo.read_file(e.tree, "streams.xml");
      check_invariant(
          hist && streams,
          "metadata entry " + e.commit + " lacks hist.xml or streams.xml");

      for (auto const& t : parse_history(*hist))
      {
          if (t.id == e.transaction)
              tr = t;
      }
      check_invariant(tr.id == e.transaction, "metadata entry " + e.commit + " does not record its transaction");

      stream_listing const listing = parse_streams(*streams);
      if (stream_info const* s = listing.find(stream_number))
          stream = *s;
  }
}

int replay_orphaned(context& ctx, std::vector<tracked_stream> const& tracked)
{
    branch_writer branches(ctx);
    int count = 0;

    for (auto const& ts : tracked)
    {
        std::string branch = ts.explicit_branch.empty() ? sanitize_branch_name(ts.name) : ts.explicit_branch;
        branches.recover(branch);

        std::vector<state_store::entry> const metadata
            = ctx.store.entries(state_key::metadata(ctx.depot_number, ts.number));
        std::vector<state_store::entry> const content
            = ctx.store.entries(state_key::content(ctx.depot_number, ts.number));
        check_invariant(
            content.size() <= metadata.size(),
            "the content history of " + ts.name + " is ahead of its metadata history");

        int done = branches.last_transaction(branch).get_value_or(0);
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            if (content[i].transaction <= done)
                continue;
            check_invariant(
                content[i].transaction == metadata[i].transaction,
                "the content and metadata histories of " + ts.name + " disagree");

            transaction tr;
            boost::optional<stream_info> stream;
            read_metadata(ctx, metadata[i], ts.number, tr, stream);

            commit_message message = make_commit_message(ctx.opts.style, tr, stream.get_ptr());

            commit_spec spec;
            spec.tree = content[i].tree;
            boost::optional<std::string> tip = branches.tip(branch);
            if (tip)
                spec.parents.push_back(*tip);
            spec.author = signature_of(ctx, tr);
            spec.committer = spec.author;
            spec.message = message.text;

            annotation note;
            note.depot = ctx.depot.name();
            note.stream = stream ? stream->name : ts.name;
            note.stream_number = ts.number;
            note.transaction = tr.id;
            note.kind = tr.kind_name;

            branches.commit(branch, tip, spec, note, message.note);
            ++count;
        }
        ctx.log.info() << "Orphaned branch " << branch << " is at transaction "
                       << branches.last_transaction(branch).get_value_or(0) << std::endl;
    }
    return count;
}

} // namespace accu2git
