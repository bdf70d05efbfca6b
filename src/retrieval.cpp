// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "retrieval.hpp"
#include "accurev_xml.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "working_tree.hpp"

#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace accu2git {

using boost::lexical_cast;

stream_retriever::stream_retriever(context& ctx)
    : ctx(ctx)
{
}

retrieval_result stream_retriever::retrieve(stream_info const& stream, int start, int end)
{
    metadata_key = state_key::metadata(ctx.depot_number, stream.number);
    content_key = state_key::content(ctx.depot_number, stream.number);
    hwm_key = state_key::high_water_mark(ctx.depot_number, stream.number);

    retrieval_result result;
    result.last_transaction = 0;

    ctx.log.info() << "Retrieving stream " << stream.name << " (" << stream.number << "): "
                   << start << " - " << end << std::endl;

    // Start a new metadata history
    if (ctx.store.entries(metadata_key).empty())
    {
        int first = 1;
        if (auto mkstream = ctx.depot.creation(stream.number))
            first = mkstream->tr.id;
        else
            ctx.log.info() << "Stream " << stream.name << " has no mkstream transaction, starting at 1" << std::endl;
        first = std::max(first, start);

        if (first > end)
        {
            ctx.log.info() << "Stream " << stream.name << " starts at transaction " << first
                           << ", after " << end << "; nothing to retrieve" << std::endl;
            ctx.store.set_high_water_mark(hwm_key, end);
            result.last_transaction = end;
            return result;
        }
        append_metadata(stream, first, boost::none);
    }

    check_alignment(stream);

    // Put the work tree where the content history left it.
    boost::optional<state_store::entry> last_content = ctx.store.last_entry(content_key);
    if (last_content)
        ctx.repo.checkout_tree(last_content->tree);
    else
        working_tree::clear(ctx.repo.work_tree());

    // Catch up after a run interrupted between the two appends.
    std::vector<state_store::entry> const metadata = ctx.store.entries(metadata_key);
    std::size_t done = ctx.store.entries(content_key).size();
    for (std::size_t i = done; i < metadata.size(); ++i)
    {
        ctx.log.debug() << "Catching up content of " << stream.name
                        << " at transaction " << metadata[i].transaction << std::endl;
        append_content(stream, metadata[i], ctx.store.last_entry(content_key));
    }

    int position = metadata.back().transaction;
    if (boost::optional<int> hwm = ctx.store.high_water_mark(hwm_key))
        position = std::max(position, *hwm);

    boost::optional<std::vector<int> > deep;
    if (ctx.opts.method == retrieval_method::deep_hist && position < end)
    {
        deep = ctx.depot.deep_history(stream.number, position + 1, end);
        ctx.log.debug() << "Deep history of " << stream.name << " has "
                        << deep->size() << " transactions" << std::endl;
    }

    while (position < end)
    {
        int base = ctx.store.last_entry(metadata_key)->transaction;
        change next = find_next_change(stream, base, position, end, deep);
        if (next.transaction > end)
            break;

        append_metadata(stream, next.transaction, next.diff);
        append_content(
            stream, *ctx.store.last_entry(metadata_key), ctx.store.last_entry(content_key));
        position = next.transaction;
    }

    check_alignment(stream);
    ctx.store.set_high_water_mark(hwm_key, end);
    ctx.log.info() << "Reached transaction " << end << " in stream " << stream.name << std::endl;

    result.last_transaction = end;
    result.content_commit = ctx.store.tip(content_key);
    return result;
}

stream_retriever::change stream_retriever::find_next_change(
    stream_info const& stream, int diff_base, int position, int end,
    boost::optional<std::vector<int> > const& deep)
{
    change result;
    switch (ctx.opts.method)
    {
    case retrieval_method::pop:
        result.transaction = position + 1;
        return result;

    case retrieval_method::diff:
        for (int tr = position + 1; tr <= end; ++tr)
        {
            source_depot::diff_result d = ctx.depot.diff(stream.number, diff_base, tr);
            if (!d.paths.empty())
            {
                result.transaction = tr;
                result.diff = d;
                return result;
            }
        }
        break;

    case retrieval_method::deep_hist:
        for (int tr : *deep)
        {
            if (tr <= position || tr > end)
                continue;
            source_depot::diff_result d = ctx.depot.diff(stream.number, diff_base, tr);
            if (!d.paths.empty())
            {
                result.transaction = tr;
                result.diff = d;
                return result;
            }
            ctx.log.trace() << "Transaction " << tr << " leaves " << stream.name << " unchanged" << std::endl;
        }
        break;

    case retrieval_method::skip:
        throw fatal_error("retrieval of " + stream.name + " requested with method skip");
    }

    result.transaction = end + 1;
    return result;
}

void stream_retriever::append_metadata(
    stream_info const& stream, int tr, boost::optional<source_depot::diff_result> const& diff)
{
    source_depot::transaction_record record = ctx.depot.transaction_at(tr);
    source_depot::streams_result const& streams = ctx.depot.streams_at(tr);

    std::vector<std::pair<std::string, std::string> > files;
    files.emplace_back("hist.xml", record.xml);
    files.emplace_back("streams.xml", streams.xml);
    if (diff)
        files.emplace_back("diff.xml", diff->xml);

    std::string commit = ctx.store.append(metadata_key, tr, ctx.repo.write_tree(files), record.tr.time);
    ctx.log.info() << "stream " << stream.name << ": tr. #" << tr << " " << record.tr.kind_name
                   << " -> " << commit.substr(0, 8) << " on " << metadata_key << std::endl;
}

void stream_retriever::append_content(
    stream_info const& stream, state_store::entry const& metadata,
    boost::optional<state_store::entry> const& previous)
{
    boost::filesystem::path root = ctx.repo.work_tree();
    int tr = metadata.transaction;

    boost::optional<std::string> hist = ctx.repo.read_file(metadata.tree, "hist.xml");
    boost::optional<std::string> streams = ctx.repo.read_file(metadata.tree, "streams.xml");
    check_invariant(
        hist && streams,
        "metadata entry " + metadata.commit + " of " + stream.name + " lacks hist.xml or streams.xml");

    std::time_t when = 0;
    for (auto const& t : parse_history(*hist))
    {
        if (t.id == tr)
            when = t.time;
    }

    boost::optional<std::string> diff = ctx.repo.read_file(metadata.tree, "diff.xml");
    if (previous)
    {
        check_invariant(
            ctx.repo.work_tree_matches(previous->tree),
            "the work tree does not hold the content of " + stream.name
            + " at transaction " + lexical_cast<std::string>(previous->transaction));
    }

    if (!previous || !diff || ctx.opts.method == retrieval_method::pop)
    {
        working_tree::clear(root);
        ctx.depot.populate(stream.number, tr, root, true);
    }
    else
    {
        working_tree::remove_paths(root, parse_diff(*diff));
        working_tree::prune_empty_directories(root);
        ctx.depot.populate(stream.number, tr, root, false);
    }
    working_tree::preserve_empty_directories(root);

    std::string tree = ctx.repo.snapshot_work_tree();
    std::string commit = ctx.store.append(content_key, tr, tree, when);
    ctx.log.debug() << "stream " << stream.name << ": tr. #" << tr
                    << " content -> " << commit.substr(0, 8) << " on " << content_key << std::endl;
}

void stream_retriever::check_alignment(stream_info const& stream)
{
    std::vector<state_store::entry> const& metadata = ctx.store.entries(metadata_key);
    std::vector<state_store::entry> const& content = ctx.store.entries(content_key);

    check_invariant(
        content.size() <= metadata.size(),
        "the content history of " + stream.name + " is ahead of its metadata history");
    for (std::size_t i = 0; i < content.size(); ++i)
    {
        check_invariant(
            content[i].transaction == metadata[i].transaction,
            "the content and metadata histories of " + stream.name
            + " disagree at transaction " + lexical_cast<std::string>(content[i].transaction));
    }
}

} // namespace accu2git
