// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "transaction_processor.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "source_depot.hpp"
#include "state_store.hpp"
#include "stream_topology.hpp"

#include <boost/container/flat_set.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace accu2git {

using boost::lexical_cast;

struct transaction_processor::dispatch : boost::static_visitor<void>
{
    dispatch(transaction_processor& p, transaction const& t) : p(p), t(t) {}

    void operator()(kind::create_stream const&) const { p.on_create(t); }
    void operator()(kind::reconfigure_stream const&) const { p.on_reconfigure(t); }
    void operator()(kind::add_file const&) const { p.on_content_change(t); }
    void operator()(kind::file_change const&) const { p.on_content_change(t); }
    void operator()(kind::promote const&) const { p.on_promote(t); }
    void operator()(kind::deactivate const&) const { p.on_deactivate(t); }

    void operator()(kind::define_component const&) const
    {
        p.ctx.log.info() << "Ignoring transaction #" << t.id << " - " << t.kind_name << std::endl;
    }

    transaction_processor& p;
    transaction const& t;
};

transaction_processor::transaction_processor(context& ctx, std::vector<tracked_stream> const& tracked)
    : ctx(ctx), tracked(tracked), branches(ctx), merges(ctx, branches)
{
}

int transaction_processor::run()
{
    if (tracked.empty())
        return 0;

    int end = window_end();
    int start = window_start();
    if (start > end)
    {
        ctx.log.info() << "Nothing to process after transaction " << end << std::endl;
        return 0;
    }
    ctx.log.info() << "Processing transactions " << start << " - " << end << std::endl;

    name_branches(start);
    for (auto const& kv : branch_names)
        branches.recover(kv.second);

    if (!ctx.store.processing_state())
        seed(start);

    int count = 0;
    for (int tr : candidates(start, end))
    {
        ctx.log.set_transaction(tr);
        process(tr);
        ctx.store.set_processing_state(tr);
        ++count;
    }
    ctx.store.set_processing_state(end);
    return count;
}

void transaction_processor::process(int tr)
{
    transaction t = ctx.depot.transaction_at(tr).tr;
    ctx.log.debug() << "Transaction #" << t.id << " - " << t.kind_name << " by " << t.user
                    << " to " << t.stream_name << std::endl;
    boost::apply_visitor(dispatch(*this, t), classify(t.kind_name));
}

void transaction_processor::on_create(transaction const& t)
{
    for (auto const& s : created_by(t))
    {
        tracked_stream const* ts = find_tracked(tracked, s.number);
        if (!ts)
            continue;

        std::string name = ts->explicit_branch.empty() ? sanitize_branch_name(s.name) : ts->explicit_branch;
        branch_names[s.number] = name;
        if (branches.tip(name))
        {
            ctx.log.debug() << "Branch " << name << " already exists" << std::endl;
            continue;
        }

        boost::optional<std::string> basis_tip;
        std::string basis_branch = "-";
        if (s.basis_number && is_tracked(*s.basis_number))
        {
            basis_branch = branch_names[*s.basis_number];
            basis_tip = branches.tip(basis_branch);
        }

        std::string tree = empty_tree_sha;
        if (auto content = content_at(s.number, t.id))
            tree = *content;
        else if (basis_tip)
            tree = ctx.repo.read_commit(*basis_tip).tree;

        commit_message message = make_commit_message(
            ctx.opts.style, t, &s, nullptr, nullptr,
            "Created " + name + " based on " + (basis_tip ? basis_branch : std::string("-")));

        commit_spec spec;
        spec.tree = tree;
        if (basis_tip)
            spec.parents.push_back(*basis_tip);
        spec.author = signature_of(ctx, t);
        spec.committer = spec.author;
        spec.message = message.text;

        branches.commit(name, boost::none, spec, note_for(s, t), message.note);
        ctx.log.info() << "mkstream name=" << s.name << ", number=" << s.number
                       << ", basis=" << s.basis << std::endl;
    }
}

void transaction_processor::on_reconfigure(transaction const& t)
{
    boost::optional<stream_info> s = t.stream;
    if (!s)
        s = stream_at(t.stream_number, t.id);
    if (!s)
    {
        ctx.log.warn() << "chstream #" << t.id << " names no stream" << std::endl;
        return;
    }
    tracked_stream const* ts = find_tracked(tracked, s->number);
    if (!ts)
        return;

    std::string branch = branch_names[s->number];
    if (!branches.tip(branch))
        return;
    boost::optional<int> done = branches.last_transaction(branch);
    if (done && *done >= t.id)
        return;

    if (ts->explicit_branch.empty() && !s->prev_name.empty())
    {
        std::string renamed = sanitize_branch_name(s->name);
        if (renamed != branch)
        {
            branches.rename(branch, renamed);
            branch = branch_names[s->number] = renamed;
        }
    }

    // Re-parenting drops what the branch had and starts over from the
    // new basis.
    if (!s->prev_basis.empty() && s->basis_number && is_tracked(*s->basis_number))
    {
        std::string const& basis_branch = branch_names[*s->basis_number];
        if (boost::optional<std::string> basis_tip = branches.tip(basis_branch))
        {
            branches.reset(branch, *basis_tip);
            ctx.log.info() << "Rebased branch " << branch << " from " << s->prev_basis
                           << " to " << basis_branch << std::endl;
        }
    }

    commit_content(*s, t);
}

void transaction_processor::on_content_change(transaction const& t)
{
    boost::optional<stream_info> s = stream_at(t.stream_number, t.id);
    if (!s || !is_tracked(s->number))
        return;
    if (!s->is_workspace())
    {
        ctx.log.info() << "Note: " << t.kind_name << " transaction " << t.id << " on stream "
                       << s->name << " (" << s->type << ")" << std::endl;
    }
    commit_content(*s, t);
}

void transaction_processor::on_promote(transaction const& t)
{
    boost::optional<stream_info> dst = stream_at(t.stream_number, t.id);
    if (!dst)
        throw fatal_error("cannot determine the destination stream of promote " + lexical_cast<std::string>(t.id));

    boost::optional<stream_info> src = stream_at(t.from_stream_number, t.id);
    if (!src)
    {
        ctx.log.warn() << "Cannot determine the source stream of promote " << t.id
                       << "; treating it as a cherry-pick" << std::endl;
    }

    if (is_tracked(dst->number))
    {
        boost::optional<promotion_side> src_side;
        if (src && is_tracked(src->number))
            src_side = side(*src);

        std::string tip = branches.tip(branch_names[dst->number]).get_value_or(std::string());
        if (!tip.empty())
        {
            merges.promote(
                side(*dst), src_side, t, tree_at(*dst, t.id, tip), "accurev promote.",
                note_for(*dst, t, &*dst, src ? &*src : nullptr));
        }
    }

    propagate(*dst, src, t, "accurev parent stream inheritance.");
}

void transaction_processor::on_deactivate(transaction const& t)
{
    boost::optional<stream_info> s = stream_at(t.stream_number, t.id);
    if (!s)
        return;
    if (is_tracked(s->number))
        commit_content(*s, t);

    if (!s->is_workspace())
    {
        ctx.log.info() << "Note: " << t.kind_name << " transaction " << t.id << " on stream "
                       << s->name << " (" << s->type << "). Merging down-stream." << std::endl;
        propagate(*s, boost::none, t, "accurev parent stream inheritance (" + t.kind_name + ").");
    }
}

void transaction_processor::propagate(
    stream_info const& origin, boost::optional<stream_info> const& src,
    transaction const& t, std::string const& reason)
{
    boost::container::flat_set<int> affected;
    for (auto const& s : ctx.depot.affected_streams(t.id))
        affected.insert(s.number);

    // Content retrieved for tr is evidence too.
    for (auto const& ts : tracked)
    {
        auto e = ctx.store.entry_at(state_key::content(ctx.depot_number, ts.number), t.id);
        if (e && e->transaction == t.id)
            affected.insert(ts.number);
    }

    for (auto const& s : topological_order(ctx.depot.streams_at(t.id).listing))
    {
        if (!affected.count(s.number) || s.number == origin.number)
            continue;
        if (src && s.number == src->number)
            continue;
        if (!is_tracked(s.number))
            continue;

        std::string tip = branches.tip(branch_names[s.number]).get_value_or(std::string());
        if (tip.empty())
            continue;

        boost::optional<promotion_side> from;
        if (is_tracked(origin.number))
            from = side(origin);

        merges.promote(
            side(s), from, t, tree_at(s, t.id, tip), reason,
            note_for(s, t, &origin, src ? &*src : nullptr));
    }
}

void transaction_processor::commit_content(stream_info const& s, transaction const& t)
{
    std::string branch = branch_names[s.number];
    boost::optional<std::string> tip = branches.tip(branch);
    if (!tip)
    {
        ctx.log.debug() << "No branch " << branch << " for stream " << s.name << std::endl;
        return;
    }
    boost::optional<int> done = branches.last_transaction(branch);
    if (done && *done >= t.id)
        return;

    commit_message message = make_commit_message(ctx.opts.style, t, &s);
    commit_spec spec;
    spec.tree = tree_at(s, t.id, *tip);
    spec.parents.push_back(*tip);
    spec.author = signature_of(ctx, t);
    spec.committer = spec.author;
    spec.message = message.text;

    branches.commit(branch, tip, spec, note_for(s, t), message.note);
}

// Streams that exist when processing starts have no mkstream left to
// process; give them a first commit of their content at start.
void transaction_processor::seed(int start)
{
    transaction t = ctx.depot.transaction_at(start).tr;

    boost::container::flat_set<int> created;
    if (t.kind_name == "mkstream")
    {
        for (auto const& s : created_by(t))
            created.insert(s.number);
    }

    for (auto const& s : topological_order(ctx.depot.streams_at(start).listing))
    {
        if (!is_tracked(s.number) || created.count(s.number))
            continue;
        std::string const& name = branch_names[s.number];
        if (branches.tip(name))
            continue;

        boost::optional<std::string> basis_tip;
        if (s.basis_number && is_tracked(*s.basis_number))
            basis_tip = branches.tip(branch_names[*s.basis_number]);

        commit_message message = make_commit_message(
            ctx.opts.style, t, &s, nullptr, nullptr,
            "Created " + name + " based on "
            + (basis_tip ? branch_names[*s.basis_number] : std::string("-")));

        commit_spec spec;
        spec.tree = content_at(s.number, start).get_value_or(empty_tree_sha);
        if (basis_tip)
            spec.parents.push_back(*basis_tip);
        spec.author = signature_of(ctx, t);
        spec.committer = spec.author;
        spec.message = message.text;

        branches.commit(name, boost::none, spec, note_for(s, t), message.note);
        ctx.log.info() << "Seeded branch " << name << " at transaction " << start << std::endl;
    }
}

// Branch names as of the transaction before start; streams created
// later get theirs from their mkstream.
void transaction_processor::name_branches(int start)
{
    stream_listing const* before = start > 1 ? &ctx.depot.streams_at(start - 1).listing : nullptr;
    for (auto const& ts : tracked)
    {
        if (!ts.explicit_branch.empty())
        {
            branch_names[ts.number] = ts.explicit_branch;
            continue;
        }
        stream_info const* s = before ? before->find(ts.number) : nullptr;
        branch_names[ts.number] = sanitize_branch_name(s ? s->name : ts.name);
    }
}

int transaction_processor::window_start()
{
    if (boost::optional<int> done = ctx.store.processing_state())
        return *done + 1;
    return ctx.depot.resolve_transaction(ctx.opts.start_transaction);
}

int transaction_processor::window_end()
{
    boost::optional<int> end;
    for (auto const& ts : tracked)
    {
        boost::optional<int> hwm = ctx.store.high_water_mark(
            state_key::high_water_mark(ctx.depot_number, ts.number));
        if (!hwm)
            throw fatal_error("stream " + ts.name + " has not been retrieved");
        end = end ? std::min(*end, *hwm) : *hwm;
    }
    return *end;
}

std::vector<int> transaction_processor::candidates(int start, int end)
{
    boost::container::flat_set<int> result;
    for (auto const& ts : tracked)
    {
        for (auto const& e : ctx.store.entries(state_key::metadata(ctx.depot_number, ts.number)))
        {
            if (e.transaction >= start && e.transaction <= end)
                result.insert(e.transaction);
        }
    }
    for (char const* kind : { "mkstream", "chstream" })
    {
        for (auto const& t : ctx.depot.history("", start, end, kind).transactions)
            result.insert(t.id);
    }
    return std::vector<int>(result.begin(), result.end());
}

std::vector<stream_info> transaction_processor::created_by(transaction const& t)
{
    stream_listing const& after = ctx.depot.streams_at(t.id).listing;
    if (t.id == 1)
    {
        std::vector<stream_info> order = topological_order(after);
        return std::vector<stream_info>(order.begin(), order.begin() + std::min<std::size_t>(1, order.size()));
    }

    // Old servers do not name the stream a mkstream creates.
    std::vector<stream_info> result = new_streams(ctx.depot.streams_at(t.id - 1).listing, after);
    if (result.empty() && t.stream)
        result.push_back(*t.stream);
    return result;
}

boost::optional<stream_info> transaction_processor::stream_at(boost::optional<int> number, int tr)
{
    if (!number)
        return boost::none;
    return ctx.depot.stream(*number, tr);
}

bool transaction_processor::is_tracked(int stream) const
{
    return find_tracked(tracked, stream) != nullptr;
}

boost::optional<std::string> transaction_processor::content_at(int stream, int tr)
{
    auto e = ctx.store.entry_at(state_key::content(ctx.depot_number, stream), tr);
    if (!e)
        return boost::none;
    return e->tree;
}

// The stream's retrieved content at tr, or what its branch already
// holds when nothing was retrieved that early.
std::string transaction_processor::tree_at(stream_info const& s, int tr, std::string const& tip)
{
    if (boost::optional<std::string> content = content_at(s.number, tr))
        return *content;
    return ctx.repo.read_commit(tip).tree;
}

annotation transaction_processor::note_for(
    stream_info const& s, transaction const& t, stream_info const* dst, stream_info const* src) const
{
    annotation a;
    a.depot = ctx.depot.name();
    a.stream = s.name;
    a.stream_number = s.number;
    a.transaction = t.id;
    a.kind = t.kind_name;
    if (dst)
    {
        a.dst_stream = dst->name;
        a.dst_stream_number = dst->number;
    }
    if (src)
    {
        a.src_stream = src->name;
        a.src_stream_number = src->number;
    }
    return a;
}

promotion_side transaction_processor::side(stream_info const& s)
{
    promotion_side result;
    result.stream = s;
    result.branch = branch_names[s.number];
    return result;
}

} // namespace accu2git
