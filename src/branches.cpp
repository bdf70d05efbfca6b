// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "branches.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "state_store.hpp"

namespace accu2git {

std::vector<tracked_stream> select_streams(Options const& opts, stream_listing const& listing)
{
    std::vector<tracked_stream> result;
    if (opts.streams.empty())
    {
        for (auto const& s : listing.streams)
        {
            tracked_stream t = { s.number, s.name, std::string() };
            result.push_back(t);
        }
        return result;
    }

    for (auto const& m : opts.streams)
    {
        stream_info const* s = listing.find(m.stream);
        if (!s)
            throw unrecognized_input("configured stream " + m.stream + " does not exist");
        tracked_stream t = { s->number, s->name, m.branch };
        result.push_back(t);
    }
    return result;
}

tracked_stream const* find_tracked(std::vector<tracked_stream> const& tracked, int number)
{
    for (auto const& t : tracked)
    {
        if (t.number == number)
            return &t;
    }
    return nullptr;
}

std::string branch_ref(std::string const& branch)
{
    return "refs/heads/" + branch;
}

signature signature_of(context const& ctx, transaction const& tr)
{
    git_identity id = ctx.opts.users[tr.user];
    return signature(id.name, id.email, tr.time, id.tz_minutes);
}

branch_writer::branch_writer(context& ctx)
    : ctx(ctx)
{
}

boost::optional<std::string> branch_writer::tip(std::string const& branch)
{
    return ctx.repo.resolve(branch_ref(branch));
}

std::string branch_writer::commit(
    std::string const& branch, boost::optional<std::string> const& expected_tip,
    commit_spec const& spec, annotation const& note, std::string const& footer_note)
{
    std::string ref = branch_ref(branch);
    std::string id = ctx.repo.commit(spec);
    ctx.repo.update_ref(ref, id, expected_tip ? *expected_tip : null_sha);

    try
    {
        ctx.repo.add_note(annotation_notes_ref, id, to_json(note));
        if (!footer_note.empty())
            ctx.repo.add_note(footer_notes_ref, id, footer_note);
    }
    catch (conversion_error const& e)
    {
        // The tip must never outrun its annotations.
        if (expected_tip)
            ctx.repo.update_ref(ref, *expected_tip, id);
        else
            ctx.repo.delete_ref(ref, id);
        throw fatal_error("cannot annotate " + id + " on " + branch + ": " + e.what());
    }

    ctx.log.debug() << branch << ": tr. #" << note.transaction << " " << note.kind
                    << " -> " << id.substr(0, 8) << std::endl;
    return id;
}

boost::optional<annotation> branch_writer::annotation_of(std::string const& commit)
{
    boost::optional<std::string> text = ctx.repo.read_note(annotation_notes_ref, commit);
    if (!text)
        return boost::none;
    return parse_annotation(*text);
}

boost::optional<int> branch_writer::last_transaction(std::string const& branch)
{
    boost::optional<std::string> t = tip(branch);
    if (!t)
        return boost::none;
    boost::optional<annotation> a = annotation_of(*t);
    check_invariant(!!a, "the tip " + *t + " of " + branch + " has no annotation");
    return a->transaction;
}

void branch_writer::recover(std::string const& branch)
{
    boost::optional<std::string> t = tip(branch);
    if (!t || annotation_of(*t))
        return;

    std::vector<std::string> chain = ctx.repo.ancestry(*t, true);
    for (auto i = chain.rbegin(); i != chain.rend(); ++i)
    {
        if (annotation_of(*i))
        {
            ctx.log.warn() << "branch " << branch << ": discarding "
                           << (i - chain.rbegin()) << " commits without annotation, back to "
                           << i->substr(0, 8) << std::endl;
            ctx.repo.update_ref(branch_ref(branch), *i, *t);
            return;
        }
    }
    throw invariant_violation("branch " + branch + " has no annotated commit");
}

void branch_writer::reset(std::string const& branch, std::string const& commit)
{
    boost::optional<std::string> t = tip(branch);
    ctx.repo.update_ref(branch_ref(branch), commit, t ? *t : null_sha);
}

void branch_writer::rename(std::string const& from, std::string const& to)
{
    boost::optional<std::string> t = tip(from);
    check_invariant(!!t, "cannot rename missing branch " + from);
    ctx.repo.update_ref(branch_ref(to), *t, null_sha);
    ctx.repo.delete_ref(branch_ref(from), *t);
    ctx.log.info() << "Renamed branch " << from << " to " << to << std::endl;
}

} // namespace accu2git
