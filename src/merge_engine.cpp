// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "merge_engine.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"

namespace accu2git {

char const* to_string(promotion_outcome x)
{
    switch (x)
    {
    case promotion_outcome::merged: return "merged";
    case promotion_outcome::cherry_picked: return "cherry-picked";
    case promotion_outcome::skipped: return "skipped";
    }
    return "?";
}

merge_engine::merge_engine(context& ctx, branch_writer& branches)
    : ctx(ctx), branches(branches)
{
}

promotion_outcome merge_engine::promote(
    promotion_side const& dst,
    boost::optional<promotion_side> const& src,
    transaction const& tr,
    std::string const& tree,
    std::string const& reason,
    annotation const& note)
{
    boost::optional<std::string> dst_tip = branches.tip(dst.branch);
    if (!dst_tip)
    {
        ctx.log.debug() << "No branch " << dst.branch << " to promote into" << std::endl;
        return promotion_outcome::skipped;
    }
    boost::optional<int> done = branches.last_transaction(dst.branch);
    if (done && *done >= tr.id)
    {
        ctx.log.debug() << dst.branch << " already holds transaction " << tr.id << std::endl;
        return promotion_outcome::skipped;
    }

    // The provisional commit is the cherry-pick; it becomes a merge
    // when its tree is the source tip's tree.
    boost::optional<std::string> src_tip;
    if (src)
        src_tip = branches.tip(src->branch);

    bool merge = false;
    if (src_tip && *src_tip != *dst_tip)
        merge = ctx.repo.read_commit(*src_tip).tree == tree;

    std::string src_name = src ? src->branch : std::string("-");
    std::string friendly = std::string(merge ? "Merged " : "Cherry-picked ")
        + src_name + " into " + dst.branch + " - " + reason;

    commit_message message = make_commit_message(
        ctx.opts.style, tr, &dst.stream, &dst.stream,
        src ? &src->stream : nullptr, std::string(), friendly);

    commit_spec spec;
    spec.tree = tree;
    spec.parents.push_back(*dst_tip);
    if (merge)
        spec.parents.push_back(*src_tip);
    spec.author = signature_of(ctx, tr);
    spec.committer = spec.author;
    spec.message = message.text;

    std::string id = branches.commit(dst.branch, dst_tip, spec, note, message.note);

    ctx.log.info() << (merge ? "Merged" : "Cherry-picked") << ", branch " << src_name
                   << " into " << dst.branch << ", " << id.substr(0, 8) << std::endl;
    return merge ? promotion_outcome::merged : promotion_outcome::cherry_picked;
}

} // namespace accu2git
