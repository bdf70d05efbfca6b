// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "stitcher.hpp"
#include "branches.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "source_depot.hpp"
#include "state_store.hpp"
#include "stream_topology.hpp"

#include <boost/container/flat_set.hpp>
#include <boost/filesystem/fstream.hpp>
#include <algorithm>
#include <deque>
#include <map>
#include <ostream>

namespace accu2git {

namespace
{
  typedef boost::container::flat_map<std::string, std::vector<std::string> > parent_map;
  typedef boost::container::flat_set<std::string> id_set;

  // True iff target can be reached from start by following parents.
  bool reaches(std::string const& start, std::string const& target, parent_map const& graph)
  {
      id_set seen;
      std::vector<std::string> todo(1, start);
      while (!todo.empty())
      {
          std::string id = todo.back();
          todo.pop_back();
          if (id == target)
              return true;
          if (!seen.insert(id).second)
              continue;
          auto p = graph.find(id);
          if (p != graph.end())
              todo.insert(todo.end(), p->second.begin(), p->second.end());
      }
      return false;
  }

  // A dropped parent stands for its alias plus its own parents.
  void expand_parent(
      std::string const& id, rewrite_plan const& plan, parent_map const& graph,
      std::vector<std::string>& out, id_set& seen)
  {
      auto a = plan.aliases.find(id);
      if (a == plan.aliases.end())
      {
          if (seen.insert(id).second)
              out.push_back(id);
          return;
      }
      if (seen.insert(a->second).second)
          out.push_back(a->second);

      auto p = graph.find(id);
      if (p == graph.end())
          return;
      for (auto const& q : p->second)
          expand_parent(q, plan, graph, out, seen);
  }

  bool stitch_order(stitch_node const* lhs, stitch_node const* rhs)
  {
      if (lhs->time != rhs->time)
          return lhs->time < rhs->time;
      if (lhs->transaction != rhs->transaction)
          return lhs->transaction < rhs->transaction;
      if (lhs->topo_index != rhs->topo_index)
          return lhs->topo_index < rhs->topo_index;
      return lhs->id < rhs->id;
  }
}

rewrite_plan plan_stitching(std::vector<stitch_node> const& nodes, ancestry_test const& is_ancestor)
{
    rewrite_plan plan;

    parent_map graph;
    std::map<std::string, std::vector<stitch_node const*> > groups;
    for (auto const& n : nodes)
    {
        graph[n.id] = n.parents;
        groups[n.tree].push_back(&n);
    }

    boost::container::flat_map<std::string, std::string> aliases;
    for (auto& g : groups)
    {
        std::vector<stitch_node const*>& members = g.second;
        if (members.size() < 2)
            continue;
        std::sort(members.begin(), members.end(), stitch_order);

        for (std::size_t j = 1; j < members.size(); ++j)
        {
            stitch_node const* later = members[j];
            stitch_node const* earlier = nullptr;
            for (std::size_t i = j; i-- > 0;)
            {
                if (members[i]->stream != later->stream)
                {
                    earlier = members[i];
                    break;
                }
            }
            if (!earlier)
                continue;

            // Siblings of one transaction on an ancestor and its
            // descendant are the same change.
            if (earlier->transaction == later->transaction && earlier->time == later->time
                && !later->tip && is_ancestor(earlier->stream, later->stream, later->transaction))
            {
                aliases[later->id] = earlier->id;
                continue;
            }

            std::vector<std::string>& parents = graph[later->id];
            if (std::find(parents.begin(), parents.end(), earlier->id) != parents.end())
                continue;
            if (reaches(earlier->id, later->id, graph))
                continue;
            parents.push_back(earlier->id);
        }
    }

    for (auto const& a : aliases)
    {
        id_set seen;
        seen.insert(a.first);
        std::string target = a.second;
        for (auto next = aliases.find(target); next != aliases.end(); next = aliases.find(target))
        {
            if (!seen.insert(target).second)
                throw invariant_violation("alias cycle through " + target);
            target = next->second;
        }
        if (target == a.first)
            throw invariant_violation("alias cycle through " + target);
        plan.aliases[a.first] = target;
    }

    boost::container::flat_map<std::string, stitch_node const*> kept;
    for (auto const& n : nodes)
    {
        if (plan.aliases.count(n.id))
            continue;
        kept[n.id] = &n;

        std::vector<std::string> parents;
        id_set seen;
        seen.insert(n.id);
        for (auto const& p : graph[n.id])
            expand_parent(p, plan, graph, parents, seen);
        if (parents != n.parents)
            plan.parents[n.id] = parents;
    }

    // Parents first
    boost::container::flat_map<std::string, int> pending;
    std::map<std::string, std::vector<std::string> > children;
    for (auto const& k : kept)
    {
        auto p = plan.parents.find(k.first);
        std::vector<std::string> const& parents = p != plan.parents.end() ? p->second : k.second->parents;
        int& count = pending[k.first];
        for (auto const& q : parents)
        {
            if (kept.count(q))
            {
                ++count;
                children[q].push_back(k.first);
            }
        }
    }

    std::deque<std::string> ready;
    for (auto const& n : nodes)
    {
        if (kept.count(n.id) && pending[n.id] == 0)
            ready.push_back(n.id);
    }
    while (!ready.empty())
    {
        std::string id = ready.front();
        ready.pop_front();
        plan.order.push_back(id);
        for (auto const& c : children[id])
        {
            if (--pending[c] == 0)
                ready.push_back(c);
        }
    }
    check_invariant(plan.order.size() == kept.size(), "stitching would create a cycle");
    return plan;
}

void write_rewrite_script(std::ostream& out, rewrite_plan const& plan)
{
    for (auto const& a : plan.aliases)
        out << "drop " << a.first << " -> " << a.second << '\n';

    for (auto const& id : plan.order)
    {
        auto p = plan.parents.find(id);
        if (p == plan.parents.end())
            continue;
        out << "parents " << id;
        for (auto const& q : p->second)
            out << ' ' << q;
        out << '\n';
    }
}

int stitch_branches(context& ctx)
{
    branch_writer branches(ctx);

    boost::optional<int> done = ctx.store.processing_state();
    if (!done)
        throw fatal_error("cannot stitch branches before any transaction was processed");

    std::vector<std::pair<std::string, std::string> > heads;
    for (auto const& r : ctx.repo.list_refs("refs/heads/"))
    {
        if (branches.annotation_of(r.second))
            heads.push_back(r);
        else
            ctx.log.warn() << "Not stitching " << r.first << ": its tip has no annotation" << std::endl;
    }
    if (heads.empty())
        return 0;

    std::map<int, int> topo_index;
    {
        std::vector<stream_info> order = topological_order(ctx.depot.streams_at(*done).listing);
        for (std::size_t i = 0; i < order.size(); ++i)
            topo_index[order[i].number] = static_cast<int>(i);
    }

    id_set tips;
    for (auto const& h : heads)
        tips.insert(h.second);

    std::vector<stitch_node> nodes;
    id_set seen;
    for (auto const& h : heads)
    {
        for (auto const& id : ctx.repo.ancestry(h.second, false))
        {
            if (!seen.insert(id).second)
                continue;

            boost::optional<annotation> a = branches.annotation_of(id);
            check_invariant(!!a, "commit " + id + " on " + h.first + " has no annotation");
            commit_record c = ctx.repo.read_commit(id);

            stitch_node n;
            n.id = id;
            n.tree = c.tree;
            n.parents = c.parents;
            n.time = c.committer.when;
            n.transaction = a->transaction;
            n.stream = a->stream_number;
            auto t = topo_index.find(a->stream_number);
            n.topo_index = t == topo_index.end() ? static_cast<int>(topo_index.size()) : t->second;
            n.tip = tips.count(id) != 0;
            nodes.push_back(n);
        }
    }

    rewrite_plan plan = plan_stitching(
        nodes,
        [&ctx](int ancestor, int descendant, int tr)
        {
            return is_ancestor(ctx.depot.streams_at(tr).listing, ancestor, descendant);
        });

    boost::filesystem::path script = ctx.repo.work_tree() / ".git" / "accu2git-rewrite.txt";
    {
        boost::filesystem::ofstream out(script);
        if (!out)
            throw fatal_error("cannot write " + script.string());
        write_rewrite_script(out, plan);
    }
    ctx.log.info() << "Stitching " << nodes.size() << " commits: " << plan.aliases.size()
                   << " dropped, " << plan.parents.size() << " re-parented; see " << script << std::endl;
    if (plan.empty())
        return 0;

    boost::container::flat_map<std::string, std::string> replaced;
    auto mapped = [&replaced](std::string const& id)
    {
        auto r = replaced.find(id);
        return r == replaced.end() ? id : r->second;
    };

    int count = 0;
    for (auto const& id : plan.order)
    {
        commit_record c = ctx.repo.read_commit(id);
        auto p = plan.parents.find(id);
        std::vector<std::string> const& parents = p != plan.parents.end() ? p->second : c.parents;

        std::vector<std::string> new_parents;
        for (auto const& q : parents)
            new_parents.push_back(mapped(q));
        if (new_parents == c.parents)
            continue;

        commit_spec spec;
        spec.tree = c.tree;
        spec.parents = new_parents;
        spec.author = c.author;
        spec.committer = c.committer;
        spec.message = c.message;
        std::string rewritten = ctx.repo.commit(spec);

        for (auto const& ref : { annotation_notes_ref, footer_notes_ref })
        {
            if (boost::optional<std::string> text = ctx.repo.read_note(ref, id))
                ctx.repo.add_note(ref, rewritten, *text);
        }
        replaced[id] = rewritten;
        ++count;
    }

    for (auto const& h : heads)
    {
        check_invariant(!plan.aliases.count(h.second), "branch tip " + h.second + " was dropped");
        std::string tip = mapped(h.second);
        if (tip == h.second)
            continue;
        ctx.repo.update_ref(h.first, tip, h.second);
        ctx.log.info() << "Stitched " << h.first << ": " << h.second.substr(0, 8)
                       << " -> " << tip.substr(0, 8) << std::endl;
    }
    return count;
}

} // namespace accu2git
