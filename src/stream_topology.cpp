// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "stream_topology.hpp"
#include "errors.hpp"

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/lexical_cast.hpp>
#include <deque>

namespace accu2git {

std::vector<stream_info> topological_order(stream_listing const& listing)
{
    // Kahn's algorithm over the basis relation
    boost::container::flat_map<int, std::vector<stream_info const*> > children;
    std::deque<stream_info const*> ready;

    for (auto const& s : listing.streams)
    {
        if (s.basis_number && listing.find(*s.basis_number))
            children[*s.basis_number].push_back(&s);
        else
            ready.push_back(&s);
    }

    std::vector<stream_info> result;
    while (!ready.empty())
    {
        stream_info const* s = ready.front();
        ready.pop_front();
        result.push_back(*s);

        auto kids = children.find(s->number);
        if (kids != children.end())
            ready.insert(ready.end(), kids->second.begin(), kids->second.end());
    }

    check_invariant(
        result.size() == listing.streams.size(),
        "the stream basis relation contains a cycle");
    return result;
}

std::vector<stream_info> ancestors(stream_listing const& listing, int number)
{
    std::vector<stream_info> result;
    boost::container::flat_set<int> seen;
    seen.insert(number);

    stream_info const* s = listing.find(number);
    while (s && s->basis_number)
    {
        s = listing.find(*s->basis_number);
        if (!s)
            break;
        check_invariant(
            seen.insert(s->number).second,
            "stream " + boost::lexical_cast<std::string>(number) + " is its own ancestor");
        result.push_back(*s);
    }
    return result;
}

bool is_ancestor(stream_listing const& listing, int ancestor, int descendant)
{
    for (auto const& s : ancestors(listing, descendant))
    {
        if (s.number == ancestor)
            return true;
    }
    return false;
}

std::vector<stream_info> descendants(stream_listing const& listing, int number)
{
    std::vector<stream_info> result;
    for (auto const& s : topological_order(listing))
    {
        if (is_ancestor(listing, number, s.number))
            result.push_back(s);
    }
    return result;
}

std::vector<stream_info> new_streams(stream_listing const& before, stream_listing const& after)
{
    std::vector<stream_info> result;
    for (auto const& s : after.streams)
    {
        if (!before.find(s.number))
            result.push_back(s);
    }
    return result;
}

} // namespace accu2git
