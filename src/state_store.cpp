// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "state_store.hpp"
#include "errors.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/regex.hpp>
#include <sstream>

namespace accu2git {

using boost::lexical_cast;
namespace pt = boost::property_tree;

namespace state_key
{
  std::string const prefix("refs/ac2git/");
  std::string const depots(prefix + "depots");
  std::string const processing(prefix + "processing_state");

  namespace
  {
    std::string stream_ref(int depot, int stream, char const* suffix)
    {
        return prefix + lexical_cast<std::string>(depot) + "/streams/stream_"
            + lexical_cast<std::string>(stream) + suffix;
    }
  }

  std::string metadata(int depot, int stream) { return stream_ref(depot, stream, "_info"); }
  std::string content(int depot, int stream) { return stream_ref(depot, stream, "_data"); }
  std::string high_water_mark(int depot, int stream) { return stream_ref(depot, stream, "_hwm"); }
}

std::string const annotation_notes_ref("refs/notes/ac2git");
std::string const footer_notes_ref("refs/notes/accurev");

boost::optional<int> transaction_of_message(std::string const& message)
{
    static boost::regex const pattern("^transaction (\\d+)\\s*$");
    boost::smatch m;
    if (!boost::regex_match(message, m, pattern))
        return boost::none;
    return lexical_cast<int>(m[1]);
}

state_store::state_store(target_repository& repo)
    : repo(repo)
{
}

std::string state_store::put_value(std::string const& key, std::string const& text)
{
    std::string blob = repo.write_blob(text);
    boost::optional<std::string> old = repo.resolve(key);
    repo.update_ref(key, blob, old ? *old : null_sha);
    return blob;
}

boost::optional<std::string> state_store::get_value(std::string const& key)
{
    boost::optional<std::string> id = repo.resolve(key);
    if (!id)
        return boost::none;
    std::string text = repo.read_blob(*id);
    check_invariant(!text.empty(), "state value " + key + " exists but is empty");
    return text;
}

std::string state_store::append(
    std::string const& key, int transaction, std::string const& tree, std::time_t when)
{
    boost::optional<entry> last = last_entry(key);
    check_invariant(
        !last || last->transaction < transaction,
        "appending transaction " + lexical_cast<std::string>(transaction) + " to " + key
        + " after transaction " + lexical_cast<std::string>(last ? last->transaction : 0));

    commit_spec spec;
    spec.tree = tree;
    if (last)
        spec.parents.push_back(last->commit);
    spec.author = signature("accu2git", "accu2git@localhost", when);
    spec.committer = spec.author;
    spec.message = "transaction " + lexical_cast<std::string>(transaction);

    std::string id = repo.commit(spec);
    repo.update_ref(key, id, last ? last->commit : null_sha);

    check_invariant(
        repo.resolve(key) == boost::optional<std::string>(id),
        "update of " + key + " reported success but its tip did not move");

    sequence& s = cache[key];
    s.tip = id;
    entry e = { transaction, id, tree };
    s.entries.push_back(e);
    return id;
}

boost::optional<std::string> state_store::tip(std::string const& key)
{
    return repo.resolve(key);
}

std::vector<state_store::entry> const& state_store::entries(std::string const& key)
{
    sequence& s = cache[key];
    boost::optional<std::string> t = repo.resolve(key);
    if (!t)
    {
        s = sequence();
        return s.entries;
    }
    if (*t == s.tip)
        return s.entries;

    std::vector<std::string> chain = repo.ancestry(*t, true);

    // Only read what is new since the cached tip.
    std::size_t known = 0;
    if (!s.entries.empty() && s.entries.size() <= chain.size()
        && chain[s.entries.size() - 1] == s.entries.back().commit)
    {
        known = s.entries.size();
    }
    else
    {
        s.entries.clear();
    }

    for (std::size_t i = known; i < chain.size(); ++i)
    {
        commit_record c = repo.read_commit(chain[i]);
        boost::optional<int> tr = transaction_of_message(c.message);
        check_invariant(!!tr, "commit " + c.id + " in " + key + " does not name a transaction");
        check_invariant(
            s.entries.empty() || s.entries.back().transaction < *tr,
            key + " is not in transaction order at commit " + c.id);
        entry e = { *tr, c.id, c.tree };
        s.entries.push_back(e);
    }
    s.tip = *t;
    return s.entries;
}

boost::optional<state_store::entry> state_store::entry_at(std::string const& key, int tr)
{
    boost::optional<entry> result;
    for (auto const& e : entries(key))
    {
        if (e.transaction > tr)
            break;
        result = e;
    }
    return result;
}

boost::optional<state_store::entry> state_store::last_entry(std::string const& key)
{
    std::vector<entry> const& all = entries(key);
    if (all.empty())
        return boost::none;
    return all.back();
}

void state_store::reset(std::string const& key)
{
    if (boost::optional<std::string> old = repo.resolve(key))
        repo.delete_ref(key, *old);
    cache.erase(key);
}

boost::optional<int> state_store::read_number(std::string const& key, std::string const& field)
{
    boost::optional<std::string> text = get_value(key);
    if (!text)
        return boost::none;

    pt::ptree doc;
    std::istringstream in(*text);
    try
    {
        pt::read_json(in, doc);
        return doc.get<int>(field);
    }
    catch (pt::ptree_error const& e)
    {
        throw invariant_violation("state value " + key + " is unreadable: " + e.what());
    }
}

void state_store::write_number(std::string const& key, std::string const& field, int value)
{
    pt::ptree doc;
    doc.put(field, value);
    std::ostringstream out;
    pt::write_json(out, doc, false);
    put_value(key, out.str());
}

boost::optional<int> state_store::high_water_mark(std::string const& key)
{
    return read_number(key, "high-water-mark");
}

void state_store::set_high_water_mark(std::string const& key, int tr)
{
    write_number(key, "high-water-mark", tr);
}

boost::optional<int> state_store::processing_state()
{
    return read_number(state_key::processing, "transaction");
}

void state_store::set_processing_state(int tr)
{
    write_number(state_key::processing, "transaction", tr);
}

} // namespace accu2git
