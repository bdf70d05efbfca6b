// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "memory_repository.hpp"
#include "errors.hpp"
#include "working_tree.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/uuid/detail/sha1.hpp>
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace accu2git {

namespace fs = boost::filesystem;

namespace
{
  std::string sha1(std::string const& kind, std::string const& content)
  {
      boost::uuids::detail::sha1 hash;
      std::string text = kind + '\0' + content;
      hash.process_bytes(text.data(), text.size());
      boost::uuids::detail::sha1::digest_type digest;
      hash.get_digest(digest);

      std::ostringstream out;
      out << std::hex << std::setfill('0');
      for (unsigned int word : digest)
          out << std::setw(8) << word;
      return out.str();
  }

  std::string encode(signature const& s)
  {
      std::ostringstream out;
      out << s.name << " <" << s.email << "> " << s.when << ' ' << s.tz_minutes;
      return out.str();
  }
}

memory_repository::memory_repository()
    : failing_notes(0), failing_ref_reads(0), failing_note_reads(0), failing_pushes(false)
    , root(fs::temp_directory_path() / fs::unique_path("accu2git-%%%%-%%%%-%%%%"))
{
    fs::create_directories(root / ".git");
    trees[empty_tree_sha];
}

memory_repository::~memory_repository()
{
    boost::system::error_code ignored;
    fs::remove_all(root, ignored);
}

boost::optional<std::string> memory_repository::resolve(std::string const& ref)
{
    if (failing_ref_reads > 0)
    {
        --failing_ref_reads;
        throw transient_error("cannot read " + ref);
    }
    auto r = refs.find(ref);
    if (r == refs.end())
        return boost::none;
    return r->second;
}

void memory_repository::update_ref(
    std::string const& ref, std::string const& new_value,
    boost::optional<std::string> const& old_value)
{
    auto r = refs.find(ref);
    if (old_value)
    {
        bool ok = *old_value == null_sha ? r == refs.end() : r != refs.end() && r->second == *old_value;
        if (!ok)
            throw fatal_error("lost the update of " + ref);
    }
    refs[ref] = new_value;
}

void memory_repository::delete_ref(std::string const& ref, std::string const& old_value)
{
    auto r = refs.find(ref);
    if (r == refs.end() || r->second != old_value)
        throw fatal_error("lost the deletion of " + ref);
    refs.erase(r);
    notes.erase(ref);
}

std::vector<std::pair<std::string, std::string> > memory_repository::list_refs(std::string const& prefix)
{
    std::vector<std::pair<std::string, std::string> > result;
    for (auto const& r : refs)
    {
        if (r.first.compare(0, prefix.size(), prefix) == 0)
            result.push_back(r);
    }
    return result;
}

std::string memory_repository::write_blob(std::string const& content)
{
    std::string id = sha1("blob", content);
    blobs[id] = content;
    return id;
}

std::string memory_repository::read_blob(std::string const& id)
{
    auto b = blobs.find(id);
    if (b == blobs.end())
        throw transient_error("no blob " + id);
    return b->second;
}

std::string memory_repository::write_tree(std::vector<std::pair<std::string, std::string> > const& files)
{
    if (files.empty())
        return empty_tree_sha;

    std::map<std::string, std::string> content(files.begin(), files.end());
    std::string encoded;
    for (auto const& f : content)
        encoded += f.first + '\0' + write_blob(f.second) + '\n';

    std::string id = sha1("tree", encoded);
    trees[id] = content;
    return id;
}

boost::optional<std::string> memory_repository::read_file(std::string const& tree, std::string const& path)
{
    std::map<std::string, std::string> const& content = files(tree);
    auto f = content.find(path);
    if (f == content.end())
        return boost::none;
    return f->second;
}

std::map<std::string, std::string> const& memory_repository::files(std::string const& tree)
{
    auto t = trees.find(tree);
    if (t == trees.end())
        throw transient_error("no tree " + tree);
    return t->second;
}

std::string memory_repository::commit(commit_spec const& spec)
{
    files(spec.tree);

    std::string encoded = "tree " + spec.tree + '\n';
    for (auto const& p : spec.parents)
    {
        if (!commits.count(p))
            throw transient_error("no commit " + p);
        encoded += "parent " + p + '\n';
    }
    encoded += "author " + encode(spec.author) + '\n';
    encoded += "committer " + encode(spec.committer) + '\n';
    encoded += '\n' + spec.message;

    commit_record c;
    c.id = sha1("commit", encoded);
    c.tree = spec.tree;
    c.parents = spec.parents;
    c.author = spec.author;
    c.committer = spec.committer;
    c.message = spec.message;
    commits[c.id] = c;
    return c.id;
}

commit_record memory_repository::read_commit(std::string const& id)
{
    auto c = commits.find(id);
    if (c == commits.end())
        throw transient_error("no commit " + id);
    return c->second;
}

std::vector<std::string> memory_repository::ancestry(std::string const& tip, bool first_parent_only)
{
    std::vector<std::string> result;
    std::map<std::string, bool> seen;

    // Post-order: every commit after its parents.
    std::vector<std::pair<std::string, bool> > todo(1, std::make_pair(tip, false));
    while (!todo.empty())
    {
        std::pair<std::string, bool> item = todo.back();
        todo.pop_back();
        if (item.second)
        {
            result.push_back(item.first);
            continue;
        }
        if (seen[item.first])
            continue;
        seen[item.first] = true;

        todo.push_back(std::make_pair(item.first, true));
        std::vector<std::string> const& parents = read_commit(item.first).parents;
        std::size_t n = first_parent_only ? std::min<std::size_t>(1, parents.size()) : parents.size();
        for (std::size_t i = n; i-- > 0;)
        {
            if (!seen[parents[i]])
                todo.push_back(std::make_pair(parents[i], false));
        }
    }
    return result;
}

void memory_repository::add_note(std::string const& notes_ref, std::string const& commit, std::string const& text)
{
    if (failing_notes > 0)
    {
        --failing_notes;
        throw transient_error("cannot write note on " + commit);
    }
    notes[notes_ref][commit] = text;

    std::string encoded;
    for (auto const& n : notes[notes_ref])
        encoded += n.first + '\0' + n.second + '\n';
    refs[notes_ref] = sha1("notes", encoded);
}

boost::optional<std::string> memory_repository::read_note(std::string const& notes_ref, std::string const& commit)
{
    if (failing_note_reads > 0)
    {
        --failing_note_reads;
        throw transient_error("cannot read the note on " + commit);
    }
    auto r = notes.find(notes_ref);
    if (r == notes.end())
        return boost::none;
    auto n = r->second.find(commit);
    if (n == r->second.end())
        return boost::none;
    return n->second;
}

std::vector<std::pair<std::string, std::string> > memory_repository::read_work_tree()
{
    std::vector<std::pair<std::string, std::string> > result;
    std::string prefix = root.generic_string() + "/";
    for (fs::recursive_directory_iterator i(root), end; i != end; ++i)
    {
        if (i->path().filename() == ".git")
        {
            i.disable_recursion_pending();
            continue;
        }
        if (!fs::is_regular_file(i->path()))
            continue;

        fs::ifstream in(i->path(), std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        result.emplace_back(i->path().generic_string().substr(prefix.size()), content);
    }
    return result;
}

std::string memory_repository::snapshot_work_tree()
{
    return write_tree(read_work_tree());
}

void memory_repository::checkout_tree(std::string const& tree)
{
    std::map<std::string, std::string> const& content = files(tree);
    working_tree::clear(root);
    for (auto const& f : content)
    {
        fs::path p = root / f.first;
        fs::create_directories(p.parent_path());
        fs::ofstream out(p, std::ios::binary);
        out << f.second;
    }
}

bool memory_repository::work_tree_matches(std::string const& tree)
{
    std::vector<std::pair<std::string, std::string> > found = read_work_tree();
    return std::map<std::string, std::string>(found.begin(), found.end()) == files(tree);
}

void memory_repository::set_config(std::string const& key, std::string const& value)
{
    config[key] = value;
}

void memory_repository::unset_config(std::string const& key)
{
    config.erase(key);
}

std::vector<std::string> memory_repository::remotes()
{
    return remote_names;
}

void memory_repository::add_remote(std::string const& name, std::string const&, std::string const&)
{
    remote_names.push_back(name);
}

void memory_repository::push(std::string const& remote, std::vector<std::string> const& refspecs)
{
    if (failing_pushes)
        throw transient_error("cannot push to " + remote);
    pushes.emplace_back(remote, refspecs);
}

} // namespace accu2git
