// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef TARGET_REPOSITORY_DWA2013702_HPP
# define TARGET_REPOSITORY_DWA2013702_HPP

# include <boost/filesystem/path.hpp>
# include <boost/optional.hpp>
# include <ctime>
# include <string>
# include <utility>
# include <vector>

namespace accu2git {

// This is the SHA1 of an empty tree.
extern std::string const empty_tree_sha;

// Stands for "the ref must not exist yet" in a compare-and-swap.
extern std::string const null_sha;

struct signature
{
    signature() : when(0), tz_minutes(0) {}
    signature(std::string const& name, std::string const& email, std::time_t when, int tz_minutes = 0)
        : name(name), email(email), when(when), tz_minutes(tz_minutes)
    {}

    std::string name;
    std::string email;
    std::time_t when;
    int tz_minutes;   // east of UTC
};

struct commit_spec
{
    std::string tree;
    std::vector<std::string> parents;
    signature author;
    signature committer;
    std::string message;
};

struct commit_record
{
    std::string id;
    std::string tree;
    std::vector<std::string> parents;
    signature author;
    signature committer;
    std::string message;
};

// The object, ref and note primitives the converter needs from the
// repository it writes, plus the one shared work tree.  Failures of
// the underlying tool throw transient_error; a compare-and-swap that
// loses throws fatal_error.
struct target_repository
{
    virtual ~target_repository() {}

    // none only when ref does not exist; a failed read throws.
    virtual boost::optional<std::string> resolve(std::string const& ref) = 0;

    // Moves ref to new_value only while it still points at old_value;
    // null_sha requires that ref not exist.  Without old_value the
    // update is unconditional.
    virtual void update_ref(
        std::string const& ref, std::string const& new_value,
        boost::optional<std::string> const& old_value) = 0;
    virtual void delete_ref(std::string const& ref, std::string const& old_value) = 0;

    // (ref name, object id) pairs below prefix, sorted by name
    virtual std::vector<std::pair<std::string, std::string> > list_refs(std::string const& prefix) = 0;

    virtual std::string write_blob(std::string const& content) = 0;
    virtual std::string read_blob(std::string const& id) = 0;

    // A tree of plain files, (path, content); paths may contain '/'.
    virtual std::string write_tree(std::vector<std::pair<std::string, std::string> > const& files) = 0;
    virtual boost::optional<std::string> read_file(std::string const& tree, std::string const& path) = 0;

    virtual std::string commit(commit_spec const& spec) = 0;
    virtual commit_record read_commit(std::string const& id) = 0;

    // Commits reachable from tip, oldest first.
    virtual std::vector<std::string> ancestry(std::string const& tip, bool first_parent_only) = 0;

    virtual void add_note(std::string const& notes_ref, std::string const& commit, std::string const& text) = 0;
    // none only when commit has no note; a failed read throws.
    virtual boost::optional<std::string> read_note(std::string const& notes_ref, std::string const& commit) = 0;

    virtual boost::filesystem::path work_tree() = 0;
    // Records everything in the work tree, ignored files included.
    virtual std::string snapshot_work_tree() = 0;
    // Makes the work tree hold exactly tree.
    virtual void checkout_tree(std::string const& tree) = 0;
    virtual bool work_tree_matches(std::string const& tree) = 0;

    virtual void set_config(std::string const& key, std::string const& value) = 0;
    virtual void unset_config(std::string const& key) = 0;

    virtual std::vector<std::string> remotes() = 0;
    virtual void add_remote(std::string const& name, std::string const& url, std::string const& push_url) = 0;
    virtual void push(std::string const& remote, std::vector<std::string> const& refspecs) = 0;
};

} // namespace accu2git

#endif // TARGET_REPOSITORY_DWA2013702_HPP
