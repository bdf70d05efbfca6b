// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_REPOSITORY_DWA2013614_HPP
# define GIT_REPOSITORY_DWA2013614_HPP

# include "process.hpp"
# include "retry.hpp"
# include "target_repository.hpp"

namespace accu2git {

class logger;

// A non-bare Git repository driven through the git command line.
// Commits and refs are written with plumbing, so no branch is ever
// checked out; the work tree is tracked through a private index.
struct git_repository : target_repository
{
    git_repository(
        boost::filesystem::path const& work_tree, std::string const& git_executable,
        logger& log, retry_policy const& retry);

    boost::optional<std::string> resolve(std::string const& ref) override;
    void update_ref(
        std::string const& ref, std::string const& new_value,
        boost::optional<std::string> const& old_value) override;
    void delete_ref(std::string const& ref, std::string const& old_value) override;
    std::vector<std::pair<std::string, std::string> > list_refs(std::string const& prefix) override;

    std::string write_blob(std::string const& content) override;
    std::string read_blob(std::string const& id) override;
    std::string write_tree(std::vector<std::pair<std::string, std::string> > const& files) override;
    boost::optional<std::string> read_file(std::string const& tree, std::string const& path) override;

    std::string commit(commit_spec const& spec) override;
    commit_record read_commit(std::string const& id) override;
    std::vector<std::string> ancestry(std::string const& tip, bool first_parent_only) override;

    void add_note(std::string const& notes_ref, std::string const& commit, std::string const& text) override;
    boost::optional<std::string> read_note(std::string const& notes_ref, std::string const& commit) override;

    boost::filesystem::path work_tree() override { return work_tree_; }
    std::string snapshot_work_tree() override;
    void checkout_tree(std::string const& tree) override;
    bool work_tree_matches(std::string const& tree) override;

    void set_config(std::string const& key, std::string const& value) override;
    void unset_config(std::string const& key) override;

    std::vector<std::string> remotes() override;
    void add_remote(std::string const& name, std::string const& url, std::string const& push_url) override;
    void push(std::string const& remote, std::vector<std::string> const& refspecs) override;

    boost::filesystem::path const& git_dir() const { return git_dir_; }

 private:
    static bool ensure_existence(boost::filesystem::path const& work_tree, std::string const& git);

    // One attempt; the exit code is the caller's business.
    command_result git(
        std::vector<std::string> const& args,
        std::string const& input = std::string(),
        environment_overrides const& env = environment_overrides());

    // Retried until git exits with 0; returns its output.
    std::string run(
        std::vector<std::string> const& args,
        std::string const& input = std::string(),
        environment_overrides const& env = environment_overrides());

    environment_overrides private_index() const;

 private: // data members
    boost::filesystem::path work_tree_;
    std::string git_exe;
    logger& log;
    retry_policy retry;

    // This is just a place to hang a constructor initializer, that
    // ensures the repository is created before it is used.
    bool created;

    boost::filesystem::path git_dir_;
};

} // namespace accu2git

#endif // GIT_REPOSITORY_DWA2013614_HPP
