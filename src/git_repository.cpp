// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "git_repository.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/container/flat_map.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace accu2git {

namespace fs = boost::filesystem;
using boost::lexical_cast;

std::string const empty_tree_sha("4b825dc642cb6eb9a060e54bf8d69288fbee4904");
std::string const null_sha(40, '0');

namespace
{
  std::vector<std::string> lines(std::string const& text)
  {
      std::vector<std::string> result;
      std::istringstream in(text);
      std::string line;
      while (std::getline(in, line))
      {
          if (!line.empty())
              result.push_back(line);
      }
      return result;
  }

  std::string git_date(signature const& s)
  {
      int offset = std::abs(s.tz_minutes);
      std::ostringstream out;
      out << '@' << s.when << ' ' << (s.tz_minutes < 0 ? '-' : '+')
          << std::setfill('0') << std::setw(2) << offset / 60
          << std::setw(2) << offset % 60;
      return out.str();
  }

  // "Name <email> 1372712345 +0200"
  signature parse_signature(std::string const& text)
  {
      signature s;
      std::string::size_type open = text.find(" <");
      std::string::size_type close = text.rfind('>');
      if (open == std::string::npos || close == std::string::npos || close < open)
          throw unrecognized_input("malformed identity '" + text + "'");

      s.name = text.substr(0, open);
      s.email = text.substr(open + 2, close - open - 2);

      std::istringstream rest(text.substr(close + 1));
      long long when = 0;
      std::string tz;
      rest >> when >> tz;
      s.when = static_cast<std::time_t>(when);
      if (tz.size() == 5)
      {
          int minutes = lexical_cast<int>(tz.substr(1, 2)) * 60 + lexical_cast<int>(tz.substr(3, 2));
          s.tz_minutes = tz[0] == '-' ? -minutes : minutes;
      }
      return s;
  }

  environment_overrides identity_env(commit_spec const& spec)
  {
      return environment_overrides{
          { "GIT_AUTHOR_NAME", spec.author.name },
          { "GIT_AUTHOR_EMAIL", spec.author.email },
          { "GIT_AUTHOR_DATE", git_date(spec.author) },
          { "GIT_COMMITTER_NAME", spec.committer.name },
          { "GIT_COMMITTER_EMAIL", spec.committer.email },
          { "GIT_COMMITTER_DATE", git_date(spec.committer) } };
  }

  // Messages that are matched must not be translated.
  environment_overrides const untranslated{ { "LC_ALL", "C" } };

  // Notes are bookkeeping of the converter itself.
  environment_overrides const converter_identity{
      { "GIT_AUTHOR_NAME", "accu2git" },
      { "GIT_AUTHOR_EMAIL", "accu2git@localhost" },
      { "GIT_COMMITTER_NAME", "accu2git" },
      { "GIT_COMMITTER_EMAIL", "accu2git@localhost" } };
}

git_repository::git_repository(
    fs::path const& work_tree, std::string const& git_executable,
    logger& log, retry_policy const& retry)
    : work_tree_(fs::absolute(work_tree)),
      git_exe(git_executable),
      log(log),
      retry(retry),
      created(ensure_existence(work_tree_, git_executable)),
      git_dir_(work_tree_ / ".git")
{
}

bool git_repository::ensure_existence(fs::path const& work_tree, std::string const& git)
{
    if (fs::exists(work_tree / ".git"))
        return true;

    // Create the new repository
    fs::create_directories(work_tree);
    command_result r = run_command(git, { "init", "--quiet" }, work_tree);
    if (r.exit_code != 0)
        throw fatal_error("git init in " + work_tree.string() + " failed: " + r.err);
    return true;
}

command_result git_repository::git(
    std::vector<std::string> const& args, std::string const& input, environment_overrides const& env)
{
    log.trace() << command_line("git", args) << std::endl;
    return run_command(git_exe, args, work_tree_, input, env);
}

std::string git_repository::run(
    std::vector<std::string> const& args, std::string const& input, environment_overrides const& env)
{
    return with_retry(
        retry, log, command_line("git", args),
        [&]() -> std::string
        {
            command_result r = git(args, input, env);
            if (r.exit_code != 0)
                throw transient_error("exit code " + lexical_cast<std::string>(r.exit_code) + ": " + r.err);
            return r.out;
        });
}

environment_overrides git_repository::private_index() const
{
    return environment_overrides{ { "GIT_INDEX_FILE", (git_dir_ / "accu2git.index").string() } };
}

// for-each-ref succeeds whether or not ref exists, so only a real
// failure is retried.
boost::optional<std::string> git_repository::resolve(std::string const& ref)
{
    for (auto const& r : list_refs(ref))
    {
        if (r.first == ref)
            return r.second;
    }
    return boost::none;
}

void git_repository::update_ref(
    std::string const& ref, std::string const& new_value,
    boost::optional<std::string> const& old_value)
{
    std::vector<std::string> args = { "update-ref", ref, new_value };
    if (old_value)
        args.push_back(*old_value);

    command_result r = git(args);
    if (r.exit_code == 0)
        return;

    // The update may have landed before git reported failure.
    if (resolve(ref) == boost::optional<std::string>(new_value))
        return;
    throw fatal_error("cannot move " + ref + " to " + new_value + ": " + r.err);
}

void git_repository::delete_ref(std::string const& ref, std::string const& old_value)
{
    command_result r = git({ "update-ref", "-d", ref, old_value });
    if (r.exit_code != 0 && resolve(ref))
        throw fatal_error("cannot delete " + ref + ": " + r.err);
}

std::vector<std::pair<std::string, std::string> > git_repository::list_refs(std::string const& prefix)
{
    std::vector<std::pair<std::string, std::string> > result;
    for (auto const& line : lines(run({ "for-each-ref", "--format=%(refname) %(objectname)", prefix })))
    {
        std::string::size_type space = line.rfind(' ');
        result.emplace_back(line.substr(0, space), line.substr(space + 1));
    }
    return result;
}

std::string git_repository::write_blob(std::string const& content)
{
    return boost::algorithm::trim_copy(
        run({ "hash-object", "-w", "--no-filters", "--stdin" }, content));
}

std::string git_repository::read_blob(std::string const& id)
{
    return run({ "cat-file", "blob", id });
}

std::string git_repository::write_tree(std::vector<std::pair<std::string, std::string> > const& files)
{
    // Files at this level, and the contents of each subdirectory
    std::ostringstream listing;
    boost::container::flat_map<std::string, std::vector<std::pair<std::string, std::string> > > subdirs;

    for (auto const& f : files)
    {
        std::string::size_type slash = f.first.find('/');
        if (slash == std::string::npos)
            listing << "100644 blob " << write_blob(f.second) << '\t' << f.first << '\n';
        else
            subdirs[f.first.substr(0, slash)].emplace_back(f.first.substr(slash + 1), f.second);
    }
    for (auto const& d : subdirs)
        listing << "040000 tree " << write_tree(d.second) << '\t' << d.first << '\n';

    return boost::algorithm::trim_copy(run({ "mktree" }, listing.str()));
}

boost::optional<std::string> git_repository::read_file(std::string const& tree, std::string const& path)
{
    std::string entry = run({ "ls-tree", tree, "--", path });
    if (entry.empty())
        return boost::none;

    // "<mode> blob <id>\t<path>"
    std::istringstream in(entry);
    std::string mode, type, id;
    in >> mode >> type >> id;
    if (type != "blob")
        return boost::none;
    return read_blob(id);
}

std::string git_repository::commit(commit_spec const& spec)
{
    std::vector<std::string> args = { "commit-tree", spec.tree };
    for (auto const& p : spec.parents)
    {
        args.push_back("-p");
        args.push_back(p);
    }
    return boost::algorithm::trim_copy(run(args, spec.message, identity_env(spec)));
}

commit_record git_repository::read_commit(std::string const& id)
{
    std::string text = run({ "cat-file", "commit", id });
    commit_record c;
    c.id = id;

    std::string::size_type pos = 0;
    while (pos < text.size())
    {
        std::string::size_type eol = text.find('\n', pos);
        if (eol == std::string::npos)
            eol = text.size();
        std::string line = text.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty())
            break;

        std::string::size_type space = line.find(' ');
        std::string key = line.substr(0, space);
        std::string value = space == std::string::npos ? std::string() : line.substr(space + 1);
        if (key == "tree")
            c.tree = value;
        else if (key == "parent")
            c.parents.push_back(value);
        else if (key == "author")
            c.author = parse_signature(value);
        else if (key == "committer")
            c.committer = parse_signature(value);
    }
    if (pos < text.size())
        c.message = text.substr(pos);
    return c;
}

std::vector<std::string> git_repository::ancestry(std::string const& tip, bool first_parent_only)
{
    std::vector<std::string> args = { "rev-list", "--topo-order", "--reverse" };
    if (first_parent_only)
        args.push_back("--first-parent");
    args.push_back(tip);
    return lines(run(args));
}

void git_repository::add_note(std::string const& notes_ref, std::string const& commit, std::string const& text)
{
    run({ "notes", "--ref=" + notes_ref, "add", "-f", "-F", "-", commit }, text, converter_identity);
}

boost::optional<std::string> git_repository::read_note(std::string const& notes_ref, std::string const& commit)
{
    if (!resolve(notes_ref))
        return boost::none;

    std::vector<std::string> args = { "notes", "--ref=" + notes_ref, "list", commit };
    boost::optional<std::string> note = with_retry(
        retry, log, command_line("git", args),
        [&]() -> boost::optional<std::string>
        {
            command_result r = git(args, "", untranslated);
            if (r.exit_code == 0)
                return boost::algorithm::trim_copy(r.out);
            if (r.err.find("no note found") != std::string::npos)
                return boost::none;
            throw transient_error("exit code " + lexical_cast<std::string>(r.exit_code) + ": " + r.err);
        });
    if (!note)
        return boost::none;
    return read_blob(*note);
}

std::string git_repository::snapshot_work_tree()
{
    run({ "read-tree", "--empty" }, "", private_index());
    run({ "add", "-A", "-f", "." }, "", private_index());
    return boost::algorithm::trim_copy(run({ "write-tree" }, "", private_index()));
}

void git_repository::checkout_tree(std::string const& tree)
{
    run({ "read-tree", tree }, "", private_index());
    run({ "clean", "-ffdxq" }, "", private_index());
    run({ "checkout-index", "-a", "-f" }, "", private_index());
}

bool git_repository::work_tree_matches(std::string const& tree)
{
    return snapshot_work_tree() == tree;
}

void git_repository::set_config(std::string const& key, std::string const& value)
{
    run({ "config", key, value });
}

void git_repository::unset_config(std::string const& key)
{
    command_result r = git({ "config", "--unset", key });
    // 5: the key was not set
    if (r.exit_code != 0 && r.exit_code != 5)
        throw transient_error("git config --unset " + key + " failed: " + r.err);
}

std::vector<std::string> git_repository::remotes()
{
    return lines(run({ "remote" }));
}

void git_repository::add_remote(std::string const& name, std::string const& url, std::string const& push_url)
{
    run({ "remote", "add", name, url });
    if (!push_url.empty())
        run({ "remote", "set-url", "--push", name, push_url });
}

void git_repository::push(std::string const& remote, std::vector<std::string> const& refspecs)
{
    std::vector<std::string> args = { "push", remote };
    args.insert(args.end(), refspecs.begin(), refspecs.end());
    run(args);
}

} // namespace accu2git
