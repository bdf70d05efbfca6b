// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "working_tree.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace accu2git {

namespace fs = boost::filesystem;

namespace
{
  bool is_git_dir(fs::path const& p)
  {
      return p.filename() == ".git";
  }

  std::vector<fs::path> children(fs::path const& dir)
  {
      std::vector<fs::path> result;
      for (fs::directory_iterator i(dir), end; i != end; ++i)
          result.push_back(i->path());
      return result;
  }

  bool is_empty_gitignore(fs::path const& p)
  {
      return p.filename() == ".gitignore" && fs::is_regular_file(p) && fs::file_size(p) == 0;
  }

  // Depth first, so that a directory emptied by pruning its children
  // is pruned too.  Returns true if dir was removed.
  bool prune(fs::path const& dir)
  {
      bool empty = true;
      for (auto const& c : children(dir))
      {
          if (fs::is_directory(c) && !fs::is_symlink(c))
          {
              if (!prune(c))
                  empty = false;
          }
          else if (!is_empty_gitignore(c))
          {
              empty = false;
          }
      }
      if (empty)
          fs::remove_all(dir);
      return empty;
  }

  void preserve(fs::path const& dir)
  {
      std::vector<fs::path> content = children(dir);
      if (content.empty())
      {
          fs::ofstream touch(dir / ".gitignore");
          return;
      }
      for (auto const& c : content)
      {
          if (fs::is_directory(c) && !fs::is_symlink(c))
              preserve(c);
      }
  }
}

void working_tree::clear(fs::path const& root)
{
    for (auto const& c : children(root))
    {
        if (!is_git_dir(c))
            fs::remove_all(c);
    }
}

void working_tree::remove_paths(fs::path const& root, std::vector<std::string> const& paths)
{
    for (auto const& p : paths)
    {
        fs::path target = root / p;
        if (is_git_dir(target))
            continue;
        if (fs::exists(fs::symlink_status(target)))
            fs::remove_all(target);
    }
}

void working_tree::prune_empty_directories(fs::path const& root)
{
    for (auto const& c : children(root))
    {
        if (!is_git_dir(c) && fs::is_directory(c) && !fs::is_symlink(c))
            prune(c);
    }
}

void working_tree::preserve_empty_directories(fs::path const& root)
{
    for (auto const& c : children(root))
    {
        if (!is_git_dir(c) && fs::is_directory(c) && !fs::is_symlink(c))
            preserve(c);
    }
}

} // namespace accu2git
