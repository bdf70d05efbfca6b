// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef WORKING_TREE_DWA2013702_HPP
# define WORKING_TREE_DWA2013702_HPP

# include <boost/filesystem/path.hpp>
# include <string>
# include <vector>

namespace accu2git {

// Operations on the shared work tree.  The .git directory at its root
// is never touched.
namespace working_tree
{
  // Removes everything.
  void clear(boost::filesystem::path const& root);

  // Removes each of paths (relative to root) that exists.
  void remove_paths(boost::filesystem::path const& root, std::vector<std::string> const& paths);

  // Removes directories that hold nothing, or only an empty
  // .gitignore.
  void prune_empty_directories(boost::filesystem::path const& root);

  // Puts an empty .gitignore into every empty directory so that Git
  // records it.
  void preserve_empty_directories(boost::filesystem::path const& root);
}

} // namespace accu2git

#endif // WORKING_TREE_DWA2013702_HPP
