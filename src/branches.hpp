// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHES_DWA2013702_HPP
# define BRANCHES_DWA2013702_HPP

# include "accurev_types.hpp"
# include "annotation.hpp"
# include "commit_message.hpp"
# include "context.hpp"
# include "target_repository.hpp"
# include <boost/optional.hpp>
# include <string>
# include <vector>

namespace accu2git {

// A stream the conversion follows, and the branch it goes to.  An
// empty explicit_branch means the branch is named after the stream
// and follows its renames.
struct tracked_stream
{
    int number;
    std::string name;
    std::string explicit_branch;
};

// The configured streams as found in listing, or every stream listed
// when none is configured.  A configured stream that is not listed
// is unrecognized_input.
std::vector<tracked_stream> select_streams(Options const& opts, stream_listing const& listing);

tracked_stream const* find_tracked(std::vector<tracked_stream> const& tracked, int number);

std::string branch_ref(std::string const& branch);

// Writes annotated commits onto branches.
class branch_writer
{
 public:
    explicit branch_writer(context& ctx);

    boost::optional<std::string> tip(std::string const& branch);

    // Commits spec on top of branch, whose tip must still be
    // expected_tip (none: the branch must not exist yet), then
    // annotates it.  If the annotation cannot be written the branch
    // is put back and fatal_error is thrown.
    std::string commit(
        std::string const& branch, boost::optional<std::string> const& expected_tip,
        commit_spec const& spec, annotation const& note, std::string const& footer_note);

    boost::optional<annotation> annotation_of(std::string const& commit);

    // The transaction recorded at the tip of branch, none when the
    // branch does not exist.
    boost::optional<int> last_transaction(std::string const& branch);

    // Brings a branch whose tip lost its annotation back to its
    // newest annotated first-parent ancestor.
    void recover(std::string const& branch);

    // Points branch at commit, whatever it pointed at before.
    void reset(std::string const& branch, std::string const& commit);

    void rename(std::string const& from, std::string const& to);

 private:
    context& ctx;
};

// Author and committer of a commit for tr.
signature signature_of(context const& ctx, transaction const& tr);

} // namespace accu2git

#endif // BRANCHES_DWA2013702_HPP
