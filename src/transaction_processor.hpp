// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef TRANSACTION_PROCESSOR_DWA2013702_HPP
# define TRANSACTION_PROCESSOR_DWA2013702_HPP

# include "branches.hpp"
# include "merge_engine.hpp"
# include "transaction_kind.hpp"
# include <boost/optional.hpp>
# include <map>
# include <string>
# include <vector>

namespace accu2git {

// Replays the retrieved histories onto one branch per tracked stream,
// one depot transaction at a time.
class transaction_processor
{
 public:
    transaction_processor(context& ctx, std::vector<tracked_stream> const& tracked);

    // Processes every transaction after the last processed one, up to
    // the lowest high-water mark of the tracked streams.  Returns the
    // number of transactions processed.
    int run();

    void process(int tr);

 private:
    struct dispatch;
    friend struct dispatch;

    void on_create(transaction const& t);
    void on_reconfigure(transaction const& t);
    void on_content_change(transaction const& t);
    void on_promote(transaction const& t);
    void on_deactivate(transaction const& t);

    // Passes tr on to the streams that inherited it from origin.
    void propagate(
        stream_info const& origin, boost::optional<stream_info> const& src,
        transaction const& t, std::string const& reason);

    void commit_content(stream_info const& s, transaction const& t);
    void seed(int start);
    void name_branches(int start);

    int window_start();
    int window_end();
    std::vector<int> candidates(int start, int end);

    std::vector<stream_info> created_by(transaction const& t);
    boost::optional<stream_info> stream_at(boost::optional<int> number, int tr);
    bool is_tracked(int stream) const;
    boost::optional<std::string> content_at(int stream, int tr);
    std::string tree_at(stream_info const& s, int tr, std::string const& tip);
    annotation note_for(
        stream_info const& s, transaction const& t,
        stream_info const* dst = nullptr, stream_info const* src = nullptr) const;
    promotion_side side(stream_info const& s);

    context& ctx;
    std::vector<tracked_stream> tracked;
    std::map<int, std::string> branch_names;
    branch_writer branches;
    merge_engine merges;
};

} // namespace accu2git

#endif // TRANSACTION_PROCESSOR_DWA2013702_HPP
