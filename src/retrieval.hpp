// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef RETRIEVAL_DWA2013702_HPP
# define RETRIEVAL_DWA2013702_HPP

# include "accurev_types.hpp"
# include "context.hpp"
# include "source_depot.hpp"
# include "state_store.hpp"
# include <boost/optional.hpp>
# include <string>

namespace accu2git {

struct retrieval_result
{
    int last_transaction;
    boost::optional<std::string> content_commit;
};

// Pulls the history of one stream into its metadata and content
// histories.  Safe to interrupt anywhere: every entry is written
// whole, content follows metadata, and the high-water mark comes last.
class stream_retriever
{
 public:
    explicit stream_retriever(context& ctx);

    retrieval_result retrieve(stream_info const& stream, int start, int end);

 private:
    struct change
    {
        int transaction;
        boost::optional<source_depot::diff_result> diff;
    };

    // The first transaction after position that changes the stream,
    // or one past end.  diff_base is the last recorded transaction.
    change find_next_change(
        stream_info const& stream, int diff_base, int position, int end,
        boost::optional<std::vector<int> > const& deep);

    void append_metadata(
        stream_info const& stream, int tr,
        boost::optional<source_depot::diff_result> const& diff);

    // Materializes the content of a metadata entry on top of the
    // previous content entry and records it.
    void append_content(
        stream_info const& stream, state_store::entry const& metadata,
        boost::optional<state_store::entry> const& previous);

    // The content histories must follow the metadata history.
    void check_alignment(stream_info const& stream);

    context& ctx;
    std::string metadata_key;
    std::string content_key;
    std::string hwm_key;
};

} // namespace accu2git

#endif // RETRIEVAL_DWA2013702_HPP
