// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef COMMIT_MESSAGE_DWA2013702_HPP
# define COMMIT_MESSAGE_DWA2013702_HPP

# include "accurev_types.hpp"
# include "options.hpp"
# include <string>

namespace accu2git {

struct commit_message
{
    std::string text;
    // The footer, when it goes to refs/notes/accurev instead of the
    // message.  Empty otherwise.
    std::string note;
};

// Column-aligned "Accurev-*" lines describing tr and the streams
// involved.  Any stream may be null.
std::string transaction_footer(
    transaction const& tr,
    stream_info const* stream,
    stream_info const* dst = nullptr,
    stream_info const* src = nullptr);

// title and friendly are optional extra paragraphs around the comment.
commit_message make_commit_message(
    message_style style,
    transaction const& tr,
    stream_info const* stream,
    stream_info const* dst = nullptr,
    stream_info const* src = nullptr,
    std::string const& title = std::string(),
    std::string const& friendly = std::string());

// "My Stream" -> "My_Stream"
std::string sanitize_branch_name(std::string const& name);

} // namespace accu2git

#endif // COMMIT_MESSAGE_DWA2013702_HPP
