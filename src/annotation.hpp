// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef ANNOTATION_DWA2013702_HPP
# define ANNOTATION_DWA2013702_HPP

# include <boost/optional.hpp>
# include <string>

namespace accu2git {

// The note every branch commit carries, linking it back to the
// transaction that produced it.
struct annotation
{
    annotation() : stream_number(0), transaction(0) {}

    std::string depot;
    std::string stream;
    int stream_number;
    int transaction;
    std::string kind;

    // promotions and inherited commits
    boost::optional<std::string> dst_stream;
    boost::optional<int> dst_stream_number;
    boost::optional<std::string> src_stream;
    boost::optional<int> src_stream_number;
};

std::string to_json(annotation const& a);

// none if text is not a complete annotation
boost::optional<annotation> parse_annotation(std::string const& text);

} // namespace accu2git

#endif // ANNOTATION_DWA2013702_HPP
