// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef ACCUREV_TYPES_DWA2013702_HPP
# define ACCUREV_TYPES_DWA2013702_HPP

# include <boost/optional.hpp>
# include <ctime>
# include <string>
# include <vector>

namespace accu2git {

struct depot_info
{
    int number;
    std::string name;
};

// A node of the stream tree as seen at one transaction.  The prev_*
// members are only filled in by the transaction that changed them.
struct stream_info
{
    stream_info() : number(0) {}

    bool is_workspace() const { return type == "workspace"; }

    int number;
    std::string name;
    std::string depot;
    std::string type;

    boost::optional<int> basis_number;
    std::string basis;

    boost::optional<int> prev_basis_number;
    std::string prev_basis;
    std::string prev_name;

    boost::optional<std::time_t> time_lock;
    boost::optional<std::time_t> prev_time_lock;
};

struct stream_listing
{
    stream_info const* find(int number) const
    {
        for (auto const& s : streams)
            if (s.number == number)
                return &s;
        return nullptr;
    }

    stream_info const* find(std::string const& name) const
    {
        for (auto const& s : streams)
            if (s.name == name)
                return &s;
        return nullptr;
    }

    std::vector<stream_info> streams;
};

struct transaction
{
    transaction() : id(0), time(0) {}

    int id;
    std::string kind_name;
    std::string user;
    std::string comment;
    std::time_t time;

    // The stream the transaction happened in (the destination of a
    // promote).
    boost::optional<int> stream_number;
    std::string stream_name;

    // The source of a promote.
    boost::optional<int> from_stream_number;
    std::string from_stream_name;

    // mkstream and chstream describe the stream they touch.
    boost::optional<stream_info> stream;
};

} // namespace accu2git

#endif // ACCUREV_TYPES_DWA2013702_HPP
