// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef DEPOT_CLIENT_DWA2013702_HPP
# define DEPOT_CLIENT_DWA2013702_HPP

# include <boost/filesystem/path.hpp>
# include <string>

namespace accu2git {

// The raw query surface of the source depot.  Every query returns the
// depot's XML answer unparsed.  Failures to run or to get an answer
// throw transient_error.
struct depot_client
{
    virtual ~depot_client() {}

    // time_spec is "now", "highest", "<tr>" or "<tr>-<tr>".  An empty
    // stream or kind means "any".
    virtual std::string history(
        std::string const& depot, std::string const& time_spec,
        std::string const& stream, std::string const& kind) = 0;

    virtual std::string diff(std::string const& stream, int from, int to) = 0;

    virtual std::string streams(
        std::string const& depot, std::string const& time_spec, std::string const& stream) = 0;

    virtual std::string depots() = 0;
    virtual std::string users() = 0;

    // Writes the stream's content at transaction tr below location.
    // Without overwrite, files already present are left alone.
    virtual void populate(
        std::string const& stream, int tr,
        boost::filesystem::path const& location, bool overwrite) = 0;

    // The logged in user, empty when nobody is.
    virtual std::string principal() = 0;
    virtual void login(std::string const& user, std::string const& password) = 0;
    virtual void logout() = 0;
};

} // namespace accu2git

#endif // DEPOT_CLIENT_DWA2013702_HPP
