// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef ACCUREV_CLI_DWA2013702_HPP
# define ACCUREV_CLI_DWA2013702_HPP

# include "depot_client.hpp"
# include <vector>

namespace accu2git {

class logger;

// Drives the accurev command line.
class accurev_cli : public depot_client
{
 public:
    accurev_cli(std::string const& executable, logger& log);

    std::string history(
        std::string const& depot, std::string const& time_spec,
        std::string const& stream, std::string const& kind) override;
    std::string diff(std::string const& stream, int from, int to) override;
    std::string streams(
        std::string const& depot, std::string const& time_spec, std::string const& stream) override;
    std::string depots() override;
    std::string users() override;
    void populate(
        std::string const& stream, int tr,
        boost::filesystem::path const& location, bool overwrite) override;
    std::string principal() override;
    void login(std::string const& user, std::string const& password) override;
    void logout() override;

 private:
    std::string run(
        std::vector<std::string> const& args,
        boost::filesystem::path const& dir = boost::filesystem::path("."));

    std::string executable;
    logger& log;
};

} // namespace accu2git

#endif // ACCUREV_CLI_DWA2013702_HPP
