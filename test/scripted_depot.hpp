// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SCRIPTED_DEPOT_DWA2013702_HPP
# define SCRIPTED_DEPOT_DWA2013702_HPP

# include "depot_client.hpp"
# include <boost/optional.hpp>
# include <ctime>
# include <map>
# include <string>
# include <vector>

namespace accu2git {

// A depot whose history is written by the test.  Transaction 1
// creates the root stream.  Every stream keeps the files it changed
// (its default group) on top of what it inherits from its basis; a
// promote moves files from one stream's default group into another's.
// Queries answer in the XML the accurev command line produces.
class scripted_depot : public depot_client
{
 public:
    explicit scripted_depot(std::string const& depot = "Depot", std::string const& root = "Root");

    // Each of these appends one transaction and returns its id.
    int mkstream(std::string const& name, std::string const& basis, std::string const& type = "normal");
    int chstream(std::string const& name, std::string const& new_basis, std::string const& new_name = "");
    int add(std::string const& stream, std::string const& path, std::string const& content);
    int keep(std::string const& stream, std::string const& path, std::string const& content);
    int defunct(std::string const& stream, std::string const& path);

    // Moves paths (all of them when empty) out of from's default group
    // into to's.
    int promote(std::string const& from, std::string const& to,
                std::vector<std::string> const& paths = std::vector<std::string>());

    // A transaction that changes nothing
    int record(std::string const& kind, std::string const& stream);

    int highest() const { return static_cast<int>(log.size()); }
    std::time_t time_of(int tr) const { return 1372700000 + 60 * tr; }

    // The files stream shows at transaction tr
    std::map<std::string, std::string> content(std::string const& stream, int tr) const;

    std::string user;
    std::string comment;

    // The next n queries fail.
    int failing_queries;
    int logins;
    int logouts;

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
    struct stream_state
    {
        int number;
        std::string name;
        std::string type;
        int basis;   // 0: none
        // none marks a defunct file
        std::map<std::string, boost::optional<std::string> > default_group;
    };
    typedef std::vector<stream_state> snapshot;

    struct entry
    {
        int id;
        std::string kind;
        std::string user;
        std::string comment;
        int stream;
        int from_stream;
        // mkstream and chstream describe the stream they touch
        bool describes_stream;
        std::string prev_name;
        int prev_basis;
    };

    snapshot& begin_transaction();
    int end_transaction(
        std::string const& kind, int stream, int from_stream = 0,
        bool describes_stream = false, std::string const& prev_name = "", int prev_basis = 0);

    static stream_state* find(snapshot& s, std::string const& name);
    static stream_state const* find(snapshot const& s, std::string const& name);
    static stream_state const* find(snapshot const& s, int number);
    // A stream named by its number, or by what it is called now or
    // was last called; 0 when there is none.
    int number_of(std::string const& stream) const;
    std::map<std::string, std::string> content(snapshot const& s, int stream) const;
    void check_available();
    std::pair<int, int> range(std::string const& time_spec) const;

    std::string depot;
    bool logged_in;
    std::vector<snapshot> states;   // states[tr]: the streams after tr
    std::vector<entry> log;
};

} // namespace accu2git

#endif // SCRIPTED_DEPOT_DWA2013702_HPP
