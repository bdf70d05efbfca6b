// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef STATE_STORE_DWA2013702_HPP
# define STATE_STORE_DWA2013702_HPP

# include "target_repository.hpp"
# include <boost/optional.hpp>
# include <ctime>
# include <map>
# include <string>
# include <vector>

namespace accu2git {

// Where the converter keeps its state.  Streams are keyed by number;
// names change.
namespace state_key
{
  extern std::string const prefix;        // refs/ac2git/
  extern std::string const depots;
  extern std::string const processing;

  std::string metadata(int depot, int stream);
  std::string content(int depot, int stream);
  std::string high_water_mark(int depot, int stream);
}

extern std::string const annotation_notes_ref;   // refs/notes/ac2git
extern std::string const footer_notes_ref;       // refs/notes/accurev

// A key-value and append-log store kept in the refs of the target
// repository.  A value key points at a blob; a sequence key points at
// a linear chain of commits, one per transaction, oldest first.
class state_store
{
 public:
    struct entry
    {
        int transaction;
        std::string commit;
        std::string tree;
    };

    explicit state_store(target_repository& repo);

    target_repository& repository() { return repo; }

    std::string put_value(std::string const& key, std::string const& text);

    // An existing but empty value is an invariant violation.
    boost::optional<std::string> get_value(std::string const& key);

    // Adds an entry for transaction, which must be newer than the
    // current tip's, holding tree.  Throws invariant_violation if the
    // write reports success but the tip did not move.
    std::string append(std::string const& key, int transaction, std::string const& tree, std::time_t when);

    boost::optional<std::string> tip(std::string const& key);

    std::vector<entry> const& entries(std::string const& key);

    // The latest entry with a transaction id no greater than tr
    boost::optional<entry> entry_at(std::string const& key, int tr);

    boost::optional<entry> last_entry(std::string const& key);

    void reset(std::string const& key);

    boost::optional<int> high_water_mark(std::string const& key);
    void set_high_water_mark(std::string const& key, int tr);

    // The last transaction the processing stage completed
    boost::optional<int> processing_state();
    void set_processing_state(int tr);

 private:
    boost::optional<int> read_number(std::string const& key, std::string const& field);
    void write_number(std::string const& key, std::string const& field, int value);

    struct sequence
    {
        std::string tip;
        std::vector<entry> entries;
    };

    target_repository& repo;
    std::map<std::string, sequence> cache;
};

// "transaction 42" -> 42
boost::optional<int> transaction_of_message(std::string const& message);

} // namespace accu2git

#endif // STATE_STORE_DWA2013702_HPP
