// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "memory_repository.hpp"
#include "errors.hpp"
#include "state_store.hpp"

#include <boost/test/unit_test.hpp>

using namespace accu2git;

namespace {

struct store_fixture
{
    store_fixture() : store(repo) {}

    std::string tree(std::string const& content)
    {
        std::vector<std::pair<std::string, std::string> > files;
        files.emplace_back("file.txt", content);
        return repo.write_tree(files);
    }

    memory_repository repo;
    state_store store;
};

}

BOOST_FIXTURE_TEST_SUITE(state_store_suite, store_fixture)

BOOST_AUTO_TEST_CASE(keys_use_stream_numbers)
{
    BOOST_CHECK_EQUAL(state_key::metadata(1, 7), "refs/ac2git/1/streams/stream_7_info");
    BOOST_CHECK_EQUAL(state_key::content(1, 7), "refs/ac2git/1/streams/stream_7_data");
    BOOST_CHECK_EQUAL(state_key::high_water_mark(2, 3), "refs/ac2git/2/streams/stream_3_hwm");
    BOOST_CHECK_EQUAL(state_key::depots, "refs/ac2git/depots");
}

BOOST_AUTO_TEST_CASE(values)
{
    BOOST_CHECK(!store.get_value("refs/ac2git/x"));
    std::string blob = store.put_value("refs/ac2git/x", "hello");
    BOOST_CHECK_EQUAL(*repo.resolve("refs/ac2git/x"), blob);
    BOOST_CHECK_EQUAL(*store.get_value("refs/ac2git/x"), "hello");

    store.put_value("refs/ac2git/x", "world");
    BOOST_CHECK_EQUAL(*store.get_value("refs/ac2git/x"), "world");
}

BOOST_AUTO_TEST_CASE(empty_value_is_an_invariant_violation)
{
    repo.update_ref("refs/ac2git/x", repo.write_blob(""), null_sha);
    BOOST_CHECK_THROW(store.get_value("refs/ac2git/x"), invariant_violation);
}

BOOST_AUTO_TEST_CASE(failed_reads_are_not_absent_values)
{
    store.put_value("refs/ac2git/x", "hello");
    repo.failing_ref_reads = 1;
    BOOST_CHECK_THROW(store.get_value("refs/ac2git/x"), transient_error);
    BOOST_CHECK_EQUAL(*store.get_value("refs/ac2git/x"), "hello");
}

BOOST_AUTO_TEST_CASE(high_water_mark_format)
{
    std::string const key = state_key::high_water_mark(1, 2);
    store.set_high_water_mark(key, 5);
    BOOST_CHECK(store.get_value(key)->find("\"high-water-mark\":\"5\"") != std::string::npos);
    BOOST_CHECK_EQUAL(*store.high_water_mark(key), 5);

    // A plain JSON number reads the same.
    store.put_value(key, "{\"high-water-mark\": 7}");
    BOOST_CHECK_EQUAL(*store.high_water_mark(key), 7);
}

BOOST_AUTO_TEST_CASE(append_builds_a_linear_history)
{
    std::string key = state_key::content(1, 1);
    std::string first = store.append(key, 1, tree("a"), 100);
    std::string second = store.append(key, 4, tree("b"), 200);

    BOOST_CHECK_EQUAL(*store.tip(key), second);
    commit_record c = repo.read_commit(second);
    BOOST_REQUIRE_EQUAL(c.parents.size(), 1u);
    BOOST_CHECK_EQUAL(c.parents[0], first);
    BOOST_CHECK_EQUAL(c.message, "transaction 4");
    BOOST_CHECK_EQUAL(c.committer.when, 200);

    std::vector<state_store::entry> const& e = store.entries(key);
    BOOST_REQUIRE_EQUAL(e.size(), 2u);
    BOOST_CHECK_EQUAL(e[0].transaction, 1);
    BOOST_CHECK_EQUAL(e[1].transaction, 4);
    BOOST_CHECK_EQUAL(e[1].tree, tree("b"));

    BOOST_CHECK(!store.entry_at(key, 0));
    BOOST_CHECK_EQUAL(store.entry_at(key, 3)->transaction, 1);
    BOOST_CHECK_EQUAL(store.entry_at(key, 4)->transaction, 4);
    BOOST_CHECK_EQUAL(store.entry_at(key, 99)->transaction, 4);
}

BOOST_AUTO_TEST_CASE(append_is_deterministic)
{
    std::string a = store.append("refs/ac2git/1/streams/stream_1_info", 3, tree("x"), 300);
    std::string b = store.append("refs/ac2git/1/streams/stream_2_info", 3, tree("x"), 300);
    BOOST_CHECK_EQUAL(a, b);
}

BOOST_AUTO_TEST_CASE(append_requires_increasing_transactions)
{
    std::string key = state_key::metadata(1, 1);
    store.append(key, 5, tree("a"), 100);
    BOOST_CHECK_THROW(store.append(key, 5, tree("b"), 100), invariant_violation);
    BOOST_CHECK_THROW(store.append(key, 2, tree("b"), 100), invariant_violation);
}

BOOST_AUTO_TEST_CASE(entries_are_reread_from_the_refs)
{
    std::string key = state_key::metadata(1, 1);
    store.append(key, 1, tree("a"), 100);
    store.append(key, 2, tree("b"), 100);

    state_store other(repo);
    BOOST_CHECK_EQUAL(other.entries(key).size(), 2u);

    // Another writer moves the ref back.
    std::string first = store.entries(key)[0].commit;
    repo.update_ref(key, first, *store.tip(key));
    BOOST_CHECK_EQUAL(store.entries(key).size(), 1u);
    BOOST_CHECK_EQUAL(store.last_entry(key)->transaction, 1);
}

BOOST_AUTO_TEST_CASE(foreign_commit_is_an_invariant_violation)
{
    std::string key = state_key::metadata(1, 1);
    commit_spec spec;
    spec.tree = empty_tree_sha;
    spec.message = "not a transaction";
    repo.update_ref(key, repo.commit(spec), null_sha);
    BOOST_CHECK_THROW(store.entries(key), invariant_violation);
}

BOOST_AUTO_TEST_CASE(stale_tip_loses_the_update)
{
    std::string key = state_key::metadata(1, 1);
    store.append(key, 1, tree("a"), 100);

    state_store other(repo);
    other.append(key, 2, tree("b"), 100);

    // store still believes in the first tip
    BOOST_CHECK_THROW(repo.update_ref(key, *store.tip(key), store.entries(key)[0].commit), fatal_error);
}

BOOST_AUTO_TEST_CASE(numbers)
{
    std::string hwm = state_key::high_water_mark(1, 1);
    BOOST_CHECK(!store.high_water_mark(hwm));
    store.set_high_water_mark(hwm, 42);
    BOOST_CHECK_EQUAL(*store.high_water_mark(hwm), 42);
    BOOST_CHECK(repo.read_blob(*repo.resolve(hwm)).find("high-water-mark") != std::string::npos);

    BOOST_CHECK(!store.processing_state());
    store.set_processing_state(7);
    BOOST_CHECK_EQUAL(*store.processing_state(), 7);

    store.put_value(hwm, "garbage");
    BOOST_CHECK_THROW(store.high_water_mark(hwm), invariant_violation);
}

BOOST_AUTO_TEST_CASE(reset_deletes_the_key)
{
    std::string key = state_key::content(1, 1);
    store.append(key, 1, tree("a"), 100);
    store.reset(key);
    BOOST_CHECK(!repo.resolve(key));
    BOOST_CHECK(store.entries(key).empty());
    store.append(key, 1, tree("a"), 100);
    BOOST_CHECK_EQUAL(store.entries(key).size(), 1u);
}

BOOST_AUTO_TEST_CASE(transaction_messages)
{
    BOOST_CHECK_EQUAL(*transaction_of_message("transaction 42"), 42);
    BOOST_CHECK_EQUAL(*transaction_of_message("transaction 42\n"), 42);
    BOOST_CHECK(!transaction_of_message("transaction x"));
    BOOST_CHECK(!transaction_of_message("Merged C into P"));
}

BOOST_AUTO_TEST_SUITE_END()
