// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "fixture.hpp"

#include "errors.hpp"
#include "retrieval.hpp"
#include "working_tree.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>

using namespace accu2git;
namespace fs = boost::filesystem;

namespace {

// Root <- Dev, with changes in both and in an unrelated stream.
void script(scripted_depot& depot)
{
    depot.mkstream("Dev", "Root");             // 2
    depot.add("Dev", "a.txt", "one");          // 3
    depot.add("Root", "lib/b.txt", "two");     // 4
    depot.mkstream("Other", "Root");           // 5
    depot.add("Other", "c.txt", "three");      // 6
    depot.keep("Dev", "a.txt", "one, again");  // 7
    depot.defunct("Dev", "a.txt");             // 8
    depot.promote("Dev", "Root");              // 9
}

struct retrieval_fixture : conversion_fixture
{
    retrieval_fixture() { script(depot); }

    retrieval_result retrieve(std::string const& stream, int start, int end)
    {
        stream_retriever r(*ctx);
        return r.retrieve(*source->stream(stream, depot.highest()), start, end);
    }

    std::vector<int> transactions(std::string const& key)
    {
        std::vector<int> result;
        for (auto const& e : store->entries(key))
            result.push_back(e.transaction);
        return result;
    }

    std::string metadata(int stream) { return state_key::metadata(1, stream); }
    std::string content(int stream) { return state_key::content(1, stream); }
    std::string hwm(int stream) { return state_key::high_water_mark(1, stream); }
};

}

BOOST_FIXTURE_TEST_SUITE(retrieval, retrieval_fixture)

BOOST_AUTO_TEST_CASE(deep_history_follows_the_basis_chain)
{
    retrieval_result r = retrieve("Dev", 1, 9);
    BOOST_CHECK_EQUAL(r.last_transaction, 9);
    BOOST_REQUIRE(r.content_commit);

    std::vector<int> expected;
    for (int tr : { 2, 3, 4, 7, 8 })
        expected.push_back(tr);
    std::vector<int> meta = transactions(metadata(2));
    BOOST_CHECK_EQUAL_COLLECTIONS(meta.begin(), meta.end(), expected.begin(), expected.end());
    std::vector<int> data = transactions(content(2));
    BOOST_CHECK_EQUAL_COLLECTIONS(data.begin(), data.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(*store->high_water_mark(hwm(2)), 9);

    std::vector<state_store::entry> const& e = store->entries(content(2));
    BOOST_CHECK(repo.files(e[0].tree).empty());
    BOOST_CHECK_EQUAL(repo.files(e[1].tree).at("a.txt"), "one");
    BOOST_CHECK_EQUAL(repo.files(e[2].tree).at("lib/b.txt"), "two");
    BOOST_CHECK_EQUAL(repo.files(e[3].tree).at("a.txt"), "one, again");
    BOOST_CHECK_EQUAL(repo.files(e[4].tree).count("a.txt"), 0u);
    BOOST_CHECK_EQUAL(*r.content_commit, e[4].commit);
}

BOOST_AUTO_TEST_CASE(metadata_records_the_transaction)
{
    retrieve("Dev", 1, 9);
    std::vector<state_store::entry> const& e = store->entries(metadata(2));

    BOOST_CHECK(repo.read_file(e[0].tree, "hist.xml"));
    BOOST_CHECK(repo.read_file(e[0].tree, "streams.xml"));
    BOOST_CHECK(!repo.read_file(e[0].tree, "diff.xml"));

    std::string hist = *repo.read_file(e[1].tree, "hist.xml");
    BOOST_CHECK(hist.find("id=\"3\"") != std::string::npos);
    BOOST_CHECK(hist.find("TaskId=\"0\"") != std::string::npos);
    BOOST_CHECK(repo.read_file(e[1].tree, "diff.xml")->find("a.txt") != std::string::npos);

    commit_record c = repo.read_commit(e[1].commit);
    BOOST_CHECK_EQUAL(c.message, "transaction 3");
    BOOST_CHECK_EQUAL(c.author.when, depot.time_of(3));
}

BOOST_AUTO_TEST_CASE(pop_records_every_transaction)
{
    opts.method = retrieval_method::pop;
    retrieve("Dev", 1, 9);

    std::vector<int> meta = transactions(metadata(2));
    BOOST_REQUIRE_EQUAL(meta.size(), 8u);
    BOOST_CHECK_EQUAL(meta.front(), 2);
    BOOST_CHECK_EQUAL(meta.back(), 9);
    BOOST_CHECK(!repo.read_file(store->entries(metadata(2))[3].tree, "diff.xml"));
}

BOOST_AUTO_TEST_CASE(policies_agree_on_content)
{
    retrieve("Dev", 1, 9);
    std::string deep = store->last_entry(content(2))->tree;

    retrieval_fixture by_diff;
    by_diff.opts.method = retrieval_method::diff;
    by_diff.retrieve("Dev", 1, 9);
    std::vector<int> meta = by_diff.transactions(by_diff.metadata(2));
    BOOST_CHECK_EQUAL(meta.size(), 5u);
    BOOST_CHECK_EQUAL(by_diff.store->last_entry(by_diff.content(2))->tree, deep);

    retrieval_fixture by_pop;
    by_pop.opts.method = retrieval_method::pop;
    by_pop.retrieve("Dev", 1, 9);
    BOOST_CHECK_EQUAL(by_pop.store->last_entry(by_pop.content(2))->tree, deep);
}

BOOST_AUTO_TEST_CASE(skip_retrieves_nothing)
{
    opts.method = retrieval_method::skip;
    BOOST_CHECK_THROW(retrieve("Root", 1, 9), fatal_error);
}

BOOST_AUTO_TEST_CASE(split_runs_match_one_run)
{
    for (retrieval_method method : { retrieval_method::deep_hist, retrieval_method::diff, retrieval_method::pop })
    {
        retrieval_fixture whole;
        whole.opts.method = method;
        whole.retrieve("Dev", 1, 9);

        for (int k = 2; k < 9; ++k)
        {
            retrieval_fixture split;
            split.opts.method = method;
            split.retrieve("Dev", 1, k);
            split.reopen();
            split.retrieve("Dev", 1, 9);

            BOOST_CHECK_EQUAL(*split.repo.resolve(split.metadata(2)), *whole.repo.resolve(whole.metadata(2)));
            BOOST_CHECK_EQUAL(*split.repo.resolve(split.content(2)), *whole.repo.resolve(whole.content(2)));
        }
    }
}

BOOST_AUTO_TEST_CASE(renamed_stream)
{
    for (retrieval_method method : { retrieval_method::deep_hist, retrieval_method::diff, retrieval_method::pop })
    {
        retrieval_fixture f;
        f.opts.method = method;
        f.depot.chstream("Dev", "", "Dev Two");    // 10
        f.depot.add("Dev Two", "d.txt", "four");   // 11

        f.retrieve("Dev Two", 1, 9);
        f.reopen();
        retrieval_result r = f.retrieve("Dev Two", 1, 11);
        BOOST_CHECK_EQUAL(r.last_transaction, 11);
        BOOST_CHECK_EQUAL(*f.store->high_water_mark(f.hwm(2)), 11);

        boost::optional<state_store::entry> last = f.store->last_entry(f.content(2));
        BOOST_REQUIRE(last);
        BOOST_CHECK_EQUAL(last->transaction, 11);
        std::map<std::string, std::string> files = f.repo.files(last->tree);
        BOOST_CHECK_EQUAL(files.at("d.txt"), "four");
        BOOST_CHECK_EQUAL(files.at("lib/b.txt"), "two");
        BOOST_CHECK_EQUAL(files.count("a.txt"), 0u);
    }
}

BOOST_AUTO_TEST_CASE(crash_before_the_high_water_mark)
{
    retrieve("Dev", 1, 9);
    std::string meta = *repo.resolve(metadata(2));
    std::string data = *repo.resolve(content(2));

    store->reset(hwm(2));
    reopen();
    retrieve("Dev", 1, 9);

    BOOST_CHECK_EQUAL(*repo.resolve(metadata(2)), meta);
    BOOST_CHECK_EQUAL(*repo.resolve(content(2)), data);
    BOOST_CHECK_EQUAL(store->entries(content(2)).size(), 5u);
    BOOST_CHECK_EQUAL(*store->high_water_mark(hwm(2)), 9);
}

BOOST_AUTO_TEST_CASE(crash_between_metadata_and_content)
{
    retrieve("Dev", 1, 9);
    std::string data = *repo.resolve(content(2));

    // Lose the last content entry and the high-water mark.
    std::string parent = repo.read_commit(data).parents.at(0);
    repo.update_ref(content(2), parent, data);
    store->reset(hwm(2));

    reopen();
    retrieve("Dev", 1, 9);
    BOOST_CHECK_EQUAL(*repo.resolve(content(2)), data);
    BOOST_CHECK_EQUAL(store->entries(content(2)).size(), store->entries(metadata(2)).size());
}

BOOST_AUTO_TEST_CASE(resume_continues_after_the_split)
{
    retrieve("Dev", 1, 5);
    BOOST_CHECK_EQUAL(*store->high_water_mark(hwm(2)), 5);
    BOOST_CHECK_EQUAL(store->last_entry(metadata(2))->transaction, 4);

    reopen();
    retrieve("Dev", 1, 9);
    std::vector<int> meta = transactions(metadata(2));
    BOOST_REQUIRE_EQUAL(meta.size(), 5u);
    BOOST_CHECK_EQUAL(meta[3], 7);
}

BOOST_AUTO_TEST_CASE(content_ahead_of_metadata)
{
    retrieve("Dev", 1, 9);
    std::string meta = *repo.resolve(metadata(2));
    repo.update_ref(metadata(2), repo.read_commit(meta).parents.at(0), meta);

    reopen();
    BOOST_CHECK_THROW(retrieve("Dev", 1, 9), invariant_violation);
}

BOOST_AUTO_TEST_CASE(stream_created_after_the_end)
{
    retrieval_result r = retrieve("Other", 1, 4);
    BOOST_CHECK_EQUAL(r.last_transaction, 4);
    BOOST_CHECK(!r.content_commit);
    BOOST_CHECK(store->entries(metadata(3)).empty());
    BOOST_CHECK_EQUAL(*store->high_water_mark(hwm(3)), 4);
}

BOOST_AUTO_TEST_CASE(start_transaction_raises_the_first_entry)
{
    retrieve("Root", 3, 9);
    std::vector<int> meta = transactions(metadata(1));
    // The promotion at 9 carries only a defunct file Root never had.
    BOOST_REQUIRE_EQUAL(meta.size(), 2u);
    BOOST_CHECK_EQUAL(meta[0], 3);
    BOOST_CHECK_EQUAL(meta[1], 4);
    BOOST_CHECK_EQUAL(repo.files(store->last_entry(content(1))->tree).size(), 1u);
}

BOOST_AUTO_TEST_CASE(transient_failures_are_retried)
{
    depot.failing_queries = 2;
    retrieve("Dev", 1, 9);
    BOOST_CHECK_EQUAL(store->entries(content(2)).size(), 5u);
}

BOOST_AUTO_TEST_CASE(exhausted_retries_are_fatal)
{
    depot.failing_queries = 3;
    BOOST_CHECK_THROW(retrieve("Dev", 1, 9), fatal_error);
}

BOOST_AUTO_TEST_CASE(empty_directories)
{
    fs::path root = repo.work_tree();
    fs::create_directories(root / "empty");
    fs::create_directories(root / "full");
    fs::ofstream(root / "full" / "f.txt") << "x";

    working_tree::preserve_empty_directories(root);
    BOOST_CHECK(fs::exists(root / "empty" / ".gitignore"));
    BOOST_CHECK(!fs::exists(root / "full" / ".gitignore"));
    BOOST_CHECK(fs::exists(root / ".git"));

    working_tree::prune_empty_directories(root);
    BOOST_CHECK(!fs::exists(root / "empty"));
    BOOST_CHECK(fs::exists(root / "full" / "f.txt"));

    std::vector<std::string> paths(1, "full/f.txt");
    working_tree::remove_paths(root, paths);
    BOOST_CHECK(!fs::exists(root / "full" / "f.txt"));

    working_tree::clear(root);
    BOOST_CHECK(!fs::exists(root / "full"));
    BOOST_CHECK(fs::exists(root / ".git"));
}

BOOST_AUTO_TEST_SUITE_END()
