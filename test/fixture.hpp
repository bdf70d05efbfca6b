// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef FIXTURE_DWA2013702_HPP
# define FIXTURE_DWA2013702_HPP

# include "memory_repository.hpp"
# include "scripted_depot.hpp"

# include "annotation.hpp"
# include "branches.hpp"
# include "context.hpp"
# include "log.hpp"
# include "options.hpp"
# include "retrieval.hpp"
# include "source_depot.hpp"
# include "state_store.hpp"
# include "transaction_processor.hpp"

# include <boost/test/unit_test.hpp>
# include <memory>
# include <sstream>

namespace accu2git {

// A scripted depot converted into an in-memory repository.  The log
// goes to strings.
struct conversion_fixture
{
    conversion_fixture()
        : log(out, err)
    {
        opts.depot = "Depot";
        opts.retry.backoff_seconds = 0;
        reopen();
    }

    // Starts over with nothing but the persisted state, the way a new
    // run of the converter does.
    void reopen()
    {
        ctx.reset();
        store.reset(new state_store(repo));
        source.reset(new source_depot(depot, opts.depot, log, opts.retry));
        ctx.reset(new context(opts, log, *source, repo, *store, 1));
    }

    std::string tip(std::string const& branch)
    {
        return repo.resolve(branch_ref(branch)).get_value_or(std::string());
    }

    commit_record tip_commit(std::string const& branch)
    {
        return repo.read_commit(tip(branch));
    }

    std::map<std::string, std::string> const& files_at(std::string const& commit)
    {
        return repo.files(repo.read_commit(commit).tree);
    }

    std::vector<std::string> parents(std::string const& branch)
    {
        return tip_commit(branch).parents;
    }

    std::vector<tracked_stream> tracked()
    {
        return select_streams(opts, source->streams_at(depot.highest()).listing);
    }

    void retrieve_all()
    {
        stream_retriever r(*ctx);
        stream_listing const& listing = source->streams_at(depot.highest()).listing;
        for (auto const& ts : tracked())
            r.retrieve(*listing.find(ts.number), 1, depot.highest());
    }

    // Retrieves everything, then processes it.  Returns the number of
    // transactions processed.
    int convert()
    {
        reopen();
        retrieve_all();
        transaction_processor p(*ctx, tracked());
        return p.run();
    }

    annotation note(std::string const& commit)
    {
        boost::optional<std::string> text = repo.read_note(annotation_notes_ref, commit);
        BOOST_REQUIRE(text);
        boost::optional<annotation> a = parse_annotation(*text);
        BOOST_REQUIRE(a);
        return *a;
    }

    bool fully_annotated(std::string const& branch)
    {
        for (auto const& c : repo.ancestry(tip(branch), false))
        {
            if (!repo.read_note(annotation_notes_ref, c))
                return false;
        }
        return true;
    }

    scripted_depot depot;
    memory_repository repo;
    std::ostringstream out;
    std::ostringstream err;
    logger log;
    Options opts;
    std::unique_ptr<state_store> store;
    std::unique_ptr<source_depot> source;
    std::unique_ptr<context> ctx;
};

} // namespace accu2git

#endif // FIXTURE_DWA2013702_HPP
