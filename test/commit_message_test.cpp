// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "commit_message.hpp"

#include <boost/test/unit_test.hpp>

using namespace accu2git;

namespace {

transaction promote_tr()
{
    transaction t;
    t.id = 42;
    t.kind_name = "promote";
    t.user = "alice";
    t.comment = "Fix the frobnicator";
    t.time = 1372700000;
    return t;
}

stream_info stream(int number, std::string const& name, std::string const& basis = "", int basis_number = 0)
{
    stream_info s;
    s.number = number;
    s.name = name;
    s.type = "normal";
    if (!basis.empty())
    {
        s.basis = basis;
        s.basis_number = basis_number;
    }
    return s;
}

}

BOOST_AUTO_TEST_SUITE(commit_messages)

BOOST_AUTO_TEST_CASE(footer_columns_line_up)
{
    stream_info dev = stream(2, "Dev", "Root", 1);
    std::string footer = transaction_footer(promote_tr(), &dev);

    BOOST_CHECK_EQUAL(
        footer,
        "Accurev-transaction:  42 (type: promote)\n"
        "Accurev-stream:       Dev (id: 2; type: normal)\n"
        "Accurev-stream-basis: Root (id: 1)");
}

BOOST_AUTO_TEST_CASE(footer_describes_both_sides_of_a_promote)
{
    stream_info root = stream(1, "Root");
    stream_info dev = stream(2, "Dev", "Root", 1);
    dev.time_lock = 1372700000;
    std::string footer = transaction_footer(promote_tr(), nullptr, &root, &dev);

    BOOST_CHECK(footer.find("Accurev-dst-stream:") == footer.find('\n') + 1);
    BOOST_CHECK(footer.find("Root (id: 1; type: normal)") != std::string::npos);
    BOOST_CHECK(footer.find("Accurev-src-stream-timelock: 2013-07-01 17:33:20 (UTC)") != std::string::npos);
    BOOST_CHECK(footer.find("Accurev-stream:") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(renamed_stream)
{
    stream_info s = stream(3, "New Name", "Root", 1);
    s.prev_name = "Old Name";
    s.prev_basis = "Dev";
    s.prev_basis_number = 2;
    std::string footer = transaction_footer(promote_tr(), &s);

    BOOST_CHECK(footer.find("Accurev-stream-prev-name:  Old Name") != std::string::npos);
    BOOST_CHECK(footer.find("Accurev-stream-prev-basis: Dev (id: 2)") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(normal_style)
{
    stream_info dev = stream(2, "Dev");
    commit_message m = make_commit_message(message_style::normal, promote_tr(), &dev);

    BOOST_CHECK_EQUAL(m.text.substr(0, 21), "Fix the frobnicator\n\n");
    BOOST_CHECK(m.text.find("Accurev-transaction:") != std::string::npos);
    BOOST_CHECK(m.note.empty());
}

BOOST_AUTO_TEST_CASE(title_and_friendly_text_surround_the_comment)
{
    commit_message m = make_commit_message(
        message_style::normal, promote_tr(), nullptr, nullptr, nullptr, "Merged Dev into Root", "(cherry-pick)");

    BOOST_CHECK_EQUAL(
        m.text.substr(0, m.text.find("Accurev-")),
        "Merged Dev into Root\n\nFix the frobnicator\n\n(cherry-pick)\n\n");
}

BOOST_AUTO_TEST_CASE(notes_style)
{
    stream_info dev = stream(2, "Dev");
    commit_message m = make_commit_message(message_style::notes, promote_tr(), &dev);

    BOOST_CHECK_EQUAL(m.text, "Fix the frobnicator");
    BOOST_CHECK_EQUAL(m.note, transaction_footer(promote_tr(), &dev));
}

BOOST_AUTO_TEST_CASE(clean_style)
{
    commit_message m = make_commit_message(message_style::clean, promote_tr(), nullptr, nullptr, nullptr, "ignored");
    BOOST_CHECK_EQUAL(m.text, "Fix the frobnicator");
    BOOST_CHECK(m.note.empty());

    transaction silent = promote_tr();
    silent.comment.clear();
    BOOST_CHECK(make_commit_message(message_style::clean, silent, nullptr).text.empty());
}

BOOST_AUTO_TEST_CASE(branch_names)
{
    BOOST_CHECK_EQUAL(sanitize_branch_name("My Stream"), "My_Stream");
    BOOST_CHECK_EQUAL(sanitize_branch_name("  padded  "), "padded");
    BOOST_CHECK_EQUAL(sanitize_branch_name("a b c"), "a_b_c");
    BOOST_CHECK_EQUAL(sanitize_branch_name("plain"), "plain");
}

BOOST_AUTO_TEST_SUITE_END()
