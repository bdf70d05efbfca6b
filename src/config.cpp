// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "config.hpp"
#include "errors.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/spirit/include/qi.hpp>
#include <fstream>

namespace qi = boost::spirit::qi;
namespace pt = boost::property_tree;

namespace accu2git {

char const* const default_config_file = "accu2git.config.xml";

namespace
{
  std::string attr(pt::ptree const& node, char const* name, std::string const& fallback)
  {
      return node.get<std::string>(std::string("<xmlattr>.") + name, fallback);
  }

  template <class Enum>
  struct enum_name
  {
      Enum value;
      char const* name;
  };

  enum_name<retrieval_method> const retrieval_methods[] = {
      { retrieval_method::pop, "pop" },
      { retrieval_method::diff, "diff" },
      { retrieval_method::deep_hist, "deep-hist" },
      { retrieval_method::skip, "skip" } };

  enum_name<merge_strategy> const merge_strategies[] = {
      { merge_strategy::normal, "normal" },
      { merge_strategy::orphanage, "orphanage" },
      { merge_strategy::skip, "skip" } };

  enum_name<message_style> const message_styles[] = {
      { message_style::normal, "normal" },
      { message_style::clean, "clean" },
      { message_style::notes, "notes" } };

  template <class Enum, std::size_t N>
  Enum parse_enum(enum_name<Enum> const (&names)[N], std::string const& what, std::string const& text)
  {
      for (auto const& n : names)
      {
          if (text == n.name)
              return n.value;
      }
      throw unrecognized_input("unknown " + what + " '" + text + "'");
  }

  template <class Enum, std::size_t N>
  char const* enum_to_string(enum_name<Enum> const (&names)[N], Enum value)
  {
      for (auto const& n : names)
      {
          if (n.value == value)
              return n.name;
      }
      return "?";
  }

  std::string transaction_attr(pt::ptree const& node, char const* name, std::string const& fallback)
  {
      std::string text = attr(node, name, fallback);
      if (!is_transaction_spec(text))
          throw unrecognized_input(std::string(name) + " '" + text + "' is not a transaction");
      return text;
  }
}

retrieval_method parse_retrieval_method(std::string const& text)
{
    return parse_enum(retrieval_methods, "method", text);
}

merge_strategy parse_merge_strategy(std::string const& text)
{
    return parse_enum(merge_strategies, "merge strategy", text);
}

message_style parse_message_style(std::string const& text)
{
    return parse_enum(message_styles, "message style", text);
}

char const* to_string(retrieval_method x) { return enum_to_string(retrieval_methods, x); }
char const* to_string(merge_strategy x) { return enum_to_string(merge_strategies, x); }
char const* to_string(message_style x) { return enum_to_string(message_styles, x); }

void check_options(Options const& opts)
{
    if (opts.finalize && opts.track)
        throw unrecognized_input("finalizing cannot be combined with tracking");
}

bool is_transaction_spec(std::string const& text)
{
    std::string::const_iterator first = text.begin();
    bool ok = qi::parse(
        first, text.end(),
        qi::lit("now") | qi::lit("highest") | qi::uint_);
    return ok && first == text.end();
}

void read_config(std::string const& filename, Options& opts)
{
    std::ifstream in(filename.c_str());
    if (!in)
        throw fatal_error("cannot open configuration file " + filename);
    read_config(in, filename, opts);
}

void read_config(std::istream& in, std::string const& source_name, Options& opts)
{
    pt::ptree doc;
    try
    {
        pt::read_xml(in, doc, pt::xml_parser::trim_whitespace);
    }
    catch (pt::xml_parser_error const& e)
    {
        throw unrecognized_input("cannot parse " + source_name + ": " + e.what());
    }

    boost::optional<pt::ptree&> root = doc.get_child_optional("accurev2git");
    if (!root)
        throw unrecognized_input(source_name + " has no <accurev2git> element");

    if (boost::optional<pt::ptree&> accurev = root->get_child_optional("accurev"))
    {
        opts.depot = attr(*accurev, "depot", opts.depot);
        opts.username = attr(*accurev, "username", opts.username);
        opts.password = attr(*accurev, "password", opts.password);
        opts.start_transaction = transaction_attr(*accurev, "start-transaction", opts.start_transaction);
        opts.end_transaction = transaction_attr(*accurev, "end-transaction", opts.end_transaction);

        if (boost::optional<pt::ptree&> list = accurev->get_child_optional("stream-list"))
        {
            for (auto const& s : *list)
            {
                if (s.first != "stream")
                    continue;
                stream_mapping m;
                m.stream = s.second.get_value<std::string>();
                m.branch = attr(s.second, "branch-name", "");
                if (m.stream.empty())
                    throw unrecognized_input(source_name + ": empty <stream> in <stream-list>");
                opts.streams.push_back(m);
            }
        }
    }

    if (boost::optional<pt::ptree&> git = root->get_child_optional("git"))
    {
        opts.repo_path = attr(*git, "repo-path", opts.repo_path);
        std::string style = attr(*git, "message-style", "");
        if (!style.empty())
            opts.style = parse_message_style(style);

        for (auto const& r : *git)
        {
            if (r.first != "remote")
                continue;
            remote_spec remote;
            remote.name = attr(r.second, "name", "");
            remote.url = attr(r.second, "url", "");
            remote.push_url = attr(r.second, "push-url", "");
            if (remote.name.empty() || remote.url.empty())
                throw unrecognized_input(source_name + ": <remote> needs a name and a url");
            opts.remotes.push_back(remote);
        }
    }

    if (boost::optional<std::string> method = root->get_optional<std::string>("method"))
        opts.method = parse_retrieval_method(*method);
    if (boost::optional<std::string> strategy = root->get_optional<std::string>("merge-strategy"))
        opts.strategy = parse_merge_strategy(*strategy);
    opts.log_file = root->get<std::string>("logfile", opts.log_file);

    if (boost::optional<pt::ptree&> usermaps = root->get_child_optional("usermaps"))
    {
        for (auto const& m : *usermaps)
        {
            if (m.first != "map-user")
                continue;
            std::string user = m.second.get<std::string>("accurev.<xmlattr>.username", "");
            if (user.empty())
                throw unrecognized_input(source_name + ": <map-user> without an accurev username");

            git_identity identity;
            identity.name = m.second.get<std::string>("git.<xmlattr>.name", user);
            identity.email = m.second.get<std::string>("git.<xmlattr>.email", "");
            identity.tz_minutes = parse_timezone(m.second.get<std::string>("git.<xmlattr>.timezone", ""));
            opts.users.add(user, identity);
        }
    }
}

void write_example_config(std::ostream& out)
{
    out <<
"<accurev2git>\n"
"    <!-- AccuRev details:\n"
"            username:          used to log into AccuRev. Optional if you log in before running.\n"
"            password:          the password for username. Prefer passing it on the command line.\n"
"            depot:             the depot holding the streams to convert.\n"
"            start-transaction: the conversion starts here. An interrupted conversion\n"
"                               continues where it stopped.\n"
"            end-transaction:   stop at this transaction; \"now\" means the latest one.\n"
"    -->\n"
"    <accurev\n"
"        username=\"joe_bloggs\"\n"
"        password=\"joanna\"\n"
"        depot=\"Trunk\"\n"
"        start-transaction=\"1\"\n"
"        end-transaction=\"now\" >\n"
"        <!-- The stream-list is optional. Without it every stream is converted. -->\n"
"        <!-- branch-name is optional too; by default the stream name is used. -->\n"
"        <stream-list>\n"
"            <stream branch-name=\"some_branch\">some_stream</stream>\n"
"            <stream>some_other_stream</stream>\n"
"        </stream-list>\n"
"    </accurev>\n"
"    <!-- message-style is \"normal\" (AccuRev details in a footer), \"clean\" (the\n"
"         transaction comment only) or \"notes\" (the footer goes to refs/notes/accurev). -->\n"
"    <git repo-path=\"/put/the/git/repo/here\" message-style=\"normal\" >\n"
"        <!-- Optional: converted branches are pushed to every remote. push-url is optional. -->\n"
"        <remote name=\"origin\" url=\"https://example.com/converted.git\" push-url=\"https://example.com/converted.git\" />\n"
"        <remote name=\"backup\" url=\"https://example.com/backup.git\" />\n"
"    </git>\n"
"    <!-- How content is retrieved: deep-hist, diff, pop or skip.\n"
"         - deep-hist: diff only across transactions the stream or its ancestors saw. Fastest.\n"
"         - diff:      diff across every transaction, populate only what changed.\n"
"         - pop:       populate the whole stream for every transaction. Slowest, most robust.\n"
"         - skip:      query nothing; process what was already retrieved.\n"
"    -->\n"
"    <method>deep-hist</method>\n"
"    <!-- How the retrieved streams become branches: normal, orphanage or skip.\n"
"         - normal:    branches with merges reconstructed from promotions.\n"
"         - orphanage: one unconnected branch per stream.\n"
"         - skip:      retrieve only.\n"
"    -->\n"
"    <merge-strategy>normal</merge-strategy>\n"
"    <logfile>accu2git.log</logfile>\n"
"    <!-- AccuRev users and their Git identities. timezone is optional, +HHMM, default +0000. -->\n"
"    <usermaps>\n"
"        <map-user><accurev username=\"joe_bloggs\" /><git name=\"Joe Bloggs\" email=\"joe@bloggs.com\" timezone=\"+0100\" /></map-user>\n"
"        <map-user><accurev username=\"joanna_bloggs\" /><git name=\"Joanna Bloggs\" email=\"joanna@bloggs.com\" timezone=\"+0500\" /></map-user>\n"
"        <map-user><accurev username=\"joey_bloggs\" /><git name=\"Joey Bloggs\" email=\"joey@bloggs.com\" /></map-user>\n"
"    </usermaps>\n"
"</accurev2git>\n";
}

} // namespace accu2git
