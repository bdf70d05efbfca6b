// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "accurev_xml.hpp"
#include "errors.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <sstream>

namespace accu2git {

namespace pt = boost::property_tree;

namespace
{
  pt::ptree read(std::string const& xml)
  {
      std::istringstream in(xml);
      pt::ptree doc;
      try
      {
          pt::read_xml(in, doc, pt::xml_parser::trim_whitespace);
      }
      catch (pt::xml_parser_error const& e)
      {
          throw unrecognized_input(std::string("malformed XML: ") + e.what());
      }
      return doc;
  }

  // The element below the document, whatever its name
  pt::ptree const& root(pt::ptree const& doc)
  {
      for (auto const& child : doc)
      {
          if (child.first != "<xmlcomment>")
              return child.second;
      }
      throw unrecognized_input("XML response has no root element");
  }

  std::string attr(pt::ptree const& node, std::string const& name)
  {
      return node.get<std::string>("<xmlattr>." + name, "");
  }

  template <class Number>
  boost::optional<Number> number_attr(pt::ptree const& node, std::string const& name)
  {
      std::string text = attr(node, name);
      if (text.empty())
          return boost::none;
      try
      {
          return boost::lexical_cast<Number>(text);
      }
      catch (boost::bad_lexical_cast const&)
      {
          throw unrecognized_input("attribute " + name + "=\"" + text + "\" is not a number");
      }
  }

  int required_int(pt::ptree const& node, std::string const& element, std::string const& name)
  {
      auto value = number_attr<int>(node, name);
      if (!value)
          throw unrecognized_input("<" + element + "> without a " + name + " attribute");
      return *value;
  }

  // "3/1" -> 3
  boost::optional<int> stream_of_version(pt::ptree const& version, std::string const& name)
  {
      std::string text = attr(version, name);
      std::string::size_type slash = text.find('/');
      if (text.empty() || slash == 0)
          return boost::none;
      try
      {
          return boost::lexical_cast<int>(text.substr(0, slash));
      }
      catch (boost::bad_lexical_cast const&)
      {
          throw unrecognized_input("bad version id " + name + "=\"" + text + "\"");
      }
  }

  boost::optional<std::time_t> time_lock(pt::ptree const& node, std::string const& name)
  {
      auto t = number_attr<long long>(node, name);
      if (!t || *t == 0)
          return boost::none;
      return static_cast<std::time_t>(*t);
  }

  stream_info read_stream(pt::ptree const& node)
  {
      stream_info s;
      s.number = required_int(node, "stream", "streamNumber");
      s.name = attr(node, "name");
      s.depot = attr(node, "depotName");
      s.type = attr(node, "type");
      s.basis = attr(node, "basis");
      s.basis_number = number_attr<int>(node, "basisStreamNumber");
      s.prev_name = attr(node, "prevName");
      s.prev_basis = attr(node, "prevBasis");
      s.prev_basis_number = number_attr<int>(node, "prevBasisStreamNumber");
      s.time_lock = time_lock(node, "time");
      s.prev_time_lock = time_lock(node, "prevTime");
      return s;
  }
}

std::vector<transaction> parse_history(std::string const& xml)
{
    pt::ptree doc = read(xml);
    std::vector<transaction> result;

    for (auto const& child : root(doc))
    {
        if (child.first != "transaction")
            continue;
        pt::ptree const& node = child.second;

        transaction tr;
        tr.id = required_int(node, "transaction", "id");
        tr.kind_name = attr(node, "type");
        tr.user = attr(node, "user");
        tr.time = static_cast<std::time_t>(number_attr<long long>(node, "time").get_value_or(0));
        tr.comment = node.get<std::string>("comment", "");

        tr.stream_name = attr(node, "streamName");
        tr.stream_number = number_attr<int>(node, "streamNumber");
        tr.from_stream_name = attr(node, "fromStreamName");
        tr.from_stream_number = number_attr<int>(node, "fromStreamNumber");

        for (auto const& sub : node)
        {
            if (sub.first == "version")
            {
                // Old servers only name the streams through the
                // element versions.
                if (!tr.stream_number)
                    tr.stream_number = stream_of_version(sub.second, "virtual");
                if (!tr.from_stream_number && tr.kind_name == "promote")
                    tr.from_stream_number = stream_of_version(sub.second, "real");
            }
            else if (sub.first == "stream")
            {
                tr.stream = read_stream(sub.second);
                if (!tr.stream_number)
                    tr.stream_number = tr.stream->number;
                if (tr.stream_name.empty())
                    tr.stream_name = tr.stream->name;
            }
        }
        result.push_back(tr);
    }

    std::sort(
        result.begin(), result.end(),
        [](transaction const& a, transaction const& b) { return a.id < b.id; });
    return result;
}

stream_listing parse_streams(std::string const& xml)
{
    pt::ptree doc = read(xml);
    stream_listing result;
    for (auto const& child : root(doc))
    {
        if (child.first == "stream")
            result.streams.push_back(read_stream(child.second));
    }
    return result;
}

std::string normalize_depot_path(std::string const& path)
{
    std::string p = boost::algorithm::replace_all_copy(path, "\\", "/");
    for (;;)
    {
        if (p.compare(0, 1, "/") == 0)
            p.erase(0, 1);
        else if (p.compare(0, 2, "./") == 0)
            p.erase(0, 2);
        else
            break;
    }
    return p == "." ? std::string() : p;
}

std::vector<std::string> parse_diff(std::string const& xml)
{
    pt::ptree doc = read(xml);
    boost::container::flat_set<std::string> paths;
    for (auto const& element : root(doc))
    {
        if (element.first != "Element")
            continue;
        for (auto const& change : element.second)
        {
            if (change.first != "Change")
                continue;
            for (auto const& side : change.second)
            {
                if (side.first != "Stream1" && side.first != "Stream2")
                    continue;
                std::string p = normalize_depot_path(attr(side.second, "Name"));
                if (!p.empty())
                    paths.insert(p);
            }
        }
    }
    return std::vector<std::string>(paths.begin(), paths.end());
}

std::vector<depot_info> parse_depots(std::string const& xml)
{
    pt::ptree doc = read(xml);
    std::vector<depot_info> result;
    for (auto const& child : root(doc))
    {
        if (child.first != "Depot")
            continue;
        depot_info d;
        d.number = required_int(child.second, "Depot", "Number");
        d.name = attr(child.second, "Name");
        result.push_back(d);
    }
    return result;
}

std::vector<std::string> parse_users(std::string const& xml)
{
    pt::ptree doc = read(xml);
    std::vector<std::string> result;
    for (auto const& child : root(doc))
    {
        if (child.first == "Element")
            result.push_back(attr(child.second, "Name"));
    }
    return result;
}

std::string normalize_task_ids(std::string const& xml)
{
    static boost::regex const task_id("TaskId=\"[0-9]+\"");
    return boost::regex_replace(xml, task_id, "TaskId=\"0\"");
}

} // namespace accu2git
