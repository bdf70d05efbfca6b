// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "annotation.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>

namespace accu2git {

namespace pt = boost::property_tree;

std::string to_json(annotation const& a)
{
    pt::ptree doc;
    doc.put("depot", a.depot);
    doc.put("stream", a.stream);
    doc.put("stream_number", a.stream_number);
    doc.put("transaction_number", a.transaction);
    doc.put("transaction_kind", a.kind);
    if (a.dst_stream)
        doc.put("dst_stream", *a.dst_stream);
    if (a.dst_stream_number)
        doc.put("dst_stream_number", *a.dst_stream_number);
    if (a.src_stream)
        doc.put("src_stream", *a.src_stream);
    if (a.src_stream_number)
        doc.put("src_stream_number", *a.src_stream_number);

    std::ostringstream out;
    pt::write_json(out, doc, false);
    return out.str();
}

boost::optional<annotation> parse_annotation(std::string const& text)
{
    pt::ptree doc;
    std::istringstream in(text);
    annotation a;
    try
    {
        pt::read_json(in, doc);
        a.depot = doc.get<std::string>("depot");
        a.stream = doc.get<std::string>("stream");
        a.stream_number = doc.get<int>("stream_number");
        a.transaction = doc.get<int>("transaction_number");
        a.kind = doc.get<std::string>("transaction_kind");
        a.dst_stream = doc.get_optional<std::string>("dst_stream");
        a.dst_stream_number = doc.get_optional<int>("dst_stream_number");
        a.src_stream = doc.get_optional<std::string>("src_stream");
        a.src_stream_number = doc.get_optional<int>("src_stream_number");
    }
    catch (pt::ptree_error const&)
    {
        return boost::none;
    }
    return a;
}

} // namespace accu2git
