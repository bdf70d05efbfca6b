// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "commit_message.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace accu2git {

namespace
{
  typedef std::vector<std::pair<std::string, std::string> > footer_lines;

  std::string utc(std::time_t t)
  {
      std::string s = boost::posix_time::to_iso_extended_string(boost::posix_time::from_time_t(t));
      return boost::algorithm::replace_first_copy(s, "T", " ") + " (UTC)";
  }

  std::string number(boost::optional<int> const& n)
  {
      std::ostringstream out;
      if (n)
          out << *n;
      else
          out << '-';
      return out.str();
  }

  void describe(footer_lines& lines, std::string const& prefix, stream_info const* s)
  {
      if (!s)
          return;

      std::ostringstream head;
      head << s->name << " (id: " << s->number << "; type: " << s->type << ")";
      lines.emplace_back(prefix + ":", head.str());

      if (!s->prev_name.empty())
          lines.emplace_back(prefix + "-prev-name:", s->prev_name);
      if (!s->basis.empty())
          lines.emplace_back(prefix + "-basis:", s->basis + " (id: " + number(s->basis_number) + ")");
      if (!s->prev_basis.empty())
          lines.emplace_back(prefix + "-prev-basis:", s->prev_basis + " (id: " + number(s->prev_basis_number) + ")");
      if (s->time_lock)
          lines.emplace_back(prefix + "-timelock:", utc(*s->time_lock));
      if (s->prev_time_lock)
          lines.emplace_back(prefix + "-prev-timelock:", utc(*s->prev_time_lock));
  }
}

std::string transaction_footer(
    transaction const& tr, stream_info const* stream, stream_info const* dst, stream_info const* src)
{
    footer_lines lines;
    std::ostringstream head;
    head << tr.id << " (type: " << tr.kind_name << ")";
    lines.emplace_back("Accurev-transaction:", head.str());

    describe(lines, "Accurev-stream", stream);
    describe(lines, "Accurev-dst-stream", dst);
    describe(lines, "Accurev-src-stream", src);

    std::size_t width = 0;
    for (auto const& l : lines)
        width = std::max(width, l.first.size());

    std::ostringstream out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i)
            out << '\n';
        out << std::left << std::setw(static_cast<int>(width)) << lines[i].first << ' ' << lines[i].second;
    }
    return out.str();
}

commit_message make_commit_message(
    message_style style,
    transaction const& tr,
    stream_info const* stream,
    stream_info const* dst,
    stream_info const* src,
    std::string const& title,
    std::string const& friendly)
{
    commit_message result;
    if (style == message_style::clean)
    {
        result.text = tr.comment;
        return result;
    }

    std::vector<std::string> sections;
    if (!title.empty())
        sections.push_back(title);
    if (!tr.comment.empty())
        sections.push_back(tr.comment);
    if (!friendly.empty())
        sections.push_back(friendly);

    std::string footer = transaction_footer(tr, stream, dst, src);
    if (style == message_style::notes)
        result.note = footer;
    else
        sections.push_back(footer);

    for (std::size_t i = 0; i < sections.size(); ++i)
    {
        if (i)
            result.text += "\n\n";
        result.text += sections[i];
    }
    return result;
}

std::string sanitize_branch_name(std::string const& name)
{
    return boost::algorithm::replace_all_copy(boost::algorithm::trim_copy(name), " ", "_");
}

} // namespace accu2git
