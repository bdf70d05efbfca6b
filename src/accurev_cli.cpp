// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "accurev_cli.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "process.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

namespace accu2git {

using boost::lexical_cast;

namespace
{
  // The login password never reaches the log.
  std::string printable(std::vector<std::string> args)
  {
      if (args.size() == 3 && args[0] == "login")
          args[2] = "********";
      return command_line("accurev", args);
  }
}

accurev_cli::accurev_cli(std::string const& executable, logger& log)
    : executable(executable), log(log)
{
}

std::string accurev_cli::run(
    std::vector<std::string> const& args, boost::filesystem::path const& dir)
{
    log.trace() << printable(args) << std::endl;
    command_result r = run_command(executable, args, dir);
    if (r.exit_code != 0)
    {
        throw transient_error(
            "accurev " + (args.empty() ? std::string() : args.front())
            + " exited with " + lexical_cast<std::string>(r.exit_code) + ": " + r.err);
    }
    return r.out;
}

std::string accurev_cli::history(
    std::string const& depot, std::string const& time_spec,
    std::string const& stream, std::string const& kind)
{
    std::vector<std::string> args = { "hist", "-p", depot, "-t", time_spec };
    if (!stream.empty())
    {
        args.push_back("-s");
        args.push_back(stream);
    }
    if (!kind.empty())
    {
        args.push_back("-k");
        args.push_back(kind);
    }
    args.push_back("-fexv");
    return run(args);
}

std::string accurev_cli::diff(std::string const& stream, int from, int to)
{
    return run({
        "diff", "-a", "-i", "-v", stream, "-V", stream,
        "-t", lexical_cast<std::string>(from) + "-" + lexical_cast<std::string>(to),
        "-fx" });
}

std::string accurev_cli::streams(
    std::string const& depot, std::string const& time_spec, std::string const& stream)
{
    std::vector<std::string> args = { "show", "-p", depot };
    if (!stream.empty())
    {
        args.push_back("-s");
        args.push_back(stream);
    }
    if (!time_spec.empty())
    {
        args.push_back("-t");
        args.push_back(time_spec);
    }
    args.push_back("-fixg");
    args.push_back("streams");
    return run(args);
}

std::string accurev_cli::depots()
{
    return run({ "show", "-fix", "depots" });
}

std::string accurev_cli::users()
{
    return run({ "show", "-fx", "users" });
}

void accurev_cli::populate(
    std::string const& stream, int tr,
    boost::filesystem::path const& location, bool overwrite)
{
    std::vector<std::string> args = {
        "pop", "-R", "-v", stream, "-L", location.string(),
        "-t", lexical_cast<std::string>(tr) };
    if (overwrite)
        args.push_back("-O");
    args.push_back(".");
    run(args, location);
}

std::string accurev_cli::principal()
{
    static boost::regex const principal_line("^Principal:\\s*(\\S.*?)\\s*$");
    std::string info = run({ "info" });
    boost::smatch match;
    if (!boost::regex_search(info, match, principal_line) || match[1] == "(not logged in)")
        return std::string();
    return match[1];
}

void accurev_cli::login(std::string const& user, std::string const& password)
{
    run({ "login", user, password });
}

void accurev_cli::logout()
{
    run({ "logout" });
}

} // namespace accu2git
