// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "process.hpp"
#include "errors.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>

#if defined(BOOST_POSIX_API)
# include <signal.h>
#endif

namespace accu2git {

namespace process = boost::process;

std::string find_executable(std::string const& name, std::string const& configured)
{
    if (!configured.empty())
        return configured;

    boost::filesystem::path exe = process::search_path(name);
    if (exe.empty())
        throw fatal_error("cannot find " + name + " on the PATH");
    return exe.string();
}

std::string command_line(std::string const& exe, std::vector<std::string> const& args)
{
    std::string result = exe;
    for (auto const& a : args)
        result += " " + a;
    return result;
}

command_result run_command(
    std::string const& exe,
    std::vector<std::string> const& args,
    boost::filesystem::path const& dir,
    std::string const& input,
    environment_overrides const& env)
{
#if defined(BOOST_POSIX_API)
    // A child that exits without draining its stdin must not take us
    // down with it.
    static bool const ignoring_sigpipe = (signal(SIGPIPE, SIG_IGN), true);
    (void)ignoring_sigpipe;
#endif

    process::environment child_env = boost::this_process::environment();
    for (auto const& kv : env)
        child_env[kv.first] = kv.second;

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    command_result result;
    try
    {
        process::child c(
            exe, process::args(args),
            process::start_dir(dir.string()),
            process::std_out > out,
            process::std_err > err,
            process::std_in < boost::asio::buffer(input),
            child_env,
            ios);
        ios.run();
        c.wait();
        result.exit_code = c.exit_code();
    }
    catch (process::process_error const& e)
    {
        throw transient_error("cannot run " + command_line(exe, args) + ": " + e.what());
    }
    result.out = out.get();
    result.err = err.get();
    return result;
}

} // namespace accu2git
