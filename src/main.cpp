/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/filesystem/operations.hpp>
#include <boost/program_options.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>

#include "accurev_cli.hpp"
#include "config.hpp"
#include "converter.hpp"
#include "errors.hpp"
#include "git_repository.hpp"
#include "log.hpp"
#include "process.hpp"

using namespace accu2git;

static int list_missing_users(Options const& options, logger& log, depot_client& client)
{
  source_depot depot(client, options.depot, log, options.retry);
  std::vector<std::string> missing = options.users.missing(depot.users());
  for (auto const& user : missing)
    {
    std::cout << user << std::endl;
    }
  log.info() << missing.size() << " users are not mapped" << std::endl;
  return missing.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char **argv)
{
  logger log;
  try
    {
    Options options;
    std::string config_file = default_config_file;
    std::string method;
    std::string strategy;
    std::string example_config;

    namespace po = boost::program_options;
    po::options_description program_options("Allowed options");
    program_options.add_options()
        ("help,h", "produce help message")
        ("version", "print version string")
        ("config,c", po::value(&config_file)->value_name("FILENAME"), "XML configuration file")
        ("accurev-username,u", po::value(&options.username)->value_name("USER"), "depot user name")
        ("accurev-password,p", po::value(&options.password)->value_name("PASSWORD"), "depot password")
        ("accurev-depot,t", po::value(&options.depot)->value_name("DEPOT"), "depot to convert")
        ("git-repo-path,g", po::value(&options.repo_path)->value_name("PATH"), "Git repository to convert into")
        ("method,M", po::value(&method)->value_name("METHOD"), "retrieval method: pop, diff, deep-hist or skip")
        ("merge-strategy,j", po::value(&strategy)->value_name("STRATEGY"), "merge strategy: normal, orphanage or skip")
        ("restart,r", "delete all converter state, branches and notes and start over")
        ("finalize,f", "stitch the converted branches together")
        ("verbose,v", "be verbose")
        ("extra-verbose", "be even more verbose")
        ("quiet,q", "be quiet")
        ("log-file,L", po::value(&options.log_file)->value_name("FILENAME"), "append the log to FILENAME")
        ("reset-log-file,l", "truncate the log file first")
        ("no-log-file", "write no log file")
        ("example-config", po::value(&example_config)->implicit_value("-")->value_name("FILENAME"),
         "write an example configuration and exit")
        ("check-missing-users,m", "list depot users missing from the user map and exit")
        ("track,T", "keep converting new transactions forever")
        ("tracking-intermission,I", po::value(&options.intermission)->value_name("SECONDS"),
         "pause between two tracking runs")
        ("accurev", po::value(&options.accurev_executable)->value_name("PATH"), "the accurev executable")
        ("git", po::value(&options.git_executable)->value_name("PATH"), "the git executable")
        ;
    po::variables_map variables;
    store(po::command_line_parser(argc, argv)
          .options(program_options)
          .run(), variables);
    if (variables.count("help"))
      {
      std::cout << program_options << std::endl;
      return 0;
      }
    if (variables.count("version"))
      {
      std::cout << "accu2git 0.1" << std::endl;
      return 0;
      }
    if (variables.count("example-config"))
      {
      po::notify(variables);
      if (example_config == "-")
        {
        write_example_config(std::cout);
        }
      else
        {
        std::ofstream out(example_config.c_str());
        if (!out)
          throw fatal_error("cannot write " + example_config);
        write_example_config(out);
        }
      return 0;
      }

    // The configuration file fills in what the command line left out.
    if (variables.count("config"))
      config_file = variables["config"].as<std::string>();
    if (variables.count("config") || boost::filesystem::exists(config_file))
      {
      read_config(config_file, options);
      }
    po::notify(variables);

    if (!method.empty())
      options.method = parse_retrieval_method(method);
    if (!strategy.empty())
      options.strategy = parse_merge_strategy(strategy);
    options.restart = variables.count("restart") > 0;
    options.finalize = variables.count("finalize") > 0;
    options.track = variables.count("track") > 0;
    check_options(options);

    if (variables.count("quiet"))
      log.set_level(logger::Warning);
    if (variables.count("verbose"))
      log.set_level(logger::Debug);
    if (variables.count("extra-verbose"))
      log.set_level(logger::Trace);
    if (!options.log_file.empty() && !variables.count("no-log-file"))
      log.open_file(options.log_file, variables.count("reset-log-file") > 0);

    accurev_cli client(find_executable("accurev", options.accurev_executable), log);

    if (variables.count("check-missing-users"))
      return list_missing_users(options, log, client);

    if (options.repo_path.empty())
      throw fatal_error("no Git repository path configured");
    git_repository repo(
        options.repo_path, find_executable("git", options.git_executable), log, options.retry);

    for (;;)
      {
      converter conversion(options, log, client, repo);
      conversion.run();
      if (!options.track)
        break;
      options.restart = false;
      log.info() << "Waiting " << options.intermission << " seconds for new transactions" << std::endl;
      std::this_thread::sleep_for(std::chrono::seconds(options.intermission));
      }
    }
  catch (std::exception const& error)
    {
    log.error() << error.what() << std::endl;
    }
  return log.result();
}
