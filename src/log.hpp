/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
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

#ifndef LOG_HPP
#define LOG_HPP

#include <boost/iostreams/tee.hpp>
#include <boost/iostreams/stream.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace accu2git
{

class logger
  {
  public:
    enum Level
      {
      Warning,
      Info,
      Debug,
      Trace
      };

    logger();
    logger(std::ostream& out, std::ostream& err);
    ~logger();

    void set_level(Level value);
    Level get_level() const { return level; }

    // Mirror everything written from now on into the named file.
    void open_file(std::string const& filename, bool truncate);
    void close_file();

    // Prints a banner naming the transaction before the next line
    // logged about it.
    void set_transaction(int value);

    std::ostream& error();
    std::ostream& trace();
    std::ostream& debug();
    std::ostream& info();
    std::ostream& warn();

    std::size_t errors() const { return num_errors; }
    int result();

  private:
    typedef boost::iostreams::tee_device<std::ostream, std::ofstream> tee_device;
    typedef boost::iostreams::stream<tee_device> tee_stream;

    std::ostream& out();
    std::ostream& err();
    void check_transaction();

  private:
    std::ostream& out_;
    std::ostream& err_;
    Level level;
    int transaction;
    int transaction_reported;
    std::size_t num_errors;
    std::ostream dummy;
    std::ofstream file;
    std::unique_ptr<tee_stream> out_tee;
    std::unique_ptr<tee_stream> err_tee;
  };

} // namespace accu2git

#endif /* LOG_HPP */
