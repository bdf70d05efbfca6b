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

#include "log.hpp"
#include <cstdlib>
#include <stdexcept>

namespace accu2git
{

logger::logger()
    : out_(std::cout)
    , err_(std::cerr)
    , level(Info)
    , transaction(0)
    , transaction_reported(0)
    , num_errors(0)
    , dummy(0)
  {
  }

logger::logger(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err)
    , level(Info)
    , transaction(0)
    , transaction_reported(0)
    , num_errors(0)
    , dummy(0)
  {
  }

logger::~logger()
  {
  close_file();
  }

void logger::set_level(Level value)
  {
  level = value;
  }

void logger::open_file(std::string const& filename, bool truncate)
  {
  close_file();
  file.open(filename.c_str(), truncate ? std::ios::out | std::ios::trunc : std::ios::out | std::ios::app);
  if (!file)
    {
    throw std::runtime_error("cannot open log file " + filename);
    }
  out_tee.reset(new tee_stream(tee_device(out_, file)));
  err_tee.reset(new tee_stream(tee_device(err_, file)));
  }

void logger::close_file()
  {
  if (out_tee)
    {
    out_tee->flush();
    out_tee.reset();
    }
  if (err_tee)
    {
    err_tee->flush();
    err_tee.reset();
    }
  if (file.is_open())
    {
    file.close();
    }
  }

std::ostream& logger::out()
  {
  if (out_tee)
    {
    return *out_tee;
    }
  return out_;
  }

std::ostream& logger::err()
  {
  if (err_tee)
    {
    return *err_tee;
    }
  return err_;
  }

void logger::check_transaction()
  {
  if (transaction == transaction_reported)
    {
    return;
    }
  out() << "\nTransaction " << transaction << std::endl;
  transaction_reported = transaction;
  }

void logger::set_transaction(int value)
  {
  transaction = value;
  }

std::ostream& logger::error()
  {
  ++num_errors;
  check_transaction();
  return err() << "++ ERROR: ";
  }

std::ostream& logger::trace()
  {
  if (level < Trace)
    {
    return dummy;
    }
  check_transaction();
  return out() << "-- ";
  }

std::ostream& logger::debug()
  {
  if (level < Debug)
    {
    return dummy;
    }
  check_transaction();
  return out() << "-- ";
  }

std::ostream& logger::info()
  {
  if (level < Info)
    {
    return dummy;
    }
  check_transaction();
  return out() << "-- ";
  }

std::ostream& logger::warn()
  {
  check_transaction();
  return out() << "++ WARNING: ";
  }

int logger::result()
  {
  if (num_errors == 0)
    {
    return EXIT_SUCCESS;
    }
  err() << "\n" << num_errors << " Errors occured!" << std::endl;
  return EXIT_FAILURE;
  }

} // namespace accu2git
