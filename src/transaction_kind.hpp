// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef TRANSACTION_KIND_DWA2013702_HPP
# define TRANSACTION_KIND_DWA2013702_HPP

# include <boost/variant.hpp>
# include <string>

namespace accu2git {

// One type per kind of depot transaction.  A handler that forgets a
// kind fails to compile instead of silently skipping transactions.
namespace kind
{
  struct create_stream {};        // mkstream
  struct reconfigure_stream {};   // chstream
  struct add_file {};             // add

  // keep, co, move
  struct file_change
  {
      std::string name;
  };

  struct promote {};

  // defunct, purge
  struct deactivate
  {
      std::string name;
  };

  struct define_component {};     // defcomp
}

typedef boost::variant<
    kind::create_stream,
    kind::reconfigure_stream,
    kind::add_file,
    kind::file_change,
    kind::promote,
    kind::deactivate,
    kind::define_component
> transaction_kind;

// Maps the depot's name for a transaction kind onto the variant.
// Throws unrecognized_input for anything else.
transaction_kind classify(std::string const& name);

} // namespace accu2git

#endif // TRANSACTION_KIND_DWA2013702_HPP
