// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "transaction_kind.hpp"
#include "errors.hpp"

namespace accu2git {

transaction_kind classify(std::string const& name)
{
    if (name == "mkstream")
        return kind::create_stream();
    if (name == "chstream")
        return kind::reconfigure_stream();
    if (name == "add")
        return kind::add_file();
    if (name == "keep" || name == "co" || name == "move")
        return kind::file_change{name};
    if (name == "promote")
        return kind::promote();
    if (name == "defunct" || name == "purge")
        return kind::deactivate{name};
    if (name == "defcomp")
        return kind::define_component();
    throw unrecognized_input("unrecognized transaction kind '" + name + "'");
}

} // namespace accu2git
