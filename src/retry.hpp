// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef RETRY_DWA2013702_HPP
# define RETRY_DWA2013702_HPP

# include "errors.hpp"
# include "log.hpp"
# include <boost/lexical_cast.hpp>
# include <chrono>
# include <string>
# include <thread>

namespace accu2git {

struct retry_policy
{
    retry_policy(int attempts = 3, int backoff_seconds = 3)
        : attempts(attempts), backoff_seconds(backoff_seconds)
    {}

    int attempts;
    int backoff_seconds;
};

// Call f until it stops throwing transient_error.  When the budget is
// exhausted the last failure is escalated to a fatal_error.
template <class F>
auto with_retry(retry_policy const& policy, logger& log, std::string const& what, F f)
    -> decltype(f())
{
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            return f();
        }
        catch (transient_error const& e)
        {
            if (attempt >= policy.attempts)
            {
                throw fatal_error(
                    what + " failed after "
                    + boost::lexical_cast<std::string>(attempt) + " attempts: " + e.what());
            }
            log.warn() << what << " failed (" << e.what() << "), retrying" << std::endl;
            if (policy.backoff_seconds > 0)
                std::this_thread::sleep_for(std::chrono::seconds(policy.backoff_seconds));
        }
    }
}

} // namespace accu2git

#endif // RETRY_DWA2013702_HPP
