#include "infrastructure/readiness_probe.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace aprelay
{
    namespace infrastructure
    {

        ReadinessProbe::ReadinessProbe(ReadinessPolicy policy, Sleeper sleeper)
            : policy_(policy), sleeper_(std::move(sleeper))
        {
        }

        ReadinessResult ReadinessProbe::wait_until(const Check &check, const AttemptCallback &on_attempt) const
        {
            using std::chrono::milliseconds;

            ReadinessResult result;
            milliseconds interval = policy_.initial_interval;

            while (true)
            {
                ++result.attempts;
                if (check())
                {
                    result.ready = true;
                    return result;
                }

                if (on_attempt)
                {
                    on_attempt(result.attempts, result.waited);
                }

                milliseconds remaining = policy_.timeout - result.waited;
                if (remaining <= milliseconds::zero())
                {
                    return result;
                }

                milliseconds pause = std::min(interval, remaining);
                sleeper_(pause);
                result.waited += pause;

                auto next = static_cast<milliseconds::rep>(interval.count() * policy_.backoff_factor);
                interval = std::min(milliseconds(std::max<milliseconds::rep>(next, 1)), policy_.max_interval);
            }
        }

        void sleep_for(std::chrono::milliseconds duration)
        {
            std::this_thread::sleep_for(duration);
        }

    } // namespace infrastructure
} // namespace aprelay
