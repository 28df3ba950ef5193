#ifndef APRELAY_INFRASTRUCTURE_READINESS_PROBE_HPP
#define APRELAY_INFRASTRUCTURE_READINESS_PROBE_HPP

#include <chrono>
#include <functional>

namespace aprelay
{
    namespace infrastructure
    {

        /**
         * Polling schedule: the interval starts at initial_interval and is
         * multiplied by backoff_factor after every failed check, up to max_interval
         */
        struct ReadinessPolicy
        {
            std::chrono::milliseconds timeout{8000};
            std::chrono::milliseconds initial_interval{500};
            double backoff_factor = 1.5;
            std::chrono::milliseconds max_interval{2000};
        };

        struct ReadinessResult
        {
            bool ready = false;
            int attempts = 0;
            std::chrono::milliseconds waited{0};
        };

        /**
         * Waits for an externally driven condition to become true
         */
        class ReadinessProbe
        {
        public:
            using Check = std::function<bool()>;
            using Sleeper = std::function<void(std::chrono::milliseconds)>;
            using AttemptCallback = std::function<void(int attempt, std::chrono::milliseconds waited)>;

            ReadinessProbe(ReadinessPolicy policy, Sleeper sleeper);

            // Calls check until it succeeds or the timeout is spent. on_attempt
            // runs after every failed check, before sleeping.
            ReadinessResult wait_until(const Check &check, const AttemptCallback &on_attempt = nullptr) const;

            const ReadinessPolicy &policy() const { return policy_; }

        private:
            ReadinessPolicy policy_;
            Sleeper sleeper_;
        };

        // Sleeper that blocks the calling thread
        void sleep_for(std::chrono::milliseconds duration);

    } // namespace infrastructure
} // namespace aprelay

#endif // APRELAY_INFRASTRUCTURE_READINESS_PROBE_HPP
