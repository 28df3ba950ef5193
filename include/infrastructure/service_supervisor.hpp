#ifndef APRELAY_INFRASTRUCTURE_SERVICE_SUPERVISOR_HPP
#define APRELAY_INFRASTRUCTURE_SERVICE_SUPERVISOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace aprelay
{
    namespace core
    {
        class Logger;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }
}

namespace aprelay
{
    namespace infrastructure
    {

        /**
         * How a daemon ended up running after start_with_fallback
         */
        enum class ServiceStart
        {
            SUPERVISED, // systemd started and enabled the unit
            DIRECT,     // systemd failed, the daemon binary was launched directly
            FAILED
        };

        /**
         * Service Supervisor
         * Starts, stops and inspects daemons through systemctl(1)
         */
        class ServiceSupervisor
        {
        public:
            using Sleeper = std::function<void(std::chrono::milliseconds)>;

            ServiceSupervisor(CommandRunner &runner, Sleeper sleeper);

            bool unmask(const std::string &unit);
            bool enable_now(const std::string &unit);
            bool stop(const std::string &unit);

            // `systemctl status` output; inactive units still produce a report
            std::string status_report(const std::string &unit) const;

            // Enables and starts the unit, or launches fallback_argv in the
            // background and waits `settle` for it to come up
            ServiceStart start_with_fallback(const std::string &unit,
                                             const std::vector<std::string> &fallback_argv,
                                             std::chrono::milliseconds settle);

        private:
            CommandRunner &runner_;
            Sleeper sleeper_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprelay

#endif // APRELAY_INFRASTRUCTURE_SERVICE_SUPERVISOR_HPP
