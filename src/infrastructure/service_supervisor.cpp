#include "infrastructure/service_supervisor.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <utility>

namespace aprelay
{
    namespace infrastructure
    {

        ServiceSupervisor::ServiceSupervisor(CommandRunner &runner, Sleeper sleeper)
            : runner_(runner), sleeper_(std::move(sleeper)), logger_(core::get_logger("ServiceSupervisor"))
        {
        }

        bool ServiceSupervisor::unmask(const std::string &unit)
        {
            return runner_.run({"systemctl", "unmask", unit}).ok();
        }

        bool ServiceSupervisor::enable_now(const std::string &unit)
        {
            return runner_.run({"systemctl", "enable", "--now", unit}).ok();
        }

        bool ServiceSupervisor::stop(const std::string &unit)
        {
            bool stopped = runner_.run({"systemctl", "stop", unit}).ok();
            if (!stopped)
            {
                logger_->debug("systemctl stop failed", core::LogContext().add("unit", unit));
            }
            return stopped;
        }

        std::string ServiceSupervisor::status_report(const std::string &unit) const
        {
            auto result = runner_.run({"systemctl", "status", unit, "--no-pager"});
            if (!result.launched())
            {
                return "systemctl unavailable\n";
            }
            return result.output;
        }

        ServiceStart ServiceSupervisor::start_with_fallback(const std::string &unit,
                                                            const std::vector<std::string> &fallback_argv,
                                                            std::chrono::milliseconds settle)
        {
            if (enable_now(unit))
            {
                logger_->debug("Unit enabled and started", core::LogContext().add("unit", unit));
                return ServiceStart::SUPERVISED;
            }

            logger_->warning("Failed to start service through systemd, launching it directly",
                             core::LogContext().add("unit", unit).add("command", format_command(fallback_argv)));

            if (!runner_.spawn_detached(fallback_argv))
            {
                logger_->error("Failed to launch daemon", core::LogContext().add("unit", unit));
                return ServiceStart::FAILED;
            }

            sleeper_(settle);
            return ServiceStart::DIRECT;
        }

    } // namespace infrastructure
} // namespace aprelay
