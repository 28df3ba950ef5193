#ifndef APRELAY_CORE_APPLICATION_HPP
#define APRELAY_CORE_APPLICATION_HPP

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "core/router_controller.hpp"

namespace aprelay
{
    namespace core
    {

        enum class Action
        {
            INTERACTIVE,
            START,
            STOP,
            STATUS
        };

        /**
         * Entry point shared by main and the tests: checks the invocation, loads
         * the stored profile once and hands it to the controller
         */
        class Application
        {
        public:
            Application(const ToolSettings &settings,
                        infrastructure::CommandRunner &runner,
                        RouterController::Sleeper sleeper,
                        std::istream &in,
                        std::ostream &out,
                        std::ostream &err,
                        std::string program_name = "aprelay");

            ExitCode run(const std::string &action_name, bool privileged);

            static std::optional<Action> parse_action(const std::string &name);
            static std::string usage(const std::string &program_name);

            // Applies the logging settings; an unprivileged run logs to the console only
            static void configure_logging(const ToolSettings &settings,
                                          int verbosity,
                                          const std::string &log_file_override,
                                          bool privileged);

        private:
            const ToolSettings &settings_;
            infrastructure::CommandRunner &runner_;
            RouterController::Sleeper sleeper_;
            std::istream &in_;
            std::ostream &out_;
            std::ostream &err_;
            std::string program_name_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace aprelay

#endif // APRELAY_CORE_APPLICATION_HPP
