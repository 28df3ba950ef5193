#include "core/application.hpp"
#include "core/logger.hpp"
#include "core/network_profile.hpp"
#include "core/prompt.hpp"
#include "core/settings.hpp"

#include <utility>

namespace aprelay
{
    namespace core
    {

        Application::Application(const ToolSettings &settings,
                                 infrastructure::CommandRunner &runner,
                                 RouterController::Sleeper sleeper,
                                 std::istream &in,
                                 std::ostream &out,
                                 std::ostream &err,
                                 std::string program_name)
            : settings_(settings),
              runner_(runner),
              sleeper_(std::move(sleeper)),
              in_(in),
              out_(out),
              err_(err),
              program_name_(std::move(program_name)),
              logger_(get_logger("main"))
        {
        }

        std::optional<Action> Application::parse_action(const std::string &name)
        {
            if (name.empty() || name == "interactive")
                return Action::INTERACTIVE;
            if (name == "start")
                return Action::START;
            if (name == "stop")
                return Action::STOP;
            if (name == "status")
                return Action::STATUS;
            return std::nullopt;
        }

        std::string Application::usage(const std::string &program_name)
        {
            return "Usage: " + program_name + " [OPTIONS] {start|stop|status|interactive}\n";
        }

        void Application::configure_logging(const ToolSettings &settings,
                                            int verbosity,
                                            const std::string &log_file_override,
                                            bool privileged)
        {
            LogLevel level = LoggerManager::string_to_level(settings.logging.log_level);
            if (verbosity == 1)
            {
                level = LogLevel::INFO;
            }
            else if (verbosity >= 2)
            {
                level = LogLevel::DEBUG;
            }

            std::string log_file = log_file_override.empty() ? settings.logging.log_file : log_file_override;
            if (!privileged)
            {
                // Refused runs must not create or append to any file
                log_file.clear();
            }
            setup_logging(level, log_file, log_file.empty());
        }

        ExitCode Application::run(const std::string &action_name, bool privileged)
        {
            if (!privileged)
            {
                logger_->error("This tool must be run as root");
                err_ << "Run with: sudo " << program_name_ << " <start|stop|status|interactive>" << std::endl;
                return ExitCode::INVALID_INVOCATION;
            }

            auto action = parse_action(action_name);
            if (!action)
            {
                logger_->error("Unknown action", LogContext().add("action", action_name));
                err_ << usage(program_name_);
                return ExitCode::INVALID_INVOCATION;
            }

            ProfileStore store(settings_.paths.profile_file);
            NetworkProfile profile;
            try
            {
                if (auto stored = store.load())
                {
                    profile = *stored;
                }
            }
            catch (const ProfileError &e)
            {
                if (*action != Action::INTERACTIVE)
                {
                    logger_->error("Stored configuration is unreadable, run 'interactive' to recreate it",
                                   LogContext().add("error", e.what()));
                    return ExitCode::MISSING_RESOURCE;
                }
                logger_->warning("Ignoring unreadable stored configuration", LogContext().add("error", e.what()));
            }

            RouterController controller(settings_, store, runner_, sleeper_);
            Prompter prompter(in_, out_);

            switch (*action)
            {
            case Action::INTERACTIVE:
            {
                ExitCode code = controller.interactive(profile, prompter);
                if (code == ExitCode::SUCCESS)
                {
                    prompter.say("Configuration saved. To start the relay run: sudo " + program_name_ + " start");
                }
                return code;
            }
            case Action::START:
                if (!profile.is_configured())
                {
                    logger_->warning("No configuration found, switching to interactive mode");
                    try
                    {
                        controller.collect(profile, prompter);
                    }
                    catch (const InputClosed &)
                    {
                        logger_->error("Input ended before the configuration was complete");
                        return ExitCode::INVALID_INVOCATION;
                    }
                }
                return controller.start(profile);
            case Action::STOP:
                return controller.stop(profile);
            case Action::STATUS:
                return controller.status(profile, out_);
            }

            return ExitCode::INVALID_INVOCATION;
        }

    } // namespace core
} // namespace aprelay
