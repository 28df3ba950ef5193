#ifndef APRELAY_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define APRELAY_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <memory>
#include <string>
#include <vector>

namespace aprelay
{
    namespace core
    {
        class Logger;
    }
}

namespace aprelay
{
    namespace infrastructure
    {

        // Exit status of a child whose program could not be executed
        constexpr int COMMAND_NOT_FOUND = 127;

        /**
         * Outcome of a finished external command
         */
        struct CommandResult
        {
            int exit_code = -1; // -1 when no child could be started
            std::string output; // Captured standard output

            bool ok() const { return exit_code == 0; }
            bool launched() const { return exit_code >= 0 && exit_code != COMMAND_NOT_FOUND; }
        };

        /**
         * Executes the system tools the relay is built on
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            // Runs argv to completion and captures its standard output
            virtual CommandResult run(const std::vector<std::string> &argv) = 0;

            // Starts argv in the background without waiting for it
            virtual bool spawn_detached(const std::vector<std::string> &argv) = 0;

            // True when the program can be found on PATH
            virtual bool has_program(const std::string &name) const = 0;
        };

        /**
         * CommandRunner backed by fork/exec, no shell involved
         */
        class SystemCommandRunner : public CommandRunner
        {
        public:
            SystemCommandRunner();

            CommandResult run(const std::vector<std::string> &argv) override;
            bool spawn_detached(const std::vector<std::string> &argv) override;
            bool has_program(const std::string &name) const override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

        // Joins argv into a single line for logging
        std::string format_command(const std::vector<std::string> &argv);

    } // namespace infrastructure
} // namespace aprelay

#endif // APRELAY_INFRASTRUCTURE_COMMAND_RUNNER_HPP
