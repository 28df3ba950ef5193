/**
 * Command execution for the external system tools
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace aprelay
{
    namespace infrastructure
    {

        namespace
        {
            std::vector<char *> make_exec_args(const std::vector<std::string> &argv)
            {
                std::vector<char *> args;
                args.reserve(argv.size() + 1);
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);
                return args;
            }

            void redirect_to_null(int fd)
            {
                int null_fd = open("/dev/null", O_RDWR);
                if (null_fd >= 0)
                {
                    dup2(null_fd, fd);
                    if (null_fd != fd)
                    {
                        close(null_fd);
                    }
                }
            }

            // Leaves only stdin, stdout and stderr open in a child about to exec
            void close_inherited_descriptors()
            {
                long max_fd = sysconf(_SC_OPEN_MAX);
                if (max_fd < 0)
                {
                    max_fd = 1024;
                }
                for (long fd = STDERR_FILENO + 1; fd < max_fd; ++fd)
                {
                    close(static_cast<int>(fd));
                }
            }
        }

        std::string format_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                cmd << argv[i];
            }
            return cmd.str();
        }

        SystemCommandRunner::SystemCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult SystemCommandRunner::run(const std::vector<std::string> &argv)
        {
            CommandResult result;
            if (argv.empty())
            {
                return result;
            }

            logger_->debug("Running command", core::LogContext().add("command", format_command(argv)));

            int pipe_fds[2];
            if (pipe(pipe_fds) != 0)
            {
                logger_->error("Failed to create pipe", core::LogContext().add("error", std::strerror(errno)));
                return result;
            }

            auto args = make_exec_args(argv);

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                close(pipe_fds[0]);
                dup2(pipe_fds[1], STDOUT_FILENO);
                close(pipe_fds[1]);
                redirect_to_null(STDIN_FILENO);
                redirect_to_null(STDERR_FILENO);
                close_inherited_descriptors();

                execvp(args[0], args.data());
                _exit(COMMAND_NOT_FOUND); // If execvp fails
            }
            else if (pid < 0)
            {
                logger_->error("Failed to fork", core::LogContext().add("command", argv[0]));
                close(pipe_fds[0]);
                close(pipe_fds[1]);
                return result;
            }

            // Parent process
            close(pipe_fds[1]);
            char buffer[256];
            ssize_t count;
            while ((count = read(pipe_fds[0], buffer, sizeof(buffer))) != 0)
            {
                if (count < 0)
                {
                    if (errno == EINTR)
                        continue;
                    break;
                }
                result.output.append(buffer, static_cast<size_t>(count));
            }
            close(pipe_fds[0]);

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    logger_->error("Failed to wait for command", core::LogContext().add("command", argv[0]));
                    return result;
                }
            }

            if (WIFEXITED(status))
            {
                result.exit_code = WEXITSTATUS(status);
            }
            else
            {
                result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
            }

            logger_->debug("Command finished",
                           core::LogContext().add("command", argv[0]).add("exit_code", result.exit_code));
            return result;
        }

        bool SystemCommandRunner::spawn_detached(const std::vector<std::string> &argv)
        {
            if (argv.empty())
            {
                return false;
            }

            logger_->debug("Launching in background", core::LogContext().add("command", format_command(argv)));

            auto args = make_exec_args(argv);

            // Double fork: the daemon is reparented to init
            pid_t pid = fork();
            if (pid == 0)
            {
                setsid();
                pid_t grandchild = fork();
                if (grandchild != 0)
                {
                    _exit(grandchild > 0 ? 0 : 1);
                }

                redirect_to_null(STDIN_FILENO);
                redirect_to_null(STDOUT_FILENO);
                redirect_to_null(STDERR_FILENO);
                close_inherited_descriptors();
                execvp(args[0], args.data());
                _exit(COMMAND_NOT_FOUND);
            }
            else if (pid < 0)
            {
                logger_->error("Failed to fork background process", core::LogContext().add("command", argv[0]));
                return false;
            }

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    return false;
                }
            }
            return WIFEXITED(status) && WEXITSTATUS(status) == 0;
        }

        bool SystemCommandRunner::has_program(const std::string &name) const
        {
            namespace fs = std::filesystem;

            if (name.find('/') != std::string::npos)
            {
                return access(name.c_str(), X_OK) == 0;
            }

            const char *path_env = std::getenv("PATH");
            std::string path_list = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

            std::istringstream stream(path_list);
            std::string dir;
            while (std::getline(stream, dir, ':'))
            {
                if (dir.empty())
                    continue;
                fs::path candidate = fs::path(dir) / name;
                std::error_code ec;
                if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
                {
                    return true;
                }
            }
            return false;
        }

    } // namespace infrastructure
} // namespace aprelay
