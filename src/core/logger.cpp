#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <iomanip>

namespace aprelay
{
    namespace core
    {

        std::string LogContext::format() const
        {
            std::ostringstream ss;
            bool first = true;
            for (const auto &[key, value] : context_)
            {
                if (!first)
                {
                    ss << " ";
                }
                ss << key << "=" << value;
                first = false;
            }
            return ss.str();
        }

        Logger::Logger(const std::string &name, LogLevel level)
            : name_(name), level_(level), console_output_(true), out_(&std::cout), err_(&std::cerr)
        {
        }

        Logger::~Logger()
        {
            if (file_output_)
            {
                file_output_->close();
            }
        }

        void Logger::set_output_file(const std::string &filename)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (file_output_)
            {
                file_output_->close();
                file_output_.reset();
            }

            if (!filename.empty())
            {
                file_output_ = std::make_unique<std::ofstream>(filename, std::ios::app);
                if (!file_output_->is_open())
                {
                    *err_ << "Failed to open log file: " << filename << std::endl;
                    file_output_.reset();
                }
            }
        }

        void Logger::set_console_streams(std::ostream *out, std::ostream *err)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = out ? out : &std::cout;
            err_ = err ? err : &std::cerr;
        }

        void Logger::debug(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::DEBUG))
            {
                log(LogLevel::DEBUG, message, context);
            }
        }

        void Logger::info(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::INFO))
            {
                log(LogLevel::INFO, message, context);
            }
        }

        void Logger::warning(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::WARNING))
            {
                log(LogLevel::WARNING, message, context);
            }
        }

        void Logger::error(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::ERROR))
            {
                log(LogLevel::ERROR, message, context);
            }
        }

        void Logger::critical(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::CRITICAL))
            {
                log(LogLevel::CRITICAL, message, context);
            }
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            std::string formatted = format_message(level, message, context);

            if (console_output_)
            {
                std::ostream &stream = level >= LogLevel::ERROR ? *err_ : *out_;
                stream << formatted << std::endl;
            }

            if (file_output_ && file_output_->is_open())
            {
                *file_output_ << formatted << std::endl;
            }
        }

        std::string Logger::format_message(LogLevel level, const std::string &message, const LogContext &context) const
        {
            std::ostringstream ss;
            ss << current_timestamp() << " ";
            ss << "[" << LoggerManager::level_to_string(level) << "] ";
            ss << name_ << ": " << message;
            if (!context.empty())
            {
                ss << " " << context.format();
            }
            return ss.str();
        }

        std::string Logger::current_timestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) %
                      1000;

            std::tm local{};
            localtime_r(&time_t, &local);

            std::ostringstream ss;
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms.count();
            return ss.str();
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager instance;
            return instance;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            default_level_ = level;
            default_log_file_ = log_file;
            default_console_output_ = console_output;

            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
                logger->set_console_output(console_output);
                logger->set_output_file(log_file);
            }
        }

        void LoggerManager::set_console_streams(std::ostream *out, std::ostream *err)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            default_out_ = out;
            default_err_ = err;
            for (auto &[name, logger] : loggers_)
            {
                logger->set_console_streams(out, err);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = loggers_.find(name);
            if (it != loggers_.end())
            {
                return it->second;
            }

            auto logger = std::make_shared<Logger>(name, default_level_);
            logger->set_console_output(default_console_output_);
            logger->set_console_streams(default_out_, default_err_);
            if (!default_log_file_.empty())
            {
                logger->set_output_file(default_log_file_);
            }

            loggers_[name] = logger;
            return logger;
        }

        LogLevel LoggerManager::string_to_level(const std::string &level_str)
        {
            std::string upper = level_str;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            if (upper == "DEBUG")
                return LogLevel::DEBUG;
            if (upper == "INFO")
                return LogLevel::INFO;
            if (upper == "WARNING" || upper == "WARN")
                return LogLevel::WARNING;
            if (upper == "ERROR")
                return LogLevel::ERROR;
            if (upper == "CRITICAL" || upper == "CRIT")
                return LogLevel::CRITICAL;

            return LogLevel::INFO;
        }

        std::string LoggerManager::level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "UNKNOWN";
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output);
        }

    } // namespace core
} // namespace aprelay
