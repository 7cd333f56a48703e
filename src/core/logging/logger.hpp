#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace agentbox::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Process-wide logger
    class Logger {
    public:
        // Singleton access so every component and worker thread shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Free-form tag printed after the level, e.g. the active workspace id
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::clog << timestamp() << " [" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;
        std::string context_;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            std::tm tm_buf{};
            localtime_r(&seconds, &tm_buf);
            std::ostringstream out;
            out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros used everywhere else in the code
    #define LOG_DEBUG(msg) agentbox::core::logging::Logger::get().log(agentbox::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  agentbox::core::logging::Logger::get().log(agentbox::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  agentbox::core::logging::Logger::get().log(agentbox::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) agentbox::core::logging::Logger::get().log(agentbox::core::logging::LogLevel::ERROR, msg)

} // namespace agentbox::core::logging
