#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace fabric::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger. Writes to stderr so stdout stays free for the final answer.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (context_id_.empty() ? "" : "[" + context_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_id_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) fabric::core::logging::Logger::get().log(fabric::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  fabric::core::logging::Logger::get().log(fabric::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  fabric::core::logging::Logger::get().log(fabric::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) fabric::core::logging::Logger::get().log(fabric::core::logging::LogLevel::ERROR, msg)

} // namespace fabric::core::logging
