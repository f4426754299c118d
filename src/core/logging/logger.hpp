#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace arena::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_contest_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            contest_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Sandbox and agent threads log concurrently
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (contest_id_.empty() ? "" : "[" + contest_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string contest_id_;
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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) arena::core::logging::Logger::get().log(arena::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  arena::core::logging::Logger::get().log(arena::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  arena::core::logging::Logger::get().log(arena::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) arena::core::logging::Logger::get().log(arena::core::logging::LogLevel::ERROR, msg)

} // namespace arena::core::logging
