#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace execpolicy::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Writes to stderr: stdout belongs to the JSON report.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_source(const std::string& source) {
            std::lock_guard<std::mutex> lock(mutex_);
            source_ = source;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (source_.empty() ? "" : "[" + source_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string source_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
            }
            return "UNKNOWN";
        }
    };

    // 3. Helper macros
    #define EXECPOLICY_LOG_DEBUG(msg) execpolicy::core::logging::Logger::get().log(execpolicy::core::logging::LogLevel::DEBUG, msg)
    #define EXECPOLICY_LOG_INFO(msg)  execpolicy::core::logging::Logger::get().log(execpolicy::core::logging::LogLevel::INFO, msg)
    #define EXECPOLICY_LOG_WARN(msg)  execpolicy::core::logging::Logger::get().log(execpolicy::core::logging::LogLevel::WARN, msg)
    #define EXECPOLICY_LOG_ERROR(msg) execpolicy::core::logging::Logger::get().log(execpolicy::core::logging::LogLevel::ERROR, msg)

} // namespace execpolicy::core::logging
