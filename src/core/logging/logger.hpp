#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace strand::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Lines below the minimum level are dropped.
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

        // Defaults to stdout.
        void set_output(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
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

            *out_ << "[" << level_to_string(level) << "] "
                      << (context_id_.empty() ? "" : "[" + context_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cout;

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

    #define STRAND_LOG_DEBUG(msg) strand::core::logging::Logger::get().log(strand::core::logging::LogLevel::DEBUG, msg)
    #define STRAND_LOG_INFO(msg)  strand::core::logging::Logger::get().log(strand::core::logging::LogLevel::INFO, msg)
    #define STRAND_LOG_WARN(msg)  strand::core::logging::Logger::get().log(strand::core::logging::LogLevel::WARN, msg)
    #define STRAND_LOG_ERROR(msg) strand::core::logging::Logger::get().log(strand::core::logging::LogLevel::ERROR, msg)

} // namespace strand::core::logging
