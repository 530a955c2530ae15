#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace acptrace::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr only: stdout belongs to the
    // editor <-> agent protocol stream and must never carry log output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_instance_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            instance_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (instance_id_.empty() ? "" : "[" + instance_id_ + "] ")
                      << message << std::endl;
        }

        // -v count -> level: 0 = WARN, 1 = INFO, 2+ = DEBUG
        static LogLevel level_for_verbosity(unsigned verbosity) {
            if (verbosity == 0) return LogLevel::WARN;
            if (verbosity == 1) return LogLevel::INFO;
            return LogLevel::DEBUG;
        }

        static std::optional<LogLevel> parse_level(const std::string& text) {
            if (text == "debug" || text == "trace") return LogLevel::DEBUG;
            if (text == "info") return LogLevel::INFO;
            if (text == "warn" || text == "warning") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return std::nullopt;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string instance_id_;
        LogLevel min_level_ = LogLevel::WARN;

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

    #define LOG_DEBUG(msg) acptrace::core::logging::Logger::get().log(acptrace::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  acptrace::core::logging::Logger::get().log(acptrace::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  acptrace::core::logging::Logger::get().log(acptrace::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) acptrace::core::logging::Logger::get().log(acptrace::core::logging::LogLevel::ERROR, msg)

} // namespace acptrace::core::logging
