#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include <mutex>

namespace hookguard::core::logging {

    // 1. Log levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger
    // stdout carries the hook response, so every line goes to stderr.
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[hookguard] [" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

        // Accepts debug|info|warn|error; anything else keeps the current level.
        static LogLevel parse_level(const std::string& text, LogLevel fallback) {
            if (text == "debug") return LogLevel::DEBUG;
            if (text == "info") return LogLevel::INFO;
            if (text == "warn" || text == "warning") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return fallback;
        }

    private:
        Logger() {
            const char* env = std::getenv("HOOKGUARD_LOG_LEVEL");
            if (env != nullptr) {
                min_level_ = parse_level(env, min_level_);
            }
        }

        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::WARN;

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
    #define LOG_DEBUG(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::ERROR, msg)

} // namespace hookguard::core::logging
