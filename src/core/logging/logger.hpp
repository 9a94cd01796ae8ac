#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace warden::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Diagnostic sink shared by the whole process. Audit records do not go
    // through here, see session/audit_trail.hpp.
    class Logger {
    public:
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

        void set_structured(bool structured) {
            std::lock_guard<std::mutex> lock(mutex_);
            structured_ = structured;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            if (structured_) {
                nlohmann::json line;
                line["ts_unix_ms"] = now_unix_ms();
                line["level"] = level_name(level);
                line["session"] = session_id_;
                line["message"] = message;
                std::clog << line.dump() << std::endl;
                return;
            }

            std::clog << "[" << padded_level(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        bool structured_ = false;

        static std::int64_t now_unix_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        static std::string level_name(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "debug";
                case LogLevel::INFO:  return "info";
                case LogLevel::WARN:  return "warn";
                case LogLevel::ERROR: return "error";
                default: return "unknown";
            }
        }

        static std::string padded_level(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::ERROR, msg)

} // namespace warden::core::logging
