/**
 * @file logger.hpp
 * @brief Logging utilities for IntentMesh.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <optional>
#include <iostream>

namespace intentmesh {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @brief Parse a log level name ("trace", "debug", "info", "warn", "error").
     * @param name Level name, case-sensitive
     * @return The level, or std::nullopt for an unknown name
     */
    inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info")  return LogLevel::Info;
        if (name == "warn")  return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        return std::nullopt;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for IntentMesh.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) { level_ = lvl; }
        LogLevel level() const { return level_; }
        /**
         * @brief Set a custom log sink function.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = std::move(s);
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            if (lvl < level_) return;
            std::scoped_lock lk(m_);
            if (sink_) sink_(lvl, msg);
        }

    private:
        Logger() {
            /* default sink → stdout */
            sink_ = [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
                std::cout << "[" << names[(int)l] << "] " << m << '\n';
            };
        }
        std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::intentmesh::Logger::inst().log(::intentmesh::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::intentmesh::Logger::inst().log(::intentmesh::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::intentmesh::Logger::inst().log(::intentmesh::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::intentmesh::Logger::inst().log(::intentmesh::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::intentmesh::Logger::inst().log(::intentmesh::LogLevel::Error, msg)
}
