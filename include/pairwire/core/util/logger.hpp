/**
 * @file logger.hpp
 * @brief Logging utilities for pairwire.
 *
 * Provides a singleton Logger class and logging macros for the packet and
 * identity layers. Transports embedding pairwire usually redirect the sink
 * into their own logging.
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <optional>
#include <iostream>

namespace pairwire {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @brief Get the upper-case display name of a log level.
     * @param lvl Log level
     * @return Level name, e.g. "WARN"
     */
    inline const char* logLevelName(LogLevel lvl) {
        static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
        return names[static_cast<int>(lvl)];
    }

    /**
     * @brief Map a configuration string ("debug", "WARN", ...) to a LogLevel.
     * @param text Level name, case-insensitive
     * @return Matching level, or std::nullopt when the name is unknown
     */
    inline std::optional<LogLevel> logLevelFromString(std::string_view text) {
        std::string lower;
        lower.reserve(text.size());
        for (char c : text)
            lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));

        if (lower == "trace") return LogLevel::Trace;
        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info")  return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warn;
        if (lower == "error") return LogLevel::Error;
        if (lower == "off")   return LogLevel::Off;
        return std::nullopt;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for pairwire.
     *
     * Provides thread-safe logging with a replaceable sink and a minimum level.
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
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Set a custom log sink function.
         *
         * Passing an empty function restores the default stderr sink.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl == LogLevel::Off || lvl < level_) return;
            sink_(lvl, msg);
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            /* default sink → stderr, stdout belongs to the host application */
            return [](LogLevel l, const std::string& m) {
                std::cerr << "[" << logLevelName(l) << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define PAIRWIRE_LOG_TRACE(msg) ::pairwire::Logger::inst().log(::pairwire::LogLevel::Trace, msg)
#define PAIRWIRE_LOG_DEBUG(msg) ::pairwire::Logger::inst().log(::pairwire::LogLevel::Debug, msg)
#define PAIRWIRE_LOG_INFO(msg)  ::pairwire::Logger::inst().log(::pairwire::LogLevel::Info,  msg)
#define PAIRWIRE_LOG_WARN(msg)  ::pairwire::Logger::inst().log(::pairwire::LogLevel::Warn,  msg)
#define PAIRWIRE_LOG_ERROR(msg) ::pairwire::Logger::inst().log(::pairwire::LogLevel::Error, msg)
}
