/**
 * @file logger.hpp
 * @brief Logging utilities for devicelink.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 */
#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <iostream>

namespace devicelink {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @class Logger
     * @brief Singleton logger shared by every connection handler.
     *
     * Thread-safe; the sink and the minimum level can be replaced at runtime.
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

        /**
         * @brief Set a custom log sink function.
         * @param s Sink function to use; an empty function restores the default sink
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
            if (lvl < level_) return;
            sink_(lvl, msg);
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            /* default sink → stdout */
            return [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
                std::cout << "[" << names[static_cast<int>(l)] << "] " << m << '\n';
            };
        }

        std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::devicelink::Logger::inst().log(::devicelink::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::devicelink::Logger::inst().log(::devicelink::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::devicelink::Logger::inst().log(::devicelink::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::devicelink::Logger::inst().log(::devicelink::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::devicelink::Logger::inst().log(::devicelink::LogLevel::Error, msg)
}
