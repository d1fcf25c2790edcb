/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace mediarun {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Parses "error", "warn", "info", "debug", "trace" (any case); INFO otherwise.
    [[nodiscard]] static LogLevel parseLevel(const std::string& text) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
void clearThreadName();

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::mediarun::Logger::error(msg)
#define LOG_WARN(msg)  ::mediarun::Logger::warn(msg)  
#define LOG_INFO(msg)  ::mediarun::Logger::info(msg)
#define LOG_DEBUG(msg) ::mediarun::Logger::debug(msg)
#define LOG_TRACE(msg) ::mediarun::Logger::trace(msg)
