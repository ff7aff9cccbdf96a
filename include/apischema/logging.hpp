#pragma once

#include <functional>
#include <string>

namespace apischema::logging
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Case-insensitive. "WARN" is accepted for Warning; anything unknown maps to Info.
LogLevel log_level_from_string(const std::string& s);

using LogCallback = std::function<void(LogLevel, const std::string&, const std::string&)>;

/// Install a process-wide sink. An empty callback restores the stderr sink.
void set_log_callback(LogCallback callback);
void set_level(LogLevel level);
LogLevel level();

void log(LogLevel level, const std::string& message, const std::string& logger = "apischema");

inline void debug(const std::string& message, const std::string& logger = "apischema")
{
    log(LogLevel::Debug, message, logger);
}

inline void info(const std::string& message, const std::string& logger = "apischema")
{
    log(LogLevel::Info, message, logger);
}

inline void warning(const std::string& message, const std::string& logger = "apischema")
{
    log(LogLevel::Warning, message, logger);
}

inline void error(const std::string& message, const std::string& logger = "apischema")
{
    log(LogLevel::Error, message, logger);
}

} // namespace apischema::logging
