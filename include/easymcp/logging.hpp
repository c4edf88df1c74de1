#pragma once
#include <functional>
#include <string>

namespace easymcp::logging
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

/// Parses "DEBUG", "INFO", "WARNING"/"WARN" or "ERROR" (case-insensitive).
/// Unknown names fall back to Info.
LogLevel level_from_string(const std::string& name);

using LogSink = std::function<void(LogLevel, const std::string&, const std::string&)>;

void set_level(LogLevel level);
LogLevel level();

/// Replace the output sink (default writes one line per record to stderr).
/// Passing an empty function restores the default sink.
void set_sink(LogSink sink);

void log(LogLevel level, const std::string& message, const std::string& logger = "easymcp");

inline void debug(const std::string& message, const std::string& logger = "easymcp")
{
    log(LogLevel::Debug, message, logger);
}
inline void info(const std::string& message, const std::string& logger = "easymcp")
{
    log(LogLevel::Info, message, logger);
}
inline void warning(const std::string& message, const std::string& logger = "easymcp")
{
    log(LogLevel::Warning, message, logger);
}
inline void error(const std::string& message, const std::string& logger = "easymcp")
{
    log(LogLevel::Error, message, logger);
}

} // namespace easymcp::logging
