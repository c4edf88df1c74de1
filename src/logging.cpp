#include "easymcp/logging.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace easymcp::logging
{

namespace
{
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_mutex;
LogSink g_sink;

std::string to_iso8601_now()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
} // namespace

LogLevel level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

void set_level(LogLevel level)
{
    g_level = level;
}

LogLevel level()
{
    return g_level.load();
}

void set_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = std::move(sink);
}

void log(LogLevel level, const std::string& message, const std::string& logger)
{
    if (static_cast<int>(level) < static_cast<int>(g_level.load()))
        return;

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_sink)
    {
        g_sink(level, message, logger);
        return;
    }
    // stdout carries the STDIO protocol, so records always go to stderr
    std::cerr << to_iso8601_now() << " " << to_string(level) << " [" << logger << "] "
              << message << std::endl;
}

} // namespace easymcp::logging
