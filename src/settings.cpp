#include "easymcp/settings.hpp"

#include "easymcp/config.hpp"
#include "easymcp/exceptions.hpp"

#include <algorithm>
#include <cstdlib>

namespace easymcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    char* end = nullptr;
    long long ms = std::strtoll(v, &end, 10);
    if (end == v || *end != '\0' || ms <= 0 || ms > config::MAX_DURATION.count())
        throw ConfigError(std::string("invalid value for ") + key + ": " + v);
    return std::chrono::milliseconds(ms);
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("EASYMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.command_timeout = getenv_ms("EASYMCP_COMMAND_TIMEOUT_MS", s.command_timeout);
    s.http_timeout = getenv_ms("EASYMCP_HTTP_TIMEOUT_MS", s.http_timeout);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("command_timeout_ms"))
        s.command_timeout = std::chrono::milliseconds(j.at("command_timeout_ms").get<long long>());
    if (j.contains("http_timeout_ms"))
        s.http_timeout = std::chrono::milliseconds(j.at("http_timeout_ms").get<long long>());
    return s;
}

} // namespace easymcp
