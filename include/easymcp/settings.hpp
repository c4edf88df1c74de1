#pragma once
#include "easymcp/types.hpp"

#include <chrono>
#include <string>

namespace easymcp
{

struct Settings
{
    std::string log_level{"INFO"};
    std::chrono::milliseconds command_timeout{30000};
    std::chrono::milliseconds http_timeout{30000};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace easymcp
