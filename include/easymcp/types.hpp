#pragma once
#include <nlohmann/json.hpp>

#include <string>

namespace easymcp
{

using Json = nlohmann::json;

/// Kind of a declared tool. Decides which metadata block a tool carries and
/// which executor the registry binds to it.
enum class ToolKind
{
    Http,
    Command
};

enum class HttpMethod
{
    Get,
    Post,
    Put,
    Delete
};

enum class TransportType
{
    Stdio,
    Sse
};

inline std::string to_string(ToolKind kind)
{
    switch (kind)
    {
    case ToolKind::Http:
        return "HTTP";
    case ToolKind::Command:
        return "COMMAND";
    }
    return "HTTP";
}

inline std::string to_string(HttpMethod method)
{
    switch (method)
    {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Put:
        return "PUT";
    case HttpMethod::Delete:
        return "DELETE";
    }
    return "GET";
}

inline std::string to_string(TransportType type)
{
    switch (type)
    {
    case TransportType::Stdio:
        return "STDIO";
    case TransportType::Sse:
        return "SSE";
    }
    return "STDIO";
}

} // namespace easymcp
