#pragma once
#include "easymcp/executors/executor.hpp"
#include "easymcp/tools/tool.hpp"
#include "easymcp/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace easymcp::config
{

struct SseConfig
{
    std::string host{"127.0.0.1"};
    int port{8000};
    std::string sse_path{"/sse"};
    std::string post_path{"/message"};
    std::chrono::milliseconds keep_alive{15000};
};

struct TransportConfig
{
    TransportType type{TransportType::Stdio};
    SseConfig sse;
};

struct ServerInfo
{
    std::string name{"easymcp"};
    std::string version;
};

/// Everything the server needs to start, loaded once.
struct ServerConfig
{
    std::vector<tools::ToolDefinition> tools;
    std::optional<std::string> instruction;
    ServerInfo server_info;
    std::optional<Json> capabilities;
    TransportConfig transport;
    executors::ExecutionOptions execution;
};

/// Longest duration any configuration field may hold.
constexpr std::chrono::milliseconds MAX_DURATION = std::chrono::hours(24 * 365);

/// An integer followed by one of ns, us, ms, s, m, h, d, w: "250ms", "15s",
/// "2m", "1d". Sub-millisecond values round up to whole milliseconds.
/// Throws ConfigError on anything else or above MAX_DURATION.
std::chrono::milliseconds parse_duration(const std::string& text);

/// Split "host:port"; "[::1]:8000" keeps the brackets off the host.
std::pair<std::string, int> parse_address(const std::string& address);

/**
 * Build a ServerConfig from a configuration document.
 *
 * Execution timeouts start from `defaults` (usually Settings::from_env()) and
 * are overridden by the document's "execution" block. Throws ConfigError
 * describing the first structural problem found.
 */
ServerConfig from_json(const Json& doc,
                       const executors::ExecutionOptions& defaults = executors::ExecutionOptions());

/// Read and parse a configuration file; see from_json.
ServerConfig load_config(const std::string& path,
                         const executors::ExecutionOptions& defaults = executors::ExecutionOptions());

} // namespace easymcp::config
