#pragma once
#include "easymcp/exceptions.hpp"
#include "easymcp/executors/executor.hpp"
#include "easymcp/tools/registry.hpp"
#include "easymcp/types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace easymcp::mcp
{

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// JSON-RPC error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

enum class DispatcherState
{
    Uninitialized,
    Ready,
    Closed
};

inline std::string to_string(DispatcherState state)
{
    switch (state)
    {
    case DispatcherState::Uninitialized:
        return "Uninitialized";
    case DispatcherState::Ready:
        return "Ready";
    case DispatcherState::Closed:
        return "Closed";
    }
    return "Unknown";
}

/// What the server reports about itself in the initialize result.
struct ServerDetails
{
    std::string name{"easymcp"};
    std::string version;
    std::optional<std::string> instruction;
    /// Returned verbatim instead of {"tools":{}} when set
    std::optional<Json> capabilities;
};

/// Build a JSON-RPC error response. `data` is omitted when null.
Json jsonrpc_error(const Json& id, int code, const std::string& message,
                   const Json& data = Json());

/// JSON-RPC code for an error kind.
int error_code(const Error& e);

/// Error response for `e`, with data.kind and whatever diagnostics it carries.
Json error_response(const Json& id, const Error& e);

/// Turn an executor's output into an MCP CallToolResult.
Json make_call_tool_result(const Json& output, bool include_structured_content);

/**
 * MCP protocol state machine for one connection.
 *
 * Uninitialized accepts only "initialize" (and "ping"); Ready serves
 * tools/list and tools/call; Closed rejects everything. handle() returns the
 * response to send, or nullopt for notifications and client responses.
 *
 * handle() is meant to be driven by one thread at a time; close() may be
 * called from any thread.
 */
class Dispatcher
{
  public:
    Dispatcher(std::shared_ptr<const tools::ToolRegistry> registry, ServerDetails details);

    std::optional<Json> handle(const Json& message,
                               const executors::CancelToken& cancel = executors::CancelToken());

    void close();

    DispatcherState state() const
    {
        return state_.load();
    }

    const tools::ToolRegistry& registry() const
    {
        return *registry_;
    }

  private:
    Json handle_initialize(const Json& params);
    Json handle_tools_list() const;
    Json handle_tools_call(const Json& params, const executors::CancelToken& cancel) const;

    std::shared_ptr<const tools::ToolRegistry> registry_;
    ServerDetails details_;
    std::atomic<DispatcherState> state_{DispatcherState::Uninitialized};
};

} // namespace easymcp::mcp
