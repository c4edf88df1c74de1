#pragma once

/// @file easymcp.hpp
/// @brief Main header for easymcp - includes every public component
///
/// Usage:
/// @code
/// #include <easymcp.hpp>
///
/// int main() {
///     auto cfg = easymcp::config::load_config("tools.json");
///     auto registry = std::make_shared<const easymcp::tools::ToolRegistry>(
///         std::move(cfg.tools), cfg.execution);
///     easymcp::server::StdioServerWrapper server(
///         std::make_unique<easymcp::mcp::Dispatcher>(registry, easymcp::mcp::ServerDetails{}));
///     server.run();
/// }
/// @endcode

#include "easymcp/config.hpp"
#include "easymcp/exceptions.hpp"
#include "easymcp/executors/command_executor.hpp"
#include "easymcp/executors/executor.hpp"
#include "easymcp/executors/http_executor.hpp"
#include "easymcp/logging.hpp"
#include "easymcp/mcp/dispatcher.hpp"
#include "easymcp/server/session.hpp"
#include "easymcp/server/sse_server.hpp"
#include "easymcp/server/stdio_server.hpp"
#include "easymcp/settings.hpp"
#include "easymcp/templating/formatter.hpp"
#include "easymcp/templating/template.hpp"
#include "easymcp/tools/registry.hpp"
#include "easymcp/tools/tool.hpp"
#include "easymcp/types.hpp"
#include "easymcp/util/json.hpp"
#include "easymcp/util/json_schema.hpp"
#include "easymcp/version.hpp"
