#include "easymcp/config.hpp"
#include "easymcp/exceptions.hpp"
#include "easymcp/logging.hpp"
#include "easymcp/mcp/dispatcher.hpp"
#include "easymcp/server/sse_server.hpp"
#include "easymcp/server/stdio_server.hpp"
#include "easymcp/settings.hpp"
#include "easymcp/tools/registry.hpp"
#include "easymcp/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_shutdown{false};

void on_shutdown_signal(int)
{
    g_shutdown = true;
}

static int usage(int exit_code = 1)
{
    auto& os = exit_code == 0 ? std::cout : std::cerr;
    os << "easymcp " << easymcp::VERSION_STRING << "\n";
    os << "Usage:\n";
    os << "  easymcp -f <config.json>\n";
    os << "  easymcp --file_path <config.json>\n";
    os << "  easymcp --help\n";
    os << "  easymcp --version\n";
    os << "\n";
    os << "Environment:\n";
    os << "  EASYMCP_LOG_LEVEL            DEBUG, INFO, WARNING or ERROR (default INFO)\n";
    os << "  EASYMCP_COMMAND_TIMEOUT_MS   default command tool timeout (default 30000)\n";
    os << "  EASYMCP_HTTP_TIMEOUT_MS      default HTTP tool timeout (default 30000)\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int run_stdio(std::shared_ptr<const easymcp::tools::ToolRegistry> registry,
                     const easymcp::mcp::ServerDetails& details)
{
    easymcp::server::StdioServerWrapper server(
        std::make_unique<easymcp::mcp::Dispatcher>(std::move(registry), details));
    server.run();
    return 0;
}

static int run_sse(std::shared_ptr<const easymcp::tools::ToolRegistry> registry,
                   const easymcp::mcp::ServerDetails& details,
                   const easymcp::config::SseConfig& sse)
{
    easymcp::server::SseServerWrapper server(
        [registry, details]()
        { return std::make_unique<easymcp::mcp::Dispatcher>(registry, details); },
        sse.host, sse.port, sse.sse_path, sse.post_path, sse.keep_alive);

    if (!server.start())
        throw easymcp::TransportError("cannot listen on " + sse.host + ":" +
                                      std::to_string(sse.port));

    std::signal(SIGINT, on_shutdown_signal);
    std::signal(SIGTERM, on_shutdown_signal);

    while (!g_shutdown && server.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    easymcp::logging::info("shutting down", "easymcp.cli");
    server.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version") || consume_flag(args, "-V"))
    {
        std::cout << "easymcp " << easymcp::VERSION_STRING << "\n";
        return 0;
    }

    auto path = consume_flag_value(args, "-f");
    if (!path)
        path = consume_flag_value(args, "--file_path");
    if (!path)
        return usage();
    if (!args.empty())
    {
        std::cerr << "Error: unexpected argument '" << args.front() << "'\n";
        return usage();
    }

    // Tool children and dropped clients must surface as write errors
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        auto settings = easymcp::Settings::from_env();
        easymcp::logging::set_level(easymcp::logging::level_from_string(settings.log_level));

        easymcp::executors::ExecutionOptions defaults;
        defaults.command_timeout = settings.command_timeout;
        defaults.http_timeout = settings.http_timeout;

        auto cfg = easymcp::config::load_config(*path, defaults);

        auto registry =
            std::make_shared<const easymcp::tools::ToolRegistry>(std::move(cfg.tools),
                                                                 cfg.execution);
        easymcp::logging::info("loaded " + std::to_string(registry->size()) + " tool(s) from " +
                                   *path,
                               "easymcp.cli");

        easymcp::mcp::ServerDetails details;
        details.name = cfg.server_info.name;
        details.version = cfg.server_info.version;
        details.instruction = cfg.instruction;
        details.capabilities = cfg.capabilities;

        if (cfg.transport.type == easymcp::TransportType::Sse)
            return run_sse(registry, details, cfg.transport.sse);
        return run_stdio(registry, details);
    }
    catch (const easymcp::ConfigError& e)
    {
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
