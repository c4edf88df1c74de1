/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main easymcp.hpp header
///
/// This test verifies that including just <easymcp.hpp> is enough to load a
/// configuration document and serve it over STDIO.

#include "easymcp.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace easymcp;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_config_to_stdio_server..." << std::endl;
    {
        auto cfg = config::from_json(Json::parse(R"({
            "server_info": {"name": "umbrella", "version": "0.0.1"},
            "tools": [{
                "name": "greet",
                "description": "Say hello",
                "tool_type": "COMMAND",
                "command_metadata": {"command": "printf", "args": ["hello %s", "{ input.who }"]}
            }]
        })"));
        auto registry =
            std::make_shared<const tools::ToolRegistry>(std::move(cfg.tools), cfg.execution);

        mcp::ServerDetails details;
        details.name = cfg.server_info.name;
        details.version = cfg.server_info.version;

        std::istringstream in(
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
            "\n"
            R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
            "\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"greet","arguments":{"who":"world"}}})"
            "\n");
        std::ostringstream out;
        server::StdioServerWrapper server(std::make_unique<mcp::Dispatcher>(registry, details), in,
                                          out);
        assert(server.run());

        std::istringstream lines(out.str());
        std::string line;
        std::getline(lines, line);
        auto init = util::json::parse(line);
        assert(init["result"]["serverInfo"]["name"] == "umbrella");
        std::getline(lines, line);
        auto call = util::json::parse(line);
        assert(call["id"] == 2);
        assert(call["result"]["content"][0]["text"] == "hello world");
        assert(!std::getline(lines, line));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_version_string..." << std::endl;
    {
        assert(std::string(VERSION_STRING).size() > 0);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\nAll main header tests passed!" << std::endl;
    return 0;
}
