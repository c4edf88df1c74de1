#include "easymcp/server/stdio_server.hpp"

#include "easymcp/logging.hpp"
#include "easymcp/util/json.hpp"

#include <iostream>
#include <string>

namespace easymcp::server
{

StdioServerWrapper::StdioServerWrapper(std::unique_ptr<mcp::Dispatcher> dispatcher)
    : StdioServerWrapper(std::move(dispatcher), std::cin, std::cout)
{
}

StdioServerWrapper::StdioServerWrapper(std::unique_ptr<mcp::Dispatcher> dispatcher,
                                       std::istream& in, std::ostream& out)
    : dispatcher_(std::move(dispatcher)), in_(in), out_(out)
{
    if (!dispatcher_)
        throw Error("stdio server requires a dispatcher");
}

void StdioServerWrapper::write_line(const Json& message)
{
    out_ << message.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_)
        throw TransportError("failed to write to stdout");
}

bool StdioServerWrapper::run()
{
    if (running_.exchange(true))
        return false;
    stop_requested_ = false;

    logging::info("serving MCP over stdio", "easymcp.stdio");

    std::string line;
    try
    {
        while (!stop_requested_ && std::getline(in_, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;

            auto message = util::json::try_parse(line);
            if (!message)
            {
                logging::warning("discarding malformed JSON line", "easymcp.stdio");
                write_line(mcp::jsonrpc_error(Json(), mcp::PARSE_ERROR, "Parse error",
                                              Json{{"kind", "ParseError"}}));
                continue;
            }

            if (auto response = dispatcher_->handle(*message))
                write_line(*response);
        }
    }
    catch (const TransportError&)
    {
        dispatcher_->close();
        running_ = false;
        throw;
    }

    dispatcher_->close();
    running_ = false;
    logging::info("stdin closed, stdio transport stopped", "easymcp.stdio");
    return true;
}

} // namespace easymcp::server
