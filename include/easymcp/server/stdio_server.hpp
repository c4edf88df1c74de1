#pragma once
#include "easymcp/mcp/dispatcher.hpp"
#include "easymcp/types.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>

namespace easymcp::server
{

/**
 * STDIO-based MCP server for line-delimited JSON-RPC communication.
 *
 * Reads one JSON-RPC message per line from the input stream, hands it to the
 * dispatcher and writes the response (if any) as one line to the output
 * stream. Requests are handled strictly one after another. Lines that are not
 * valid JSON get a -32700 parse error response.
 *
 * Usage:
 *   StdioServerWrapper server(std::make_unique<mcp::Dispatcher>(registry, details));
 *   server.run();  // Blocking - runs until EOF on stdin
 *
 * Streams default to std::cin/std::cout; tests pass string streams.
 */
class StdioServerWrapper
{
  public:
    explicit StdioServerWrapper(std::unique_ptr<mcp::Dispatcher> dispatcher);
    StdioServerWrapper(std::unique_ptr<mcp::Dispatcher> dispatcher, std::istream& in,
                       std::ostream& out);

    /**
     * Serve until EOF or stop().
     *
     * On return the dispatcher is closed. Throws TransportError when stdout
     * can no longer be written.
     *
     * @return false if already running
     */
    bool run();

    /// Ask run() to return after the message it is currently handling.
    void stop()
    {
        stop_requested_ = true;
    }

    bool running() const
    {
        return running_.load();
    }

    const mcp::Dispatcher& dispatcher() const
    {
        return *dispatcher_;
    }

  private:
    void write_line(const Json& message);

    std::unique_ptr<mcp::Dispatcher> dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace easymcp::server
