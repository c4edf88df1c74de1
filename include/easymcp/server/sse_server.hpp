#pragma once
#include "easymcp/mcp/dispatcher.hpp"
#include "easymcp/server/session.hpp"
#include "easymcp/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace easymcp::server
{

/**
 * SSE (Server-Sent Events) MCP server wrapper.
 *
 * This transport implements the SSE protocol for MCP communication:
 * - GET sse_path: opens a session and streams JSON-RPC responses to the client.
 *   The first event is "endpoint", whose data is the URL to POST to
 *   (message_path?sessionId=<id>).
 * - POST message_path?sessionId=<id>: accepts one JSON-RPC message, answers
 *   202 Accepted and queues it on the session. The response arrives on the
 *   session's event stream.
 *
 * Every session gets its own Dispatcher (from the factory) and its own worker
 * thread, so a slow tool call in one session never holds up another. When a
 * client disconnects, or a keep-alive comment can no longer be written, the
 * session is closed and its in-flight invocations are cancelled.
 *
 * Usage:
 *   SseServerWrapper server([&] { return std::make_unique<mcp::Dispatcher>(registry, details); },
 *                           "127.0.0.1", 8000);
 *   server.start();  // Non-blocking - runs in background thread
 *   // ... server runs ...
 *   server.stop();   // Graceful shutdown
 */
class SseServerWrapper
{
  public:
    using DispatcherFactory = std::function<std::unique_ptr<mcp::Dispatcher>()>;

    /**
     * @param factory Creates the dispatcher for each new session
     * @param host Host address to bind to
     * @param port Port to listen on (0 picks a free port; see port())
     * @param sse_path Path for the SSE GET endpoint
     * @param message_path Path for the POST message endpoint
     * @param keep_alive Idle interval after which a keep-alive comment is sent
     */
    explicit SseServerWrapper(DispatcherFactory factory, std::string host = "127.0.0.1",
                              int port = 8000, std::string sse_path = "/sse",
                              std::string message_path = "/message",
                              std::chrono::milliseconds keep_alive = std::chrono::seconds(15));

    ~SseServerWrapper();

    /**
     * Bind and start serving in a background thread (non-blocking).
     *
     * @return false if already running or the address cannot be bound
     */
    bool start();

    /**
     * Stop the server, closing every session.
     *
     * Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Bound port (the chosen one when constructed with port 0)
    int port() const
    {
        return port_;
    }

    const std::string& host() const
    {
        return host_;
    }

    const std::string& sse_path() const
    {
        return sse_path_;
    }

    const std::string& message_path() const
    {
        return message_path_;
    }

    /// Number of open sessions
    size_t session_count() const;

    // Security limits
    static constexpr size_t MAX_CONNECTIONS = 100;
    static constexpr size_t MAX_QUEUE_SIZE = 1000;

  private:
    struct ConnectionState
    {
        std::string session_id;
        std::deque<Json> queue;
        std::mutex m;
        std::condition_variable cv;
        std::atomic<bool> alive{true};
        std::unique_ptr<Session> session;
    };

    void run_server();
    void handle_sse_connection(httplib::DataSink& sink, std::shared_ptr<ConnectionState> conn);
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void close_connection(const std::shared_ptr<ConnectionState>& conn);
    static bool push_event(ConnectionState& conn, const Json& event);
    std::string generate_session_id();

    DispatcherFactory factory_;
    std::string host_;
    int port_;
    std::string sse_path_;
    std::string message_path_;
    std::chrono::milliseconds keep_alive_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    // Active SSE connections mapped by session ID
    std::unordered_map<std::string, std::shared_ptr<ConnectionState>> connections_;
    mutable std::mutex conns_mutex_;
};

} // namespace easymcp::server
