#pragma once
#include "easymcp/executors/executor.hpp"
#include "easymcp/mcp/dispatcher.hpp"
#include "easymcp/types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace easymcp::server
{

/// Delivers one outbound message; returns false once the client is gone.
using SendCallback = std::function<bool(const Json&)>;

/**
 * One connected client of a multi-session transport.
 *
 * Owns the client's Dispatcher and a worker thread that handles queued
 * messages in arrival order, so a slow tool call only ever delays its own
 * session. Every queued or running request is tracked in a correlation map
 * (request id -> cancel token).
 *
 * close() cancels every in-flight invocation, answers requests that never
 * started with a "session closed" error and closes the dispatcher. The
 * destructor closes and joins the worker.
 *
 * Thread-safe: enqueue() and close() may be called from any thread.
 */
class Session
{
  public:
    static constexpr size_t MAX_PENDING = 1000;

    Session(std::string session_id, std::unique_ptr<mcp::Dispatcher> dispatcher,
            SendCallback send);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& session_id() const
    {
        return session_id_;
    }

    /**
     * Queue a client message for the worker.
     *
     * "notifications/cancelled" is applied immediately instead of queued.
     * Returns false when the session is closed or its backlog is full.
     */
    bool enqueue(Json message);

    void close();

    /// Block until the worker has finished its current message and exited.
    /// Call close() first.
    void wait();

    bool closed() const
    {
        return closed_.load();
    }

    /// Requests queued or running
    size_t pending_count() const;

    mcp::DispatcherState state() const
    {
        return dispatcher_->state();
    }

    static bool is_request(const Json& msg)
    {
        return msg.is_object() && msg.contains("id") && msg.contains("method");
    }

    static bool is_notification(const Json& msg)
    {
        return msg.is_object() && msg.contains("method") && !msg.contains("id");
    }

  private:
    void run();
    void cancel_request(const Json& request_id);
    void deliver(const Json& message);

    static std::string correlation_key(const Json& id)
    {
        return id.dump();
    }

    std::string session_id_;
    std::unique_ptr<mcp::Dispatcher> dispatcher_;
    SendCallback send_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Json> inbox_;
    std::unordered_map<std::string, executors::CancelToken> pending_;
    std::atomic<bool> closed_{false};

    std::mutex join_mutex_;
    std::thread worker_;
};

} // namespace easymcp::server
