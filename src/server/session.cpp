#include "easymcp/server/session.hpp"

#include "easymcp/logging.hpp"

namespace easymcp::server
{

namespace
{
const char* const LOGGER = "easymcp.session";
}

Session::Session(std::string session_id, std::unique_ptr<mcp::Dispatcher> dispatcher,
                 SendCallback send)
    : session_id_(std::move(session_id)), dispatcher_(std::move(dispatcher)),
      send_(std::move(send))
{
    if (!dispatcher_)
        throw Error("session requires a dispatcher");
    worker_ = std::thread([this]() { run(); });
}

Session::~Session()
{
    close();
    wait();
}

void Session::wait()
{
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

bool Session::enqueue(Json message)
{
    if (is_notification(message) && message["method"] == "notifications/cancelled")
    {
        const Json params = message.value("params", Json::object());
        if (params.is_object() && params.contains("requestId"))
            cancel_request(params["requestId"]);
        return !closed_.load();
    }

    std::optional<Json> duplicate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load() || inbox_.size() >= MAX_PENDING)
            return false;
        if (is_request(message))
        {
            auto inserted =
                pending_.emplace(correlation_key(message["id"]), executors::CancelToken());
            if (!inserted.second)
                duplicate = mcp::jsonrpc_error(message["id"], mcp::INVALID_REQUEST,
                                               "request id is already in use",
                                               Json{{"kind", "ProtocolSequenceError"}});
        }
        if (!duplicate)
            inbox_.push_back(std::move(message));
    }
    if (duplicate)
    {
        deliver(*duplicate);
        return true;
    }
    cv_.notify_one();
    return true;
}

void Session::close()
{
    if (closed_.exchange(true))
        return;

    std::deque<Json> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : pending_)
            kv.second.cancel();
        abandoned.swap(inbox_);
        for (const auto& msg : abandoned)
            if (is_request(msg))
                pending_.erase(correlation_key(msg["id"]));
    }
    dispatcher_->close();
    cv_.notify_all();

    for (const auto& msg : abandoned)
        if (is_request(msg))
            deliver(mcp::jsonrpc_error(msg["id"], mcp::INVALID_REQUEST, "session closed",
                                       Json{{"kind", "ProtocolSequenceError"}}));

    logging::debug("session " + session_id_ + " closed", LOGGER);
}

size_t Session::pending_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void Session::cancel_request(const Json& request_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(correlation_key(request_id));
    if (it != pending_.end())
    {
        it->second.cancel();
        logging::debug("session " + session_id_ + ": cancelled request " + request_id.dump(),
                       LOGGER);
    }
}

void Session::deliver(const Json& message)
{
    if (send_ && !send_(message))
        logging::debug("session " + session_id_ + ": dropped message, client gone", LOGGER);
}

void Session::run()
{
    while (true)
    {
        Json message;
        executors::CancelToken token;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return closed_.load() || !inbox_.empty(); });
            if (inbox_.empty())
                return;
            message = std::move(inbox_.front());
            inbox_.pop_front();
            if (is_request(message))
            {
                auto it = pending_.find(correlation_key(message["id"]));
                if (it != pending_.end())
                    token = it->second;
            }
        }

        std::optional<Json> response = dispatcher_->handle(message, token);

        if (is_request(message))
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(correlation_key(message["id"]));
        }
        if (response)
            deliver(*response);
    }
}

} // namespace easymcp::server
