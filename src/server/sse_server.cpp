#include "easymcp/server/sse_server.hpp"

#include "easymcp/exceptions.hpp"
#include "easymcp/logging.hpp"
#include "easymcp/util/json.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace easymcp::server
{

namespace
{

const char* const LOGGER = "easymcp.sse";

void set_json_error(httplib::Response& res, int status, const std::string& message)
{
    res.status = status;
    res.set_content(Json{{"error", message}}.dump(), "application/json");
}

} // namespace

SseServerWrapper::SseServerWrapper(DispatcherFactory factory, std::string host, int port,
                                   std::string sse_path, std::string message_path,
                                   std::chrono::milliseconds keep_alive)
    : factory_(std::move(factory)), host_(std::move(host)), port_(port),
      sse_path_(std::move(sse_path)), message_path_(std::move(message_path)),
      keep_alive_(keep_alive)
{
    if (!factory_)
        throw Error("SSE server requires a dispatcher factory");
}

SseServerWrapper::~SseServerWrapper()
{
    stop();
}

std::string SseServerWrapper::generate_session_id()
{
    // 128 random bits as 32 hex chars
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

size_t SseServerWrapper::session_count() const
{
    std::lock_guard<std::mutex> lock(conns_mutex_);
    return connections_.size();
}

bool SseServerWrapper::push_event(ConnectionState& conn, const Json& event)
{
    if (!conn.alive)
        return false;
    {
        std::lock_guard<std::mutex> ql(conn.m);
        if (conn.queue.size() >= MAX_QUEUE_SIZE)
        {
            // Drop oldest event when queue is full
            conn.queue.pop_front();
            logging::warning("session " + conn.session_id + ": outbound queue full, dropped event",
                             LOGGER);
        }
        conn.queue.push_back(event);
    }
    conn.cv.notify_one();
    return true;
}

void SseServerWrapper::close_connection(const std::shared_ptr<ConnectionState>& conn)
{
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        auto it = connections_.find(conn->session_id);
        if (it != connections_.end() && it->second == conn)
            connections_.erase(it);
    }
    conn->alive = false;
    conn->cv.notify_all();
    // Outside conns_mutex_: waiting for the worker can take as long as a cancelled tool
    // needs to unwind
    conn->session->close();
    conn->session->wait();
    logging::info("session " + conn->session_id + " disconnected", LOGGER);
}

void SseServerWrapper::handle_sse_connection(httplib::DataSink& sink,
                                             std::shared_ptr<ConnectionState> conn)
{
    // Send MCP endpoint event with session ID (per MCP SSE protocol)
    std::string endpoint_path = message_path_ + "?sessionId=" + conn->session_id;
    std::string endpoint_evt = "event: endpoint\ndata: " + endpoint_path + "\n\n";
    if (!sink.write(endpoint_evt.data(), endpoint_evt.size()))
    {
        conn->alive = false;
        return;
    }

    auto last_write = std::chrono::steady_clock::now();

    while (running_ && conn->alive)
    {
        std::unique_lock<std::mutex> lock(conn->m);
        // Wait for events on this connection or shutdown
        conn->cv.wait_for(lock, std::chrono::milliseconds(100),
                          [&] { return !conn->queue.empty() || !running_ || !conn->alive; });

        if (!running_ || !conn->alive)
            break;

        while (!conn->queue.empty())
        {
            auto event = std::move(conn->queue.front());
            conn->queue.pop_front();

            // Release lock while writing to avoid blocking the session worker
            lock.unlock();

            std::string sse_data =
                "data: " + event.dump(-1, ' ', false, Json::error_handler_t::replace) + "\n\n";
            if (!sink.write(sse_data.data(), sse_data.size()))
            {
                conn->alive = false;
                return;
            }

            lock.lock();
            last_write = std::chrono::steady_clock::now();
        }
        lock.unlock();

        auto now = std::chrono::steady_clock::now();
        if (now - last_write >= keep_alive_)
        {
            static const std::string ping = ": keep-alive\n\n";
            if (!sink.is_writable() || !sink.write(ping.data(), ping.size()))
            {
                logging::debug("session " + conn->session_id + ": keep-alive write failed",
                               LOGGER);
                conn->alive = false;
                return;
            }
            last_write = now;
        }
    }
    conn->alive = false;
}

void SseServerWrapper::handle_post(const httplib::Request& req, httplib::Response& res)
{
    std::string session_id;
    if (req.has_param("sessionId"))
        session_id = req.get_param_value("sessionId");
    else if (req.has_param("session_id"))
        session_id = req.get_param_value("session_id");
    if (session_id.empty())
    {
        set_json_error(res, 400, "sessionId parameter required");
        return;
    }

    std::shared_ptr<ConnectionState> conn;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        auto it = connections_.find(session_id);
        if (it != connections_.end())
            conn = it->second;
    }
    if (!conn || !conn->alive)
    {
        set_json_error(res, 404, "Invalid or expired sessionId");
        return;
    }

    auto message = util::json::try_parse(req.body);
    if (!message)
    {
        res.status = 400;
        res.set_content(mcp::jsonrpc_error(Json(), mcp::PARSE_ERROR, "Parse error",
                                           Json{{"kind", "ParseError"}})
                            .dump(),
                        "application/json");
        return;
    }

    if (!conn->session->enqueue(std::move(*message)))
    {
        if (conn->session->closed())
            set_json_error(res, 404, "Invalid or expired sessionId");
        else
            set_json_error(res, 503, "Session backlog full");
        return;
    }

    res.status = 202;
    res.set_content("Accepted", "text/plain");
}

void SseServerWrapper::run_server()
{
    // Routes are already set up and the socket is bound
    if (!svr_->listen_after_bind())
        logging::error("SSE listener on " + host_ + ":" + std::to_string(port_) + " failed",
                       LOGGER);
    running_ = false;
}

bool SseServerWrapper::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();

    // Every open stream occupies a worker; leave room for POSTs at the cap
    svr_->new_task_queue = [] { return new httplib::ThreadPool(MAX_CONNECTIONS + 16); };

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    svr_->Get(sse_path_,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  auto conn = std::make_shared<ConnectionState>();
                  conn->session_id = generate_session_id();
                  std::weak_ptr<ConnectionState> weak_conn = conn;

                  {
                      std::lock_guard<std::mutex> lock(conns_mutex_);
                      if (connections_.size() >= MAX_CONNECTIONS)
                      {
                          set_json_error(res, 503, "Maximum connections reached");
                          return;
                      }
                      conn->session = std::make_unique<Session>(
                          conn->session_id, factory_(),
                          [weak_conn](const Json& msg)
                          {
                              if (auto c = weak_conn.lock())
                                  return push_event(*c, msg);
                              return false;
                          });
                      connections_[conn->session_id] = conn;
                  }
                  logging::info("session " + conn->session_id + " connected", LOGGER);

                  res.status = 200;
                  res.set_header("Cache-Control", "no-cache, no-transform");
                  res.set_header("Connection", "keep-alive");
                  res.set_header("X-Accel-Buffering", "no");

                  res.set_chunked_content_provider(
                      "text/event-stream",
                      [this, conn](size_t /*offset*/, httplib::DataSink& sink)
                      {
                          handle_sse_connection(sink, conn);
                          return false; // End stream when handle_sse_connection returns
                      },
                      [this, conn](bool) { close_connection(conn); });
              });

    // The SSE endpoint only streams
    svr_->Post(sse_path_,
               [](const httplib::Request&, httplib::Response& res)
               {
                   res.set_header("Allow", "GET");
                   set_json_error(res, 405, "Method Not Allowed");
               });

    svr_->Post(message_path_,
               [this](const httplib::Request& req, httplib::Response& res)
               { handle_post(req, res); });

    if (port_ == 0)
    {
        port_ = svr_->bind_to_any_port(host_);
        if (port_ < 0)
        {
            port_ = 0;
            return false;
        }
    }
    else if (!svr_->bind_to_port(host_, port_))
    {
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() { run_server(); });

    logging::info("SSE server listening on " + host_ + ":" + std::to_string(port_) + " (stream " +
                      sse_path_ + ", messages " + message_path_ + ")",
                  LOGGER);
    return true;
}

void SseServerWrapper::stop()
{
    // Graceful, idempotent shutdown
    running_ = false;

    std::vector<std::shared_ptr<ConnectionState>> open;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto& [session_id, conn] : connections_)
            open.push_back(conn);
    }
    for (auto& conn : open)
    {
        conn->alive = false;
        conn->cv.notify_all();
        conn->session->close();
    }

    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
}

} // namespace easymcp::server
