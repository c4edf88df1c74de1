#include "easymcp/server/sse_server.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <httplib.h>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using easymcp::Json;
using easymcp::server::SseServerWrapper;
using namespace std::chrono_literals;

namespace
{

std::shared_ptr<const easymcp::tools::ToolRegistry> make_registry()
{
    std::vector<easymcp::tools::ToolDefinition> defs;
    easymcp::tools::CommandMetadata slow;
    slow.command = "sh";
    slow.args = {"-c", "sleep \"$0\"; printf '%s' \"$1\"", "{ input.seconds }", "{ input.tag }"};
    defs.emplace_back("slow_echo", "Sleep, then echo a tag", slow);
    return std::make_shared<const easymcp::tools::ToolRegistry>(std::move(defs));
}

// Minimal SSE consumer: collects the endpoint, data events and keep-alive comments.
// httplib::Client is created inside the reader thread.
struct SseClient
{
    int port;
    std::thread thread;
    std::mutex m;
    std::condition_variable cv;
    std::string buffer;
    std::string endpoint;
    std::vector<Json> messages;
    int comments{0};
    std::atomic<bool> stop{false};
    std::atomic<bool> finished{false};

    explicit SseClient(int p) : port(p)
    {
        thread = std::thread(
            [this]()
            {
                httplib::Client cli("127.0.0.1", port);
                cli.set_connection_timeout(5s);
                cli.set_read_timeout(30s);
                cli.Get("/sse",
                        [this](const char* data, size_t len)
                        {
                            feed(std::string(data, len));
                            return !stop.load();
                        });
                finished = true;
                cv.notify_all();
            });
    }

    ~SseClient()
    {
        disconnect();
    }

    void disconnect()
    {
        stop = true;
        if (thread.joinable())
            thread.join();
    }

    void feed(const std::string& chunk)
    {
        std::lock_guard<std::mutex> lock(m);
        buffer += chunk;
        size_t pos;
        while ((pos = buffer.find("\n\n")) != std::string::npos)
        {
            std::string event = buffer.substr(0, pos);
            buffer.erase(0, pos + 2);
            if (event.rfind(":", 0) == 0)
            {
                ++comments;
                continue;
            }
            bool is_endpoint = event.rfind("event: endpoint", 0) == 0;
            auto data_pos = event.find("data: ");
            if (data_pos == std::string::npos)
                continue;
            std::string data = event.substr(data_pos + 6);
            if (is_endpoint)
                endpoint = data;
            else
                messages.push_back(Json::parse(data));
        }
        cv.notify_all();
    }

    bool wait_endpoint()
    {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, 10s, [&] { return !endpoint.empty(); });
    }

    bool wait_messages(size_t n, std::chrono::milliseconds timeout = 10s)
    {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, timeout, [&] { return messages.size() >= n; });
    }

    Json message(size_t i)
    {
        std::lock_guard<std::mutex> lock(m);
        return messages.at(i);
    }

    size_t message_count()
    {
        std::lock_guard<std::mutex> lock(m);
        return messages.size();
    }

    int post(const Json& body)
    {
        return post_raw(body.dump());
    }

    int post_raw(const std::string& body)
    {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(m);
            path = endpoint;
        }
        httplib::Client cli("127.0.0.1", port);
        cli.set_read_timeout(10s);
        auto res = cli.Post(path, body, "application/json");
        return res ? res->status : -1;
    }
};

Json request(int id, const std::string& method, const Json& params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

void initialize(SseClient& client)
{
    assert(client.wait_endpoint());
    assert(client.post(request(1, "initialize")) == 202);
    assert(client.wait_messages(1));
    assert(client.message(0)["id"] == 1);
    assert(client.message(0)["result"]["serverInfo"]["name"] == "sse-test");
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 10s)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

} // namespace

int main()
{
    auto registry = make_registry();
    easymcp::mcp::ServerDetails details;
    details.name = "sse-test";
    details.version = "1.0.0";

    SseServerWrapper server([registry, details]()
                            { return std::make_unique<easymcp::mcp::Dispatcher>(registry, details); },
                            "127.0.0.1", 0, "/sse", "/message", 200ms);
    if (!server.start())
    {
        std::cerr << "Failed to start SSE server\n";
        return 1;
    }
    assert(server.running());
    assert(server.port() > 0);
    std::cout << "Server started on port " << server.port() << "\n";

    // Test 1: endpoint event and initialize over the stream
    {
        SseClient client(server.port());
        assert(client.wait_endpoint());
        const std::string prefix = "/message?sessionId=";
        assert(client.endpoint.rfind(prefix, 0) == 0);
        std::string sid = client.endpoint.substr(prefix.size());
        assert(sid.size() == 32);
        assert(sid.find_first_not_of("0123456789abcdef") == std::string::npos);
        initialize(client);

        assert(client.post(request(2, "tools/list")) == 202);
        assert(client.wait_messages(2));
        assert(client.message(1)["result"]["tools"][0]["name"] == "slow_echo");
        std::cout << "[PASS] Test 1: endpoint event and initialize\n";
    }

    // Test 2: two sessions with slow calls each get only their own answer
    {
        SseClient a(server.port());
        SseClient b(server.port());
        initialize(a);
        initialize(b);
        assert(a.endpoint != b.endpoint);

        auto call = [](int id, const std::string& tag)
        {
            return request(id, "tools/call",
                           Json{{"name", "slow_echo"},
                                {"arguments", {{"seconds", "1"}, {"tag", tag}}}});
        };

        auto start = std::chrono::steady_clock::now();
        assert(a.post(call(7, "from-a")) == 202);
        assert(b.post(call(7, "from-b")) == 202);
        // POST returns before the tool finishes
        assert(std::chrono::steady_clock::now() - start < 900ms);

        assert(a.wait_messages(2));
        assert(b.wait_messages(2));
        auto elapsed = std::chrono::steady_clock::now() - start;
        // ran side by side, not one after the other
        assert(elapsed < 1900ms);

        assert(a.message(1)["id"] == 7);
        assert(a.message(1)["result"]["content"][0]["text"] == "from-a");
        assert(b.message(1)["id"] == 7);
        assert(b.message(1)["result"]["content"][0]["text"] == "from-b");

        std::this_thread::sleep_for(300ms);
        assert(a.message_count() == 2);
        assert(b.message_count() == 2);
        std::cout << "[PASS] Test 2: concurrent sessions are isolated\n";
    }

    // Test 3: HTTP level errors
    {
        httplib::Client cli("127.0.0.1", server.port());
        cli.set_read_timeout(5s);

        auto no_session = cli.Post("/message", request(1, "ping").dump(), "application/json");
        assert(no_session && no_session->status == 400);

        auto bad_session = cli.Post("/message?sessionId=deadbeef", request(1, "ping").dump(),
                                    "application/json");
        assert(bad_session && bad_session->status == 404);

        auto post_sse = cli.Post("/sse", "{}", "application/json");
        assert(post_sse && post_sse->status == 405);

        SseClient client(server.port());
        assert(client.wait_endpoint());
        assert(client.post_raw("{broken") == 400);
        // the legacy parameter name is accepted too
        std::string legacy = client.endpoint;
        legacy.replace(legacy.find("sessionId"), 9, "session_id");
        auto ok = cli.Post(legacy, request(3, "ping").dump(), "application/json");
        assert(ok && ok->status == 202);
        assert(client.wait_messages(1));
        assert(client.message(0)["id"] == 3);
        std::cout << "[PASS] Test 3: HTTP errors\n";
    }

    // Test 4: idle streams get keep-alive comments
    {
        SseClient client(server.port());
        assert(client.wait_endpoint());
        assert(eventually(
            [&]()
            {
                std::lock_guard<std::mutex> lock(client.m);
                return client.comments >= 2;
            },
            5s));
        std::cout << "[PASS] Test 4: keep-alive\n";
    }

    // Test 5: a dropped client is cleaned up and its running call cancelled
    {
        assert(eventually([&]() { return server.session_count() == 0; }));
        auto client = std::make_unique<SseClient>(server.port());
        initialize(*client);
        assert(server.session_count() == 1);
        assert(client->post(request(2, "tools/call",
                                    Json{{"name", "slow_echo"},
                                         {"arguments", {{"seconds", "30"}, {"tag", "x"}}}})) ==
               202);
        std::this_thread::sleep_for(200ms);

        auto start = std::chrono::steady_clock::now();
        client->disconnect();
        client.reset();
        assert(eventually([&]() { return server.session_count() == 0; }));
        assert(std::chrono::steady_clock::now() - start < 10s);
        std::cout << "[PASS] Test 5: disconnect cleanup\n";
    }

    server.stop();
    assert(!server.running());
    server.stop(); // idempotent

    std::cout << "\nAll SSE server tests passed!\n";
    return 0;
}
