/// @file dispatcher.cpp
/// @brief Protocol state machine, tool listing and tool calls

#include "easymcp/mcp/dispatcher.hpp"

#include <cassert>
#include <cstdio>
#include <iostream>
#include <unistd.h>

using namespace easymcp;
using namespace easymcp::mcp;

static std::string g_marker;

static std::shared_ptr<const tools::ToolRegistry> make_registry()
{
    std::vector<tools::ToolDefinition> defs;

    tools::CommandMetadata echo;
    echo.command = "echo";
    echo.args = {"-n", "{ input.msg }"};
    defs.emplace_back("echo", "Echo a message", echo,
                      Json{{"type", "object"},
                           {"required", Json::array({"msg"})},
                           {"properties", {{"msg", Json{{"type", "string"}}}}}},
                      Json(), Json{{"readOnlyHint", true}});

    tools::CommandMetadata sum;
    sum.command = "sh";
    sum.args = {"-c", "echo \"{\\\"sum\\\": $(({ input.a } + { input.b }))}\""};
    defs.emplace_back("sum", "", sum, Json(),
                      Json{{"type", "object"}, {"properties", {{"sum", Json{{"type", "integer"}}}}}});

    tools::CommandMetadata count;
    count.command = "printf";
    count.args = {"3"};
    defs.emplace_back("count", "Always three", count, Json(), Json{{"type", "integer"}});

    tools::CommandMetadata touch;
    touch.command = "touch";
    touch.args = {g_marker};
    defs.emplace_back("touch_marker", "Creates a marker file", touch);

    tools::CommandMetadata fail;
    fail.command = "sh";
    fail.args = {"-c", "echo broken >&2; exit 2"};
    defs.emplace_back("fail", "Always fails", fail);

    return std::make_shared<const tools::ToolRegistry>(std::move(defs));
}

static Json request(int id, const std::string& method, const Json& params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

static Json initialize_request(int id = 1)
{
    return request(id, "initialize",
                   Json{{"protocolVersion", PROTOCOL_VERSION},
                        {"capabilities", Json::object()},
                        {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}});
}

static Json call(Dispatcher& d, int id, const std::string& tool, const Json& args)
{
    auto resp = d.handle(request(id, "tools/call", Json{{"name", tool}, {"arguments", args}}));
    assert(resp);
    assert((*resp)["id"] == id);
    return *resp;
}

static ServerDetails details()
{
    ServerDetails d;
    d.name = "test-server";
    d.version = "9.9.9";
    d.instruction = "use the tools";
    return d;
}

void test_initialize_handshake()
{
    std::cout << "  test_initialize_handshake... " << std::flush;
    Dispatcher d(make_registry(), details());
    assert(d.state() == DispatcherState::Uninitialized);

    auto resp = d.handle(initialize_request());
    assert(resp);
    const auto& result = (*resp)["result"];
    assert(result["protocolVersion"] == PROTOCOL_VERSION);
    assert(result["capabilities"] == Json({{"tools", Json::object()}}));
    assert(result["serverInfo"]["name"] == "test-server");
    assert(result["serverInfo"]["version"] == "9.9.9");
    assert(result["instructions"] == "use the tools");
    assert(d.state() == DispatcherState::Ready);

    // The initialized notification gets no answer
    auto note = d.handle(Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    assert(!note);
    std::cout << "PASSED\n";
}

void test_capabilities_override()
{
    std::cout << "  test_capabilities_override... " << std::flush;
    auto det = details();
    det.capabilities = Json{{"tools", {{"listChanged", false}}}, {"logging", Json::object()}};
    det.instruction.reset();
    Dispatcher d(make_registry(), det);
    auto resp = d.handle(initialize_request());
    assert((*resp)["result"]["capabilities"] == *det.capabilities);
    assert(!(*resp)["result"].contains("instructions"));
    std::cout << "PASSED\n";
}

void test_requests_before_initialize()
{
    std::cout << "  test_requests_before_initialize... " << std::flush;
    Dispatcher d(make_registry(), details());
    for (const char* method : {"tools/list", "tools/call", "resources/list"})
    {
        auto resp = d.handle(request(5, method));
        assert(resp);
        assert((*resp)["error"]["code"] == INVALID_REQUEST);
        assert((*resp)["error"]["data"]["kind"] == "ProtocolSequenceError");
        assert((*resp)["id"] == 5);
    }
    // ping is fine in any open state
    auto ping = d.handle(request(6, "ping"));
    assert((*ping)["result"] == Json::object());
    assert(d.state() == DispatcherState::Uninitialized);
    std::cout << "PASSED\n";
}

void test_initialize_with_odd_client_info()
{
    std::cout << "  test_initialize_with_odd_client_info... " << std::flush;
    Dispatcher d(make_registry(), details());
    auto resp = d.handle(request(1, "initialize",
                                 Json{{"clientInfo", {{"name", 5}, {"version", Json::array()}}}}));
    assert(resp);
    assert(!resp->contains("error"));
    assert((*resp)["result"]["serverInfo"]["name"] == "test-server");
    assert(d.state() == DispatcherState::Ready);

    // clientInfo that is not an object is ignored as well
    Dispatcher d2(make_registry(), details());
    auto resp2 = d2.handle(request(1, "initialize", Json{{"clientInfo", "cli"}}));
    assert((*resp2)["result"]["protocolVersion"] == PROTOCOL_VERSION);
    assert(d2.state() == DispatcherState::Ready);

    // the session is usable right away
    auto listed = d.handle(request(2, "tools/list"));
    assert((*listed)["result"]["tools"].size() == 5);
    std::cout << "PASSED\n";
}

void test_repeated_initialize()
{
    std::cout << "  test_repeated_initialize... " << std::flush;
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request(1));
    auto again = d.handle(initialize_request(2));
    assert((*again)["error"]["code"] == INVALID_REQUEST);
    assert((*again)["error"]["data"]["kind"] == "ProtocolSequenceError");
    assert(d.state() == DispatcherState::Ready);
    std::cout << "PASSED\n";
}

void test_closed_rejects_everything()
{
    std::cout << "  test_closed_rejects_everything... " << std::flush;
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request());
    d.close();
    assert(d.state() == DispatcherState::Closed);
    for (const char* method : {"tools/list", "ping", "initialize"})
    {
        auto resp = d.handle(request(3, method));
        assert((*resp)["error"]["data"]["kind"] == "ProtocolSequenceError");
    }
    std::cout << "PASSED\n";
}

void test_tools_list()
{
    std::cout << "  test_tools_list... " << std::flush;
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request());
    auto resp = d.handle(request(2, "tools/list"));
    const auto& tools = (*resp)["result"]["tools"];
    assert(tools.size() == 5);
    assert(tools[0]["name"] == "echo");
    assert(tools[0]["description"] == "Echo a message");
    assert(tools[0]["inputSchema"]["required"][0] == "msg");
    assert(tools[0]["annotations"]["readOnlyHint"] == true);
    assert(!tools[0].contains("outputSchema"));
    assert(tools[1]["name"] == "sum");
    assert(!tools[1].contains("description"));
    assert(tools[1]["inputSchema"] == Json({{"type", "object"}}));
    assert(tools[1]["outputSchema"]["type"] == "object");
    assert(tools[4]["name"] == "fail");
    std::cout << "PASSED\n";
}

void test_tools_call_success()
{
    std::cout << "  test_tools_call_success... " << std::flush;
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request());

    auto echo = call(d, 10, "echo", Json{{"msg", "hi there"}});
    const auto& result = echo["result"];
    assert(result["isError"] == false);
    assert(result["content"].size() == 1);
    assert(result["content"][0]["type"] == "text");
    assert(result["content"][0]["text"] == "hi there");
    assert(!result.contains("structuredContent"));

    auto sum = call(d, 11, "sum", Json{{"a", 2}, {"b", 3}});
    assert(sum["result"]["structuredContent"]["sum"] == 5);
    assert(Json::parse(sum["result"]["content"][0]["text"].get<std::string>())["sum"] == 5);

    auto count = call(d, 12, "count", Json::object());
    assert(count["result"]["structuredContent"] == Json({{"result", 3}}));
    assert(count["result"]["content"][0]["text"] == "3");
    std::cout << "PASSED\n";
}

void test_tool_not_found_does_not_spawn()
{
    std::cout << "  test_tool_not_found_does_not_spawn... " << std::flush;
    std::remove(g_marker.c_str());
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request());

    auto resp = call(d, 20, "touch_markr", Json::object());
    assert(resp["error"]["code"] == INVALID_PARAMS);
    assert(resp["error"]["data"]["kind"] == "ToolNotFound");
    assert(::access(g_marker.c_str(), F_OK) != 0);

    // the correctly spelled tool does run
    call(d, 21, "touch_marker", Json::object());
    assert(::access(g_marker.c_str(), F_OK) == 0);
    std::remove(g_marker.c_str());
    std::cout << "PASSED\n";
}

void test_tool_errors()
{
    std::cout << "  test_tool_errors... " << std::flush;
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request());

    auto invalid = call(d, 30, "echo", Json{{"msg", 12}});
    assert(invalid["error"]["code"] == INVALID_PARAMS);
    assert(invalid["error"]["data"]["kind"] == "SchemaValidationFailed");
    assert(invalid["error"]["data"]["path"] == "$.msg");

    auto missing_arg = call(d, 31, "sum", Json{{"a", 1}});
    assert(missing_arg["error"]["code"] == INTERNAL_ERROR);
    assert(missing_arg["error"]["data"]["kind"] == "RenderError");

    auto failed = call(d, 32, "fail", Json::object());
    assert(failed["error"]["code"] == INTERNAL_ERROR);
    assert(failed["error"]["data"]["kind"] == "ExecutorFailed");
    assert(failed["error"]["data"]["exitCode"] == 2);
    assert(failed["error"]["data"]["stderr"] == "broken\n");

    auto no_name = d.handle(request(33, "tools/call", Json{{"arguments", Json::object()}}));
    assert((*no_name)["error"]["code"] == INVALID_PARAMS);

    // Dispatcher stays usable after failures
    assert(d.state() == DispatcherState::Ready);
    auto ok = call(d, 34, "echo", Json{{"msg", "still here"}});
    assert(ok["result"]["content"][0]["text"] == "still here");
    std::cout << "PASSED\n";
}

void test_malformed_messages()
{
    std::cout << "  test_malformed_messages... " << std::flush;
    Dispatcher d(make_registry(), details());
    d.handle(initialize_request());

    auto unknown = d.handle(request(40, "prompts/list"));
    assert((*unknown)["error"]["code"] == METHOD_NOT_FOUND);

    auto not_object = d.handle(Json::array({1, 2}));
    assert((*not_object)["error"]["code"] == INVALID_REQUEST);
    assert((*not_object)["id"].is_null());

    auto bad_method = d.handle(Json{{"jsonrpc", "2.0"}, {"id", 41}, {"method", 7}});
    assert((*bad_method)["error"]["code"] == INVALID_REQUEST);

    // Client responses and notifications produce nothing
    assert(!d.handle(Json{{"jsonrpc", "2.0"}, {"id", 99}, {"result", Json::object()}}));
    assert(!d.handle(Json{{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}}));

    // String ids are echoed back unchanged
    auto str_id = d.handle(Json{{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "ping"}});
    assert((*str_id)["id"] == "abc");
    std::cout << "PASSED\n";
}

void test_error_code_mapping()
{
    std::cout << "  test_error_code_mapping... " << std::flush;
    assert(error_code(ProtocolSequenceError("x")) == -32600);
    assert(error_code(NotFoundError("x")) == -32602);
    assert(error_code(ValidationError("x")) == -32602);
    assert(error_code(RenderError("x", "{ input.y }")) == -32603);
    assert(error_code(ExecutorError("x")) == -32603);
    assert(error_code(ToolTimeoutError("x")) == -32603);

    ExecutorError http_err("bad status");
    http_err.http_status = 404;
    http_err.response_body = "nope";
    auto resp = error_response(Json(7), http_err);
    assert(resp["error"]["data"]["status"] == 404);
    assert(resp["error"]["data"]["body"] == "nope");
    assert(resp["error"]["message"] == "bad status");

    auto timeout = error_response(Json(8), ToolTimeoutError("slow"));
    assert(timeout["error"]["data"]["kind"] == "Timeout");
    std::cout << "PASSED\n";
}

int main()
{
    g_marker = "/tmp/easymcp_dispatch_marker_" + std::to_string(::getpid());
    std::cout << "Dispatcher tests\n";
    test_initialize_handshake();
    test_capabilities_override();
    test_requests_before_initialize();
    test_initialize_with_odd_client_info();
    test_repeated_initialize();
    test_closed_rejects_everything();
    test_tools_list();
    test_tools_call_success();
    test_tool_not_found_does_not_spawn();
    test_tool_errors();
    test_malformed_messages();
    test_error_code_mapping();
    std::cout << "All dispatcher tests passed\n";
    return 0;
}
