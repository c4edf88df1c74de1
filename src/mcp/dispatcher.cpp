#include "easymcp/mcp/dispatcher.hpp"

#include "easymcp/logging.hpp"

namespace easymcp::mcp
{

namespace
{

const char* const LOGGER = "easymcp.dispatcher";

Json result_response(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json make_tool_entry(const tools::ToolDefinition& tool)
{
    Json entry = {{"name", tool.name()}};
    if (!tool.description().empty())
        entry["description"] = tool.description();
    // MCP requires an inputSchema even for tools that take anything
    if (!tool.input_schema().is_null() && !tool.input_schema().empty())
        entry["inputSchema"] = tool.input_schema();
    else
        entry["inputSchema"] = Json{{"type", "object"}};
    if (!tool.output_schema().is_null() && !tool.output_schema().empty())
        entry["outputSchema"] = tool.output_schema();
    if (tool.annotations().is_object() && !tool.annotations().empty())
        entry["annotations"] = tool.annotations();
    return entry;
}

Json error_data(const Error& e)
{
    Json data = {{"kind", e.kind()}};
    if (auto* v = dynamic_cast<const ValidationError*>(&e))
    {
        data["path"] = v->path();
        if (v->raw())
            data["raw"] = *v->raw();
    }
    else if (auto* r = dynamic_cast<const RenderError*>(&e))
    {
        data["expression"] = r->expression();
    }
    else if (auto* x = dynamic_cast<const ExecutorError*>(&e))
    {
        if (x->exit_code)
            data["exitCode"] = *x->exit_code;
        if (x->http_status)
            data["status"] = *x->http_status;
        if (!x->stderr_output.empty())
            data["stderr"] = x->stderr_output;
        if (!x->response_body.empty())
            data["body"] = x->response_body;
    }
    return data;
}

} // namespace

Json jsonrpc_error(const Json& id, int code, const std::string& message, const Json& data)
{
    Json error = {{"code", code}, {"message", message}};
    if (!data.is_null())
        error["data"] = data;
    return Json{{"jsonrpc", "2.0"}, {"id", id.is_null() ? Json() : id}, {"error", error}};
}

int error_code(const Error& e)
{
    if (dynamic_cast<const ProtocolSequenceError*>(&e))
        return INVALID_REQUEST;
    if (dynamic_cast<const NotFoundError*>(&e) || dynamic_cast<const ValidationError*>(&e))
        return INVALID_PARAMS;
    return INTERNAL_ERROR;
}

Json error_response(const Json& id, const Error& e)
{
    return jsonrpc_error(id, error_code(e), e.what(), error_data(e));
}

Json make_call_tool_result(const Json& output, bool include_structured_content)
{
    Json text = output.is_string() ? output.get<std::string>()
                                   : output.dump(-1, ' ', false, Json::error_handler_t::replace);
    Json payload = {{"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
                    {"isError", false}};
    if (include_structured_content)
    {
        if (output.is_object())
            payload["structuredContent"] = output;
        else
            payload["structuredContent"] = Json{{"result", output}};
    }
    return payload;
}

Dispatcher::Dispatcher(std::shared_ptr<const tools::ToolRegistry> registry, ServerDetails details)
    : registry_(std::move(registry)), details_(std::move(details))
{
    if (!registry_)
        throw Error("dispatcher requires a tool registry");
}

void Dispatcher::close()
{
    auto previous = state_.exchange(DispatcherState::Closed);
    if (previous != DispatcherState::Closed)
        logging::debug("dispatcher closed (was " + to_string(previous) + ")", LOGGER);
}

std::optional<Json> Dispatcher::handle(const Json& message, const executors::CancelToken& cancel)
{
    if (!message.is_object())
        return jsonrpc_error(Json(), INVALID_REQUEST, "Invalid Request: expected a JSON object");

    const bool has_id = message.contains("id");
    const Json id = has_id ? message.at("id") : Json();

    auto mit = message.find("method");
    if (mit == message.end())
    {
        // A response to something we never send; nothing to answer.
        if (has_id && (message.contains("result") || message.contains("error")))
            return std::nullopt;
        return jsonrpc_error(id, INVALID_REQUEST, "Invalid Request: missing method");
    }
    if (!mit->is_string())
        return jsonrpc_error(id, INVALID_REQUEST, "Invalid Request: method must be a string");

    const std::string method = mit->get<std::string>();
    if (!has_id)
    {
        logging::debug("notification '" + method + "'", LOGGER);
        return std::nullopt;
    }

    Json params = message.value("params", Json::object());
    if (params.is_null())
        params = Json::object();

    try
    {
        auto state = state_.load();
        if (state == DispatcherState::Closed)
            throw ProtocolSequenceError("session is closed");

        if (method == "ping")
            return result_response(id, Json::object());

        if (method == "initialize")
        {
            if (state == DispatcherState::Ready)
                throw ProtocolSequenceError("session is already initialized");
            return result_response(id, handle_initialize(params));
        }

        if (state == DispatcherState::Uninitialized)
            throw ProtocolSequenceError("'" + method + "' received before 'initialize'");

        if (method == "tools/list")
            return result_response(id, handle_tools_list());

        if (method == "tools/call")
        {
            if (!params.is_object())
                return jsonrpc_error(id, INVALID_PARAMS, "params must be an object");
            return result_response(id, handle_tools_call(params, cancel));
        }

        return jsonrpc_error(id, METHOD_NOT_FOUND, "Method '" + method + "' not found");
    }
    catch (const Error& e)
    {
        logging::log(dynamic_cast<const ProtocolSequenceError*>(&e) ? logging::LogLevel::Debug
                                                                    : logging::LogLevel::Warning,
                     method + " failed: [" + e.kind() + "] " + e.what(), LOGGER);
        return error_response(id, e);
    }
    catch (const std::exception& e)
    {
        logging::error(method + " failed: " + e.what(), LOGGER);
        return jsonrpc_error(id, INTERNAL_ERROR, e.what(), Json{{"kind", "InternalError"}});
    }
}

Json Dispatcher::handle_initialize(const Json& params)
{
    std::string client = "unknown";
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object())
    {
        const Json& info = params["clientInfo"];
        if (info.contains("name") && info["name"].is_string())
            client = info["name"].get<std::string>();
        if (info.contains("version") && info["version"].is_string())
            client += " " + info["version"].get<std::string>();
    }

    Json result = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities",
         details_.capabilities ? *details_.capabilities : Json{{"tools", Json::object()}}},
        {"serverInfo", Json{{"name", details_.name}, {"version", details_.version}}},
    };
    if (details_.instruction)
        result["instructions"] = *details_.instruction;

    // Nothing below may throw: the transition is the last step
    auto expected = DispatcherState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, DispatcherState::Ready))
    {
        if (expected == DispatcherState::Closed)
            throw ProtocolSequenceError("session is closed");
        throw ProtocolSequenceError("session is already initialized");
    }
    logging::info("client connected: " + client, LOGGER);
    return result;
}

Json Dispatcher::handle_tools_list() const
{
    Json tools_array = Json::array();
    for (const auto& entry : registry_->list())
        tools_array.push_back(make_tool_entry(*entry.definition));
    return Json{{"tools", tools_array}};
}

Json Dispatcher::handle_tools_call(const Json& params, const executors::CancelToken& cancel) const
{
    auto nit = params.find("name");
    if (nit == params.end() || !nit->is_string() || nit->get<std::string>().empty())
        throw ValidationError("tools/call requires a non-empty string 'name'", "$.name");
    const std::string name = nit->get<std::string>();

    const tools::ToolEntry* entry = registry_->lookup(name);
    if (!entry)
        throw NotFoundError("tool '" + name + "' not found");

    Json args = params.value("arguments", Json::object());
    if (args.is_null())
        args = Json::object();

    logging::debug("calling tool '" + name + "'", LOGGER);
    Json output = entry->executor->execute(args, cancel);

    const Json& output_schema = entry->definition->output_schema();
    return make_call_tool_result(output, !output_schema.is_null() && !output_schema.empty());
}

} // namespace easymcp::mcp
