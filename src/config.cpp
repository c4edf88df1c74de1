#include "easymcp/config.hpp"

#include "easymcp/exceptions.hpp"
#include "easymcp/version.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace easymcp::config
{

namespace
{

const Json* optional_field(const Json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

std::string require_string(const Json& obj, const char* key, const std::string& where)
{
    const Json* v = optional_field(obj, key);
    if (!v)
        throw ConfigError(where + ": missing required field '" + key + "'");
    if (!v->is_string())
        throw ConfigError(where + ": field '" + key + "' must be a string");
    return v->get<std::string>();
}

std::optional<std::string> optional_string(const Json& obj, const char* key,
                                           const std::string& where)
{
    const Json* v = optional_field(obj, key);
    if (!v)
        return std::nullopt;
    if (!v->is_string())
        throw ConfigError(where + ": field '" + key + "' must be a string");
    return v->get<std::string>();
}

Json optional_object(const Json& obj, const char* key, const std::string& where)
{
    const Json* v = optional_field(obj, key);
    if (!v)
        return Json();
    if (!v->is_object())
        throw ConfigError(where + ": field '" + key + "' must be an object");
    return *v;
}

const Json& require_object(const Json& obj, const char* key, const std::string& where)
{
    const Json* v = optional_field(obj, key);
    if (!v)
        throw ConfigError(where + ": missing required field '" + key + "'");
    if (!v->is_object())
        throw ConfigError(where + ": field '" + key + "' must be an object");
    return *v;
}

HttpMethod parse_method(const std::string& text, const std::string& where)
{
    std::string upper;
    for (char c : text)
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (upper == "GET")
        return HttpMethod::Get;
    if (upper == "POST")
        return HttpMethod::Post;
    if (upper == "PUT")
        return HttpMethod::Put;
    if (upper == "DELETE")
        return HttpMethod::Delete;
    throw ConfigError(where + ": unsupported HTTP method '" + text + "'");
}

std::chrono::milliseconds duration_field(const Json& v, const std::string& where)
{
    if (v.is_string())
    {
        try
        {
            return parse_duration(v.get<std::string>());
        }
        catch (const ConfigError& e)
        {
            throw ConfigError(where + ": " + e.what());
        }
    }
    // bare numbers are seconds
    if (v.is_number() && v.get<double>() >= 0)
    {
        const double seconds = v.get<double>();
        if (seconds * 1000 > static_cast<double>(MAX_DURATION.count()))
            throw ConfigError(where + ": duration exceeds the 365 day maximum");
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    }
    throw ConfigError(where + ": expected a duration such as \"15s\"");
}

tools::HttpMetadata parse_http(const Json& meta, const std::string& where)
{
    tools::HttpMetadata http;
    http.url = require_string(meta, "url", where);
    http.method = parse_method(require_string(meta, "method", where), where);
    http.body = optional_string(meta, "body", where);

    Json headers = optional_object(meta, "headers", where);
    if (headers.is_object())
    {
        for (auto it = headers.begin(); it != headers.end(); ++it)
        {
            if (!it->is_string())
                throw ConfigError(where + ": header '" + it.key() + "' must be a string");
            http.headers[it.key()] = it->get<std::string>();
        }
    }
    return http;
}

tools::CommandMetadata parse_command(const Json& meta, const std::string& where)
{
    tools::CommandMetadata cmd;
    cmd.command = require_string(meta, "command", where);
    if (cmd.command.empty())
        throw ConfigError(where + ": 'command' must not be empty");
    cmd.stdin_template = optional_string(meta, "stdin", where);

    if (const Json* args = optional_field(meta, "args"))
    {
        if (!args->is_array())
            throw ConfigError(where + ": 'args' must be an array of strings");
        for (const auto& a : *args)
        {
            if (!a.is_string())
                throw ConfigError(where + ": 'args' must be an array of strings");
            cmd.args.push_back(a.get<std::string>());
        }
    }
    return cmd;
}

tools::ToolDefinition parse_tool(const Json& t, size_t index)
{
    std::string where = "tools[" + std::to_string(index) + "]";
    if (!t.is_object())
        throw ConfigError(where + ": must be an object");

    std::string name = require_string(t, "name", where);
    if (!name.empty())
        where += " ('" + name + "')";
    std::string description = optional_string(t, "description", where).value_or("");
    std::string type = require_string(t, "tool_type", where);
    Json annotations = optional_object(t, "tool_annotations", where);

    const Json* meta_json = nullptr;
    tools::ToolDefinition::Metadata metadata;
    if (type == "HTTP")
    {
        meta_json = &require_object(t, "http_metadata", where);
        metadata = parse_http(*meta_json, where + ".http_metadata");
    }
    else if (type == "COMMAND")
    {
        meta_json = &require_object(t, "command_metadata", where);
        metadata = parse_command(*meta_json, where + ".command_metadata");
    }
    else
    {
        throw ConfigError(where + ": tool_type must be HTTP or COMMAND, got '" + type + "'");
    }

    Json input_schema = optional_object(*meta_json, "input_schema", where);
    Json output_schema = optional_object(*meta_json, "output_schema", where);

    return tools::ToolDefinition(std::move(name), std::move(description), std::move(metadata),
                                 std::move(input_schema), std::move(output_schema),
                                 std::move(annotations));
}

TransportConfig parse_transport(const Json& tc)
{
    TransportConfig transport;
    const std::string where = "transport_config";
    std::string type = require_string(tc, "transport_type", where);
    if (type == "STDIO")
    {
        transport.type = TransportType::Stdio;
        return transport;
    }
    if (type != "SSE")
        throw ConfigError(where + ": transport_type must be STDIO or SSE, got '" + type + "'");

    transport.type = TransportType::Sse;
    const Json& sse = require_object(tc, "sse_config", where);
    const std::string sse_where = where + ".sse_config";

    auto address = parse_address(require_string(sse, "address", sse_where));
    transport.sse.host = address.first;
    transport.sse.port = address.second;
    if (auto p = optional_string(sse, "sse_path", sse_where))
        transport.sse.sse_path = *p;
    if (auto p = optional_string(sse, "post_path", sse_where))
        transport.sse.post_path = *p;
    if (const Json* ka = optional_field(sse, "keep_alive_duration"))
        transport.sse.keep_alive = duration_field(*ka, sse_where + ".keep_alive_duration");

    for (const auto* path : {&transport.sse.sse_path, &transport.sse.post_path})
        if (path->empty() || path->front() != '/')
            throw ConfigError(sse_where + ": paths must start with '/', got '" + *path + "'");
    if (transport.sse.sse_path == transport.sse.post_path)
        throw ConfigError(sse_where + ": sse_path and post_path must differ");
    if (transport.sse.keep_alive.count() <= 0)
        throw ConfigError(sse_where + ": keep_alive_duration must be positive");
    return transport;
}

} // namespace

std::chrono::milliseconds parse_duration(const std::string& text)
{
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        ++pos;
    if (pos == 0 || pos > 15)
        throw ConfigError("invalid duration '" + text + "'");

    const long long value = std::stoll(text.substr(0, pos));
    const std::string unit = text.substr(pos);
    const long long max_ms = MAX_DURATION.count();

    // Sub-millisecond units round up so a non-zero duration stays non-zero
    if (unit == "ns" || unit == "us")
    {
        const long long per_ms = unit == "ns" ? 1000000 : 1000;
        long long ms = value / per_ms + (value % per_ms != 0 ? 1 : 0);
        if (ms > max_ms)
            throw ConfigError("duration '" + text + "' exceeds the 365 day maximum");
        return std::chrono::milliseconds(ms);
    }

    long long factor = 0;
    if (unit == "ms")
        factor = 1;
    else if (unit == "s")
        factor = 1000;
    else if (unit == "m")
        factor = 60 * 1000;
    else if (unit == "h")
        factor = 60 * 60 * 1000;
    else if (unit == "d")
        factor = 24LL * 60 * 60 * 1000;
    else if (unit == "w")
        factor = 7LL * 24 * 60 * 60 * 1000;
    else
        throw ConfigError("invalid duration '" + text +
                          "': unit must be ns, us, ms, s, m, h, d or w");

    if (value > max_ms / factor)
        throw ConfigError("duration '" + text + "' exceeds the 365 day maximum");
    return std::chrono::milliseconds(value * factor);
}

std::pair<std::string, int> parse_address(const std::string& address)
{
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size())
        throw ConfigError("invalid address '" + address + "': expected host:port");

    std::string host = address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);

    std::string port_text = address.substr(colon + 1);
    if (port_text.size() > 5)
        throw ConfigError("invalid port in address '" + address + "'");
    for (char c : port_text)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw ConfigError("invalid port in address '" + address + "'");
    int port = std::stoi(port_text);
    if (port > 65535)
        throw ConfigError("invalid port in address '" + address + "'");
    return {host, port};
}

ServerConfig from_json(const Json& doc, const executors::ExecutionOptions& defaults)
{
    if (!doc.is_object())
        throw ConfigError("configuration document must be an object");

    ServerConfig cfg;
    cfg.execution = defaults;
    cfg.server_info.version = VERSION_STRING;

    const Json* tools = optional_field(doc, "tools");
    if (!tools)
        throw ConfigError("missing required field 'tools'");
    if (!tools->is_array())
        throw ConfigError("'tools' must be an array");
    cfg.tools.reserve(tools->size());
    for (size_t i = 0; i < tools->size(); ++i)
        cfg.tools.push_back(parse_tool((*tools)[i], i));

    cfg.instruction = optional_string(doc, "instruction", "config");

    Json info = optional_object(doc, "server_info", "config");
    if (info.is_object())
    {
        if (auto name = optional_string(info, "name", "server_info"))
            cfg.server_info.name = *name;
        if (auto version = optional_string(info, "version", "server_info"))
            cfg.server_info.version = *version;
    }

    Json caps = optional_object(doc, "server_capabilities", "config");
    if (caps.is_object())
        cfg.capabilities = caps;

    Json transport = optional_object(doc, "transport_config", "config");
    if (transport.is_object())
        cfg.transport = parse_transport(transport);

    Json execution = optional_object(doc, "execution", "config");
    if (execution.is_object())
    {
        if (const Json* v = optional_field(execution, "command_timeout"))
            cfg.execution.command_timeout = duration_field(*v, "execution.command_timeout");
        if (const Json* v = optional_field(execution, "http_timeout"))
            cfg.execution.http_timeout = duration_field(*v, "execution.http_timeout");
        if (cfg.execution.command_timeout.count() <= 0 || cfg.execution.http_timeout.count() <= 0)
            throw ConfigError("execution: timeouts must be positive");
    }

    return cfg;
}

ServerConfig load_config(const std::string& path, const executors::ExecutionOptions& defaults)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open configuration file '" + path + "'");
    std::stringstream buf;
    buf << in.rdbuf();

    Json doc = Json::parse(buf.str(), nullptr, false);
    if (doc.is_discarded())
        throw ConfigError("configuration file '" + path + "' is not valid JSON");
    return from_json(doc, defaults);
}

} // namespace easymcp::config
