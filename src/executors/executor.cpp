#include "easymcp/executors/executor.hpp"

#include "easymcp/exceptions.hpp"
#include "easymcp/executors/command_executor.hpp"
#include "easymcp/executors/http_executor.hpp"
#include "easymcp/util/json.hpp"
#include "easymcp/util/json_schema.hpp"

namespace easymcp::executors
{

void Executor::validate_input(const Json& input) const
{
    try
    {
        util::schema::validate(tool_->input_schema(), input);
    }
    catch (const ValidationError& e)
    {
        throw ValidationError("invalid input for tool '" + tool_->name() + "': " + e.what(),
                              e.path());
    }
}

Json Executor::finish_output(const std::string& raw) const
{
    Json output;
    if (auto parsed = util::json::try_parse(raw))
        output = std::move(*parsed);
    else
        output = raw;

    try
    {
        util::schema::validate(tool_->output_schema(), output);
    }
    catch (const ValidationError& e)
    {
        ValidationError err("invalid output from tool '" + tool_->name() + "': " + e.what(),
                            e.path());
        err.set_raw(raw);
        throw err;
    }
    return output;
}

std::unique_ptr<Executor> make_executor(std::shared_ptr<const tools::ToolDefinition> tool,
                                        const ExecutionOptions& options)
{
    switch (tool->kind())
    {
    case ToolKind::Http:
        return std::make_unique<HttpExecutor>(std::move(tool), options.http_timeout);
    case ToolKind::Command:
        return std::make_unique<CommandExecutor>(std::move(tool), options.command_timeout);
    }
    throw ConfigError("unsupported tool kind");
}

} // namespace easymcp::executors
