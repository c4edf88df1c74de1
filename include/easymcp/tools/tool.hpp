#pragma once
#include "easymcp/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace easymcp::tools
{

/// HTTP tool: every string except the method is a template.
struct HttpMetadata
{
    std::string url;
    HttpMethod method{HttpMethod::Get};
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
};

/// Command tool: the executable is literal, arguments and stdin are templates.
struct CommandMetadata
{
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> stdin_template;
};

/// Declarative description of one tool, immutable once loaded.
class ToolDefinition
{
  public:
    using Metadata = std::variant<HttpMetadata, CommandMetadata>;

    ToolDefinition(std::string name, std::string description, Metadata metadata,
                   Json input_schema = Json(), Json output_schema = Json(),
                   Json annotations = Json())
        : name_(std::move(name)), description_(std::move(description)),
          metadata_(std::move(metadata)), input_schema_(std::move(input_schema)),
          output_schema_(std::move(output_schema)), annotations_(std::move(annotations))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    ToolKind kind() const
    {
        return std::holds_alternative<HttpMetadata>(metadata_) ? ToolKind::Http
                                                               : ToolKind::Command;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    const Json& output_schema() const
    {
        return output_schema_;
    }
    const Json& annotations() const
    {
        return annotations_;
    }

    /// nullptr unless kind() == ToolKind::Http
    const HttpMetadata* http() const
    {
        return std::get_if<HttpMetadata>(&metadata_);
    }
    /// nullptr unless kind() == ToolKind::Command
    const CommandMetadata* command() const
    {
        return std::get_if<CommandMetadata>(&metadata_);
    }

  private:
    std::string name_;
    std::string description_;
    Metadata metadata_;
    Json input_schema_;
    Json output_schema_;
    Json annotations_;
};

} // namespace easymcp::tools
