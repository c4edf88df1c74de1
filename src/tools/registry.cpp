#include "easymcp/tools/registry.hpp"

#include "easymcp/exceptions.hpp"
#include "easymcp/logging.hpp"

namespace easymcp::tools
{

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> tools,
                           const executors::ExecutionOptions& options)
{
    entries_.reserve(tools.size());
    for (auto& def : tools)
    {
        if (def.name().empty())
            throw ConfigError("tool #" + std::to_string(entries_.size()) + " has an empty name");
        if (index_.count(def.name()))
            throw ConfigError("duplicate tool name: " + def.name());

        auto shared = std::make_shared<const ToolDefinition>(std::move(def));
        ToolEntry entry;
        entry.definition = shared;
        entry.executor = executors::make_executor(shared, options);

        index_.emplace(shared->name(), entries_.size());
        entries_.push_back(std::move(entry));
        logging::debug("registered " + to_string(shared->kind()) + " tool '" + shared->name() +
                           "'",
                       "easymcp.registry");
    }
}

const ToolEntry* ToolRegistry::lookup(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &entries_[it->second];
}

std::vector<std::string> ToolRegistry::list_names() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_)
        names.push_back(entry.definition->name());
    return names;
}

} // namespace easymcp::tools
