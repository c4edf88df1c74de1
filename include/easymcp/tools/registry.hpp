#pragma once
#include "easymcp/executors/executor.hpp"
#include "easymcp/tools/tool.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace easymcp::tools
{

/// A registered tool together with the executor bound to it.
struct ToolEntry
{
    std::shared_ptr<const ToolDefinition> definition;
    std::unique_ptr<executors::Executor> executor;
};

/**
 * Immutable, name-indexed table of tools.
 *
 * Built once at startup; there is no way to add or remove tools afterwards,
 * so concurrent readers need no locking. Construction validates the whole
 * set (unique non-empty names, templates that compile) and throws ConfigError
 * on the first problem.
 */
class ToolRegistry
{
  public:
    explicit ToolRegistry(std::vector<ToolDefinition> tools,
                          const executors::ExecutionOptions& options = {});

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// nullptr when no tool has that name
    const ToolEntry* lookup(const std::string& name) const;

    /// Entries in configuration order
    const std::vector<ToolEntry>& list() const
    {
        return entries_;
    }

    std::vector<std::string> list_names() const;

    size_t size() const
    {
        return entries_.size();
    }

  private:
    std::vector<ToolEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace easymcp::tools
