#pragma once
#include "easymcp/tools/tool.hpp"
#include "easymcp/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace easymcp::executors
{

/// Shared cancellation flag. Copies observe the same state; a default
/// constructed token can still be cancelled by any of its copies.
class CancelToken
{
  public:
    CancelToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const
    {
        state_->store(true);
    }
    bool cancelled() const
    {
        return state_->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> state_;
};

struct ExecutionOptions
{
    std::chrono::milliseconds command_timeout{30000};
    std::chrono::milliseconds http_timeout{30000};
};

/**
 * Turns one tool definition into a live action.
 *
 * An executor is bound to its tool when the registry is built and compiles
 * the tool's templates up front, so template errors surface as ConfigError at
 * startup. execute() is const and keeps no state between calls; concurrent
 * invocations of the same executor are safe.
 *
 * Failures are thrown:
 *   ValidationError   input or output does not match the declared schema
 *   RenderError       a template expression cannot be resolved
 *   ExecutorError     network/process failure, non-zero exit, cancellation
 *   ToolTimeoutError  command exceeded its time bound
 */
class Executor
{
  public:
    virtual ~Executor() = default;

    virtual Json execute(const Json& input, const CancelToken& cancel = CancelToken()) const = 0;

    const tools::ToolDefinition& tool() const
    {
        return *tool_;
    }

  protected:
    explicit Executor(std::shared_ptr<const tools::ToolDefinition> tool) : tool_(std::move(tool))
    {
    }

    /// Check input against the tool's input schema (no-op without one).
    void validate_input(const Json& input) const;

    /// Parse raw output as JSON, falling back to a JSON string holding the raw
    /// text, then check it against the output schema. A schema failure carries
    /// the raw text.
    Json finish_output(const std::string& raw) const;

    std::shared_ptr<const tools::ToolDefinition> tool_;
};

/// Select the executor implementation for the tool's kind.
std::unique_ptr<Executor> make_executor(std::shared_ptr<const tools::ToolDefinition> tool,
                                        const ExecutionOptions& options);

} // namespace easymcp::executors
