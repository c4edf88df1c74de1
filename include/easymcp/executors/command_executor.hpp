#pragma once
#include "easymcp/executors/executor.hpp"
#include "easymcp/templating/template.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace easymcp::executors
{

/**
 * Runs a COMMAND tool as a child process.
 *
 * The executable named by the tool is used verbatim; only the arguments and
 * the stdin text are rendered from the input. The child always gets a fresh
 * stdin pipe (closed right after the rendered stdin, if any, is written), and
 * its stdout and stderr are captured separately.
 *
 * The child is killed when it outlives the timeout or the invocation is
 * cancelled, and is always reaped before execute() returns or throws.
 */
class CommandExecutor : public Executor
{
  public:
    CommandExecutor(std::shared_ptr<const tools::ToolDefinition> tool,
                    std::chrono::milliseconds timeout);

    Json execute(const Json& input, const CancelToken& cancel = CancelToken()) const override;

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

  private:
    std::string command_;
    std::vector<templating::Template> args_;
    std::optional<templating::Template> stdin_;
    std::chrono::milliseconds timeout_;
};

} // namespace easymcp::executors
