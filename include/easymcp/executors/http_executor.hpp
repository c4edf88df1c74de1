#pragma once
#include "easymcp/executors/executor.hpp"
#include "easymcp/templating/template.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace easymcp::executors
{

/// A request after every template has been rendered.
struct RenderedRequest
{
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::string> body;
};

/**
 * Performs an HTTP tool call through libcurl.
 *
 * The url, header values and body are templates compiled at construction.
 * Connection failures, timeouts and non-2xx statuses are ExecutorError; the
 * request is never retried. A response body that is not JSON is returned as a
 * JSON string.
 */
class HttpExecutor : public Executor
{
  public:
    HttpExecutor(std::shared_ptr<const tools::ToolDefinition> tool,
                 std::chrono::milliseconds timeout);

    Json execute(const Json& input, const CancelToken& cancel = CancelToken()) const override;

    /// Validate the input and render the request without sending it.
    RenderedRequest prepare(const Json& input) const;

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

  private:
    HttpMethod method_;
    templating::Template url_;
    std::vector<std::pair<std::string, templating::Template>> headers_;
    std::optional<templating::Template> body_;
    std::chrono::milliseconds timeout_;
};

} // namespace easymcp::executors
