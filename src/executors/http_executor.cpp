#include "easymcp/executors/http_executor.hpp"

#include "easymcp/exceptions.hpp"
#include "easymcp/logging.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace easymcp::executors
{

namespace
{

struct CurlResponse
{
    long status_code = 0;
    std::string body;
};

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata)
{
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

int abort_if_cancelled(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* cancel = static_cast<const CancelToken*>(clientp);
    return cancel->cancelled() ? 1 : 0;
}

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandleDeleter
{
    void operator()(CURL* curl) const
    {
        curl_easy_cleanup(curl);
    }
};

struct CurlListDeleter
{
    void operator()(curl_slist* list) const
    {
        curl_slist_free_all(list);
    }
};

} // namespace

HttpExecutor::HttpExecutor(std::shared_ptr<const tools::ToolDefinition> tool,
                           std::chrono::milliseconds timeout)
    : Executor(std::move(tool)), timeout_(timeout)
{
    const auto* meta = tool_->http();
    if (!meta)
        throw ConfigError("tool '" + tool_->name() + "' has no http metadata");
    if (meta->url.empty())
        throw ConfigError("tool '" + tool_->name() + "': url must not be empty");

    method_ = meta->method;
    try
    {
        url_ = templating::Template::compile(meta->url);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError("tool '" + tool_->name() + "', url: " + e.what());
    }
    for (const auto& [name, value] : meta->headers)
    {
        try
        {
            headers_.emplace_back(name, templating::Template::compile(value));
        }
        catch (const ConfigError& e)
        {
            throw ConfigError("tool '" + tool_->name() + "', header '" + name + "': " + e.what());
        }
    }
    if (meta->body)
    {
        try
        {
            body_ = templating::Template::compile(*meta->body);
        }
        catch (const ConfigError& e)
        {
            throw ConfigError("tool '" + tool_->name() + "', body: " + e.what());
        }
    }

    ensure_curl_initialized();
}

RenderedRequest HttpExecutor::prepare(const Json& input) const
{
    validate_input(input);

    const Json context{{templating::INPUT_ROOT, input}};
    RenderedRequest req;
    req.method = method_;
    req.url = url_.render(context);
    for (const auto& [name, tpl] : headers_)
    {
        std::string value = tpl.render(context);
        // a line break would let input add headers or split the request
        if (value.find_first_of(std::string("\r\n\0", 3)) != std::string::npos)
            throw RenderError("tool '" + tool_->name() + "': header '" + name +
                                  "' renders to a value containing CR, LF or NUL",
                              tpl.source());
        req.headers.emplace_back(name, std::move(value));
    }
    if (body_)
        req.body = body_->render(context);
    return req;
}

Json HttpExecutor::execute(const Json& input, const CancelToken& cancel) const
{
    RenderedRequest req = prepare(input);

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl)
        throw ExecutorError("tool '" + tool_->name() + "': curl_easy_init failed");

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : req.headers)
    {
        std::string line = name + ": " + value;
        curl_slist* next = curl_slist_append(raw_headers, line.c_str());
        if (!next)
        {
            curl_slist_free_all(raw_headers);
            throw ExecutorError("tool '" + tool_->name() + "': out of memory building headers");
        }
        raw_headers = next;
    }
    std::unique_ptr<curl_slist, CurlListDeleter> headers(raw_headers);

    CurlResponse response;
    const std::string method = to_string(req.method);
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (req.method == HttpMethod::Get && !req.body)
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    if (req.body)
    {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body->size()));
    }
    if (headers)
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_to_string);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &abort_if_cancelled);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<CancelToken*>(&cancel));

    logging::debug(method + " " + req.url + " for tool '" + tool_->name() + "'", "easymcp.http");

    CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_ABORTED_BY_CALLBACK)
        throw ExecutorError("tool '" + tool_->name() + "': invocation cancelled");
    if (rc != CURLE_OK)
        throw ExecutorError("tool '" + tool_->name() + "': error while sending a request to " +
                            req.url + ": " + curl_easy_strerror(rc));

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (response.status_code < 200 || response.status_code > 299)
    {
        ExecutorError e("tool '" + tool_->name() + "': request to " + req.url +
                        " returned status " + std::to_string(response.status_code) +
                        ", response body: " + response.body);
        e.http_status = response.status_code;
        e.response_body = response.body;
        throw e;
    }

    return finish_output(response.body);
}

} // namespace easymcp::executors
