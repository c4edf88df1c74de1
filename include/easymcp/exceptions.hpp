#pragma once
#include "easymcp/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace easymcp
{

/// Root of every error the server reports. kind() is the stable name that
/// travels in the "data.kind" field of a JSON-RPC error response.
struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;

    virtual const char* kind() const noexcept
    {
        return "InternalError";
    }
};

/// Malformed configuration; fatal at startup.
struct ConfigError : public Error
{
    using Error::Error;

    const char* kind() const noexcept override
    {
        return "ConfigError";
    }
};

/// A template expression could not be resolved against the input.
struct RenderError : public Error
{
    RenderError(const std::string& message, std::string expression)
        : Error(message), expression_(std::move(expression))
    {
    }

    const char* kind() const noexcept override
    {
        return "RenderError";
    }

    const std::string& expression() const
    {
        return expression_;
    }

  private:
    std::string expression_;
};

/// Input or output value does not match its declared schema.
struct ValidationError : public Error
{
    explicit ValidationError(const std::string& message, std::string path = "$")
        : Error(message), path_(std::move(path))
    {
    }

    const char* kind() const noexcept override
    {
        return "SchemaValidationFailed";
    }

    const std::string& path() const
    {
        return path_;
    }

    /// Raw tool output the failing value was parsed from, if any.
    const std::optional<Json>& raw() const
    {
        return raw_;
    }
    void set_raw(Json raw)
    {
        raw_ = std::move(raw);
    }

  private:
    std::string path_;
    std::optional<Json> raw_;
};

/// Network or process level failure of a single invocation.
struct ExecutorError : public Error
{
    using Error::Error;

    const char* kind() const noexcept override
    {
        return "ExecutorFailed";
    }

    std::optional<int> exit_code;
    std::optional<long> http_status;
    std::string stderr_output;
    std::string response_body;
};

struct ToolTimeoutError : public Error
{
    using Error::Error;

    const char* kind() const noexcept override
    {
        return "Timeout";
    }
};

/// Unknown tool name in tools/call.
struct NotFoundError : public Error
{
    using Error::Error;

    const char* kind() const noexcept override
    {
        return "ToolNotFound";
    }
};

/// Request not allowed in the dispatcher's current state.
struct ProtocolSequenceError : public Error
{
    using Error::Error;

    const char* kind() const noexcept override
    {
        return "ProtocolSequenceError";
    }
};

struct TransportError : public Error
{
    using Error::Error;

    const char* kind() const noexcept override
    {
        return "TransportError";
    }
};

} // namespace easymcp
