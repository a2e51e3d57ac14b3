#pragma once
#include "oshub/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace oshub
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// The upstream data provider answered, but not with a usable success.
struct UpstreamError : public Error
{
    UpstreamError(const std::string& message, int status = 0) : Error(message), status_(status) {}

    /// HTTP status returned by the provider, 0 when not applicable.
    int status() const
    {
        return status_;
    }

  private:
    int status_;
};

struct ConfigError : public Error
{
    using Error::Error;
};

/// Command line could not be parsed.
struct UsageError : public Error
{
    using Error::Error;
};

/// A wire message could not be decoded into a Request.
/// Carries the request id when one could still be extracted.
struct DecodeError : public Error
{
    DecodeError(const std::string& message, std::optional<Json> id = std::nullopt)
        : Error(message), id_(std::move(id))
    {
    }

    const std::optional<Json>& id() const
    {
        return id_;
    }

    /// Method name of a message that was readable but not answerable
    /// (a notification has a method and no id).
    const std::optional<std::string>& method() const
    {
        return method_;
    }
    void set_method(std::string method)
    {
        method_ = std::move(method);
    }

  private:
    std::optional<Json> id_;
    std::optional<std::string> method_;
};

} // namespace oshub
