#pragma once
#include "oshub/exceptions.hpp"
#include "oshub/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace oshub::mcp
{

constexpr const char* kJsonRpcVersion = "2.0";

namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
constexpr int ServerNotInitialized = -32002;
} // namespace error_code

/// Inbound call. `id` is a string or an integer and is echoed back verbatim.
struct Request
{
    Json id;
    std::string method;
    Json params = Json::object();
};

struct Response
{
    Json id;
    Json result;
};

struct ErrorResponse
{
    Json id;
    int code{error_code::InternalError};
    std::string message;
    std::optional<Json> data;
};

using Message = std::variant<Request, Response, ErrorResponse>;

/**
 * Decode one wire line into a Message.
 *
 * Throws DecodeError when the line is not JSON, is not a JSON-RPC 2.0 object,
 * lacks a method or an identifier, or carries an identifier that is neither a
 * string nor an integer. The error keeps the id (and method) whenever they
 * could be read, so the caller can still answer or classify the message.
 */
Message decode(const std::string& line);
Message decode_json(const Json& j);

/// Serialize to a single line (no trailing newline). Never throws for
/// well-formed values.
std::string encode(const Message& message);
Json to_json(const Message& message);

Message make_result(const Json& id, Json result);
Message make_error(const Json& id, int code, std::string message,
                   std::optional<Json> data = std::nullopt);

/// Id of any message variant.
const Json& message_id(const Message& message);

} // namespace oshub::mcp
