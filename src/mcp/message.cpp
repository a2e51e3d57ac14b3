#include "oshub/mcp/message.hpp"

#include "oshub/util/json.hpp"

#include <type_traits>

namespace oshub::mcp
{

namespace
{

bool is_valid_id(const Json& id)
{
    return id.is_string() || id.is_number_integer();
}

std::optional<Json> extract_id(const Json& j)
{
    auto it = j.find("id");
    if (it == j.end() || !is_valid_id(*it))
        return std::nullopt;
    return *it;
}

ErrorResponse decode_error_object(const Json& j, Json id)
{
    const auto& err = j.at("error");
    if (!err.is_object())
        throw DecodeError("error must be an object", id);
    auto code_it = err.find("code");
    auto msg_it = err.find("message");
    if (code_it == err.end() || !code_it->is_number_integer())
        throw DecodeError("error.code must be an integer", id);
    if (msg_it == err.end() || !msg_it->is_string())
        throw DecodeError("error.message must be a string", id);

    ErrorResponse out;
    out.id = std::move(id);
    out.code = code_it->get<int>();
    out.message = msg_it->get<std::string>();
    if (err.contains("data"))
        out.data = err.at("data");
    return out;
}

} // namespace

Message decode(const std::string& line)
{
    Json j;
    try
    {
        j = util::json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        throw DecodeError(std::string("Parse error: ") + e.what());
    }
    return decode_json(j);
}

Message decode_json(const Json& j)
{
    if (j.is_array())
        throw DecodeError("batch messages are not supported");
    if (!j.is_object())
        throw DecodeError("message must be a JSON object");

    auto id = extract_id(j);

    auto version_it = j.find("jsonrpc");
    if (version_it == j.end() || !version_it->is_string() || *version_it != kJsonRpcVersion)
        throw DecodeError("jsonrpc must be \"2.0\"", id);

    auto method_it = j.find("method");
    if (method_it != j.end())
    {
        if (!method_it->is_string())
            throw DecodeError("method must be a string", id);
        if (j.contains("id") && !id)
            throw DecodeError("id must be a string or an integer");
        if (!id)
        {
            // Notification: no id key at all
            DecodeError err("message has no id", std::nullopt);
            err.set_method(method_it->get<std::string>());
            throw err;
        }

        Request req;
        req.id = *id;
        req.method = method_it->get<std::string>();
        auto params_it = j.find("params");
        if (params_it != j.end() && !params_it->is_null())
        {
            if (!params_it->is_object() && !params_it->is_array())
                throw DecodeError("params must be an object or an array", id);
            req.params = *params_it;
        }
        return req;
    }

    if (j.contains("result"))
    {
        if (!id)
            throw DecodeError("response has no id");
        return Response{*id, j.at("result")};
    }

    if (j.contains("error"))
    {
        // Error responses may carry a null id when the request was unreadable.
        Json err_id = id ? *id : Json();
        return decode_error_object(j, std::move(err_id));
    }

    throw DecodeError("message has no method", id);
}

Json to_json(const Message& message)
{
    return std::visit(
        [](const auto& m) -> Json
        {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Request>)
            {
                Json j = {{"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"method", m.method}};
                if (!m.params.is_null())
                    j["params"] = m.params;
                return j;
            }
            else if constexpr (std::is_same_v<T, Response>)
            {
                return Json{{"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"result", m.result}};
            }
            else
            {
                Json err = {{"code", m.code}, {"message", m.message}};
                if (m.data)
                    err["data"] = *m.data;
                return Json{{"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"error", err}};
            }
        },
        message);
}

std::string encode(const Message& message)
{
    return util::json::dump(to_json(message));
}

Message make_result(const Json& id, Json result)
{
    return Response{id, std::move(result)};
}

Message make_error(const Json& id, int code, std::string message, std::optional<Json> data)
{
    return ErrorResponse{id, code, std::move(message), std::move(data)};
}

const Json& message_id(const Message& message)
{
    return std::visit([](const auto& m) -> const Json& { return m.id; }, message);
}

} // namespace oshub::mcp
