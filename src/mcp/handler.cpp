#include "oshub/mcp/handler.hpp"

#include <chrono>
#include <unordered_map>

namespace oshub::mcp
{

namespace
{

struct MethodEntry
{
    Method method;
    bool before_initialize;
};

const std::unordered_map<std::string, MethodEntry>& method_table()
{
    static const std::unordered_map<std::string, MethodEntry> table = {
        {"initialize", {Method::Initialize, true}},
        {"ping", {Method::Ping, true}},
        {"tools/list", {Method::ToolsList, true}},
        {"tools/call", {Method::ToolsCall, false}},
        {"prompts/list", {Method::PromptsList, true}},
        {"prompts/get", {Method::PromptsGet, false}},
    };
    return table;
}

bool is_prompt_method(Method method)
{
    return method == Method::PromptsList || method == Method::PromptsGet;
}

Message method_not_found(const Request& request)
{
    return make_error(request.id, error_code::MethodNotFound,
                      std::string("Method '") + request.method + "' not found");
}

} // namespace

std::optional<Method> method_from_string(const std::string& name)
{
    const auto& table = method_table();
    auto it = table.find(name);
    if (it == table.end())
        return std::nullopt;
    return it->second.method;
}

const char* to_string(Method method)
{
    switch (method)
    {
    case Method::Initialize:
        return "initialize";
    case Method::Ping:
        return "ping";
    case Method::ToolsList:
        return "tools/list";
    case Method::ToolsCall:
        return "tools/call";
    case Method::PromptsList:
        return "prompts/list";
    case Method::PromptsGet:
        return "prompts/get";
    }
    return "";
}

bool allowed_before_initialize(Method method)
{
    return method_table().at(to_string(method)).before_initialize;
}

Dispatcher::Dispatcher(DispatcherOptions options, const tools::ToolManager& tools,
                       const prompts::PromptManager& prompts, upstream::UpstreamClient& upstream,
                       const util::Logger& logger)
    : options_(std::move(options)), tools_(tools), prompts_(prompts), upstream_(upstream),
      logger_(logger),
      session_(options_.server_info, Capabilities{true, false, options_.enable_prompts})
{
}

Message Dispatcher::handle(const Request& request)
{
    auto start = std::chrono::steady_clock::now();
    logger_.debug("REQUEST " + request.method);

    Message response;
    try
    {
        auto method = method_from_string(request.method);
        if (!method || (is_prompt_method(*method) && !options_.enable_prompts))
            response = method_not_found(request);
        else
            response = route(*method, request);
    }
    catch (const std::exception& e)
    {
        logger_.error("Unhandled failure in " + request.method + ": " + e.what());
        response = make_error(request.id, error_code::InternalError, e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger_.debug("RESPONSE " + request.method + " (" + std::to_string(elapsed.count()) + "ms)");
    return response;
}

Message Dispatcher::route(Method method, const Request& request)
{
    if (!session_.initialized() && !allowed_before_initialize(method))
        return make_error(request.id, error_code::ServerNotInitialized, "Server not initialized");

    static const std::unordered_map<Method, Handler> handlers = {
        {Method::Initialize, &Dispatcher::handle_initialize},
        {Method::Ping, &Dispatcher::handle_ping},
        {Method::ToolsList, &Dispatcher::handle_tools_list},
        {Method::ToolsCall, &Dispatcher::handle_tools_call},
        {Method::PromptsList, &Dispatcher::handle_prompts_list},
        {Method::PromptsGet, &Dispatcher::handle_prompts_get},
    };
    return (this->*handlers.at(method))(request);
}

Message Dispatcher::handle_initialize(const Request& request)
{
    logger_.info("Starting initialization...");
    if (request.params.is_object() && request.params.contains("protocolVersion"))
        logger_.debug("Client protocol version: " + request.params["protocolVersion"].dump());

    try
    {
        session_.initialize([this]() { (void)upstream_.search(options_.probe_query); });
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Initialization failed: ") + e.what());
        return make_error(request.id, error_code::InternalError,
                          std::string("Initialization failed: ") + e.what());
    }
    logger_.info("Server initialization complete");

    return make_result(request.id, Json{
                                       {"protocolVersion", kProtocolVersion},
                                       {"capabilities", session_.capabilities()},
                                       {"serverInfo", session_.server_info()},
                                   });
}

Message Dispatcher::handle_ping(const Request& request)
{
    return make_result(request.id, Json::object());
}

Message Dispatcher::handle_tools_list(const Request& request)
{
    Json tools_array = Json::array();
    for (const auto& tool : tools_.list())
        tools_array.push_back(tool.descriptor());
    return make_result(request.id, Json{{"tools", tools_array}});
}

Message Dispatcher::handle_tools_call(const Request& request)
{
    const auto& params = request.params;
    if (!params.is_object())
        return make_error(request.id, error_code::InvalidRequest, "params must be an object");

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string())
        return make_error(request.id, error_code::InvalidRequest, "Missing tool name");
    const auto name = name_it->get<std::string>();
    if (name.empty())
        return make_error(request.id, error_code::InvalidRequest, "Missing tool name");
    Json args = params.value("arguments", Json::object());
    if (args.is_null())
        args = Json::object();

    logger_.debug("Calling tool " + name);
    auto outcome = tools_.dispatch(name, args);
    if (auto* result = std::get_if<ToolResult>(&outcome))
        return make_result(request.id, Json(*result));

    const auto& failure = std::get<tools::ToolError>(outcome);
    logger_.warning("Tool " + name + " failed (" + tools::to_string(failure.kind) +
                    "): " + failure.message);
    return make_error(request.id, error_code::InternalError, failure.message,
                      Json{{"kind", tools::to_string(failure.kind)}});
}

Message Dispatcher::handle_prompts_list(const Request& request)
{
    Json prompts_array = Json::array();
    for (const auto& prompt : prompts_.list())
        prompts_array.push_back(prompt.descriptor());
    return make_result(request.id, Json{{"prompts", prompts_array}});
}

Message Dispatcher::handle_prompts_get(const Request& request)
{
    const auto& params = request.params;
    std::string name;
    if (params.is_object() && params.contains("name") && params["name"].is_string())
        name = params["name"].get<std::string>();
    if (name.empty())
        return make_error(request.id, error_code::InvalidParams, "Missing prompt name");

    try
    {
        Json args = params.value("arguments", Json::object());
        auto messages = prompts_.render(name, args.is_null() ? Json::object() : args);

        Json messages_array = Json::array();
        for (const auto& msg : messages)
            messages_array.push_back(
                {{"role", msg.role}, {"content", Json{{"type", "text"}, {"text", msg.content}}}});

        Json result = {{"messages", messages_array}};
        const auto& prompt = prompts_.get(name);
        if (prompt.description)
            result["description"] = *prompt.description;
        return make_result(request.id, result);
    }
    catch (const NotFoundError& e)
    {
        return make_error(request.id, error_code::InvalidParams, e.what());
    }
    catch (const ValidationError& e)
    {
        return make_error(request.id, error_code::InvalidParams, e.what());
    }
    catch (const std::exception& e)
    {
        return make_error(request.id, error_code::InternalError, e.what());
    }
}

} // namespace oshub::mcp
