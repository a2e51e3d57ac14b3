#pragma once
#include "oshub/mcp/message.hpp"
#include "oshub/mcp/session.hpp"
#include "oshub/prompts/manager.hpp"
#include "oshub/tools/manager.hpp"
#include "oshub/upstream/client.hpp"
#include "oshub/util/log.hpp"

#include <optional>
#include <string>

namespace oshub::mcp
{

/// Protocol version announced by initialize. Capabilities are plain booleans.
constexpr const char* kProtocolVersion = "1.0";

/// Methods understood by the dispatcher. Anything else is "method not found".
enum class Method
{
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    PromptsList,
    PromptsGet
};

std::optional<Method> method_from_string(const std::string& name);
const char* to_string(Method method);

/// Methods answered before the initialize handshake has succeeded.
bool allowed_before_initialize(Method method);

struct DispatcherOptions
{
    ServerInfo server_info{"opensupplyhub-server", "0.1.0"};
    bool enable_prompts{true};
    std::string probe_query{"test"};
};

/**
 * Request router for one session.
 *
 * Owns the Session and maps each Request to exactly one Response or
 * ErrorResponse carrying the request's id. handle() never throws.
 *
 * Routing:
 * - "initialize"   - liveness probe against the upstream, then handshake result
 * - "ping"         - empty result
 * - "tools/list"   - registered tools in registration order
 * - "tools/call"   - validated dispatch through the ToolManager (needs initialize)
 * - "prompts/list" - registered prompts (when prompts are enabled)
 * - "prompts/get"  - rendered prompt messages (needs initialize)
 */
class Dispatcher
{
  public:
    Dispatcher(DispatcherOptions options, const tools::ToolManager& tools,
               const prompts::PromptManager& prompts, upstream::UpstreamClient& upstream,
               const util::Logger& logger);

    Message handle(const Request& request);

    const Session& session() const
    {
        return session_;
    }

  private:
    using Handler = Message (Dispatcher::*)(const Request&);

    Message route(Method method, const Request& request);
    Message handle_initialize(const Request& request);
    Message handle_ping(const Request& request);
    Message handle_tools_list(const Request& request);
    Message handle_tools_call(const Request& request);
    Message handle_prompts_list(const Request& request);
    Message handle_prompts_get(const Request& request);

    DispatcherOptions options_;
    const tools::ToolManager& tools_;
    const prompts::PromptManager& prompts_;
    upstream::UpstreamClient& upstream_;
    const util::Logger& logger_;
    Session session_;
};

} // namespace oshub::mcp
