#pragma once

/// @file oshub.hpp
/// @brief Main header for oshub - includes every public component
///
/// Usage:
/// @code
/// #include <oshub.hpp>
///
/// int main() {
///     oshub::util::Logger logger;
///     oshub::upstream::HttpUpstreamClient upstream({base_url, api_key}, &logger);
///
///     oshub::tools::ToolManager tools;
///     oshub::tools::register_facility_tools(tools, upstream);
///     oshub::prompts::PromptManager prompts;
///
///     oshub::mcp::Dispatcher dispatcher({}, tools, prompts, upstream, logger);
///     oshub::server::StdioServer server(dispatcher, logger);
///     return server.run(std::cin, std::cout);
/// }
/// @endcode

// Core types and exceptions
#include "oshub/types.hpp"
#include "oshub/exceptions.hpp"
#include "oshub/content.hpp"
#include "oshub/settings.hpp"
#include "oshub/version.hpp"

// Utilities
#include "oshub/util/json.hpp"
#include "oshub/util/json_schema.hpp"
#include "oshub/util/log.hpp"

// Upstream data provider
#include "oshub/upstream/client.hpp"

// Tools and prompts
#include "oshub/tools/tool.hpp"
#include "oshub/tools/manager.hpp"
#include "oshub/tools/facility_tools.hpp"
#include "oshub/prompts/prompt.hpp"
#include "oshub/prompts/manager.hpp"
#include "oshub/prompts/facility_prompts.hpp"

// Protocol
#include "oshub/mcp/message.hpp"
#include "oshub/mcp/session.hpp"
#include "oshub/mcp/handler.hpp"

// Transport
#include "oshub/server/stdio_server.hpp"

// Command line
#include "oshub/cli/options.hpp"
