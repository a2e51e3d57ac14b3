#pragma once
#include "oshub/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace oshub::prompts
{

/// MCP Prompt argument definition
struct PromptArgument
{
    std::string name;
    std::optional<std::string> description;
    bool required{false};
};

/// MCP Prompt message
struct PromptMessage
{
    std::string role;    // "user", "assistant"
    std::string content; // Message text
};

/// MCP Prompt definition
struct Prompt
{
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
    std::function<std::vector<PromptMessage>(const Json&)> generator;

    /// Entry as advertised by prompts/list.
    Json descriptor() const;
};

} // namespace oshub::prompts
