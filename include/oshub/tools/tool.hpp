#pragma once
#include "oshub/content.hpp"
#include "oshub/types.hpp"

#include <functional>
#include <string>
#include <variant>

namespace oshub::tools
{

enum class FailureKind
{
    UnknownTool,
    InvalidArguments,
    UpstreamFailure,
    Internal
};

inline std::string to_string(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::UnknownTool:
        return "unknown_tool";
    case FailureKind::InvalidArguments:
        return "invalid_arguments";
    case FailureKind::UpstreamFailure:
        return "upstream_failure";
    case FailureKind::Internal:
        return "internal";
    }
    return "internal";
}

struct ToolError
{
    FailureKind kind;
    std::string message;
};

/// Ok(ToolResult) | Err(ToolError)
using ToolOutcome = std::variant<ToolResult, ToolError>;

inline bool succeeded(const ToolOutcome& outcome)
{
    return std::holds_alternative<ToolResult>(outcome);
}

class Tool
{
  public:
    using Fn = std::function<ToolOutcome(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    ToolOutcome invoke(const Json& arguments) const
    {
        return fn_(arguments);
    }

    /// Descriptor as advertised by tools/list.
    Json descriptor() const
    {
        Json entry = {{"name", name_}};
        if (!description_.empty())
            entry["description"] = description_;
        entry["inputSchema"] = input_schema_.is_null() ? Json::object() : input_schema_;
        return entry;
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
};

} // namespace oshub::tools
