#include "oshub/tools/manager.hpp"

#include "oshub/util/json_schema.hpp"

namespace oshub::tools
{

void ToolManager::register_tool(Tool t)
{
    if (has(t.name()))
        throw Error("tool already registered: " + t.name());
    index_.emplace(t.name(), tools_.size());
    tools_.push_back(std::move(t));
}

const Tool& ToolManager::get(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        throw NotFoundError("Unknown tool: " + name);
    return tools_[it->second];
}

ToolOutcome ToolManager::dispatch(const std::string& name, const Json& arguments) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return ToolError{FailureKind::UnknownTool, "Unknown tool: " + name};
    const auto& tool = tools_[it->second];

    try
    {
        util::schema::validate(tool.input_schema(), arguments);
    }
    catch (const ValidationError& e)
    {
        return ToolError{FailureKind::InvalidArguments, e.what()};
    }

    try
    {
        return tool.invoke(arguments);
    }
    catch (const TransportError& e)
    {
        return ToolError{FailureKind::UpstreamFailure, e.what()};
    }
    catch (const UpstreamError& e)
    {
        return ToolError{FailureKind::UpstreamFailure, e.what()};
    }
    catch (const ValidationError& e)
    {
        return ToolError{FailureKind::InvalidArguments, e.what()};
    }
    catch (const std::exception& e)
    {
        return ToolError{FailureKind::Internal, e.what()};
    }
}

} // namespace oshub::tools
