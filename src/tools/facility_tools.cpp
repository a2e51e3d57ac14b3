#include "oshub/tools/facility_tools.hpp"

#include "oshub/util/json.hpp"

namespace oshub::tools
{

namespace
{

Json string_arg_schema(const std::string& arg, const std::string& description)
{
    return Json{{"type", "object"},
                {"properties", {{arg, {{"type", "string"}, {"description", description}}}}},
                {"required", Json::array({arg})}};
}

} // namespace

std::string facility_not_found_text(const std::string& os_id)
{
    return "Facility with os_id '" + os_id + "' was not found.";
}

void register_facility_tools(ToolManager& tools, upstream::UpstreamClient& client)
{
    auto* upstream = &client;

    tools.register_tool(Tool{
        "search_facilities", "Search for facilities by query in Open Supply Hub.",
        string_arg_schema("query", "Query string to search for facilities."),
        [upstream](const Json& args) -> ToolOutcome
        {
            const auto query = args.at("query").get<std::string>();
            if (query.empty())
                return ToolError{FailureKind::InvalidArguments, "Missing 'query' in arguments."};
            auto data = upstream->search(query);
            return ToolResult::text(util::json::dump_pretty(data));
        }});

    tools.register_tool(Tool{
        "get_facility_details", "Get details for a single facility by its Open Supply Hub OS ID.",
        string_arg_schema("os_id", "OS ID of the facility, e.g. CN2019303BQ3FZP."),
        [upstream](const Json& args) -> ToolOutcome
        {
            const auto os_id = args.at("os_id").get<std::string>();
            if (os_id.empty())
                return ToolError{FailureKind::InvalidArguments, "Missing 'os_id' in arguments."};
            auto record = upstream->get_by_id(os_id);
            if (!record)
                return ToolResult::text(facility_not_found_text(os_id));
            return ToolResult::text(util::json::dump_pretty(*record));
        }});
}

} // namespace oshub::tools
