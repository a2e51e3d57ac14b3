#pragma once
#include "oshub/types.hpp"

#include <string>
#include <vector>

namespace oshub
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

/// Successful tool output: an ordered sequence of content blocks.
struct ToolResult
{
    std::vector<TextContent> content;

    static ToolResult text(std::string body)
    {
        ToolResult r;
        r.content.push_back(TextContent{"text", std::move(body)});
        return r;
    }
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void to_json(Json& j, const ToolResult& r)
{
    Json blocks = Json::array();
    for (const auto& c : r.content)
        blocks.push_back(c);
    j = Json{{"content", blocks}, {"isError", false}};
}

} // namespace oshub
