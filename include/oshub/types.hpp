#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace oshub
{

using Json = nlohmann::json;

/// Server identity advertised in the initialize handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
};

/// Capability set declared during capability negotiation.
/// Single protocol shape: booleans per feature category.
struct Capabilities
{
    bool tools{true};
    bool resources{false};
    bool prompts{true};
};

// nlohmann::json adapters
inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    info.version = j.at("version").get<std::string>();
}

inline void to_json(Json& j, const Capabilities& caps)
{
    j = Json{{"tools", caps.tools}, {"resources", caps.resources}, {"prompts", caps.prompts}};
}

} // namespace oshub
