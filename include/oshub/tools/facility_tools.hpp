#pragma once
#include "oshub/tools/manager.hpp"
#include "oshub/upstream/client.hpp"

namespace oshub::tools
{

/// Registers search_facilities and get_facility_details, in that order.
/// `client` must outlive `tools`.
void register_facility_tools(ToolManager& tools, upstream::UpstreamClient& client);

/// Text returned by get_facility_details for an unknown OS ID.
std::string facility_not_found_text(const std::string& os_id);

} // namespace oshub::tools
