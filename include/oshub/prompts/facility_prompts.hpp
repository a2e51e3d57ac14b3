#pragma once
#include "oshub/prompts/manager.hpp"
#include "oshub/upstream/client.hpp"

namespace oshub::prompts
{

/// Registers the search_facilities prompt. `client` must outlive `prompts`.
void register_facility_prompts(PromptManager& prompts, upstream::UpstreamClient& client);

} // namespace oshub::prompts
