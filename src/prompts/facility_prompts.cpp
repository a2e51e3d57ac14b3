#include "oshub/prompts/facility_prompts.hpp"

#include "oshub/exceptions.hpp"
#include "oshub/util/json.hpp"

namespace oshub::prompts
{

void register_facility_prompts(PromptManager& prompts, upstream::UpstreamClient& client)
{
    auto* upstream = &client;

    Prompt search;
    search.name = "search_facilities";
    search.description = "Search facilities in Open Supply Hub";
    search.arguments = {
        PromptArgument{"query", std::string("Search query for facility name or other fields"),
                       true}};
    search.generator = [upstream](const Json& args)
    {
        const auto& q = args.at("query");
        if (!q.is_string())
            throw ValidationError("Argument 'query' must be a string.");
        const auto query = q.get<std::string>();
        auto data = upstream->search(query);

        std::string text = "Here are the Open Supply Hub facilities matching \"" + query +
                           "\". Summarize them for the user.\n\n" +
                           util::json::dump_pretty(data);
        return std::vector<PromptMessage>{PromptMessage{"user", std::move(text)}};
    };
    prompts.add(std::move(search));
}

} // namespace oshub::prompts
