#include "oshub/prompts/manager.hpp"

#include "oshub/exceptions.hpp"

namespace oshub::prompts
{

Json Prompt::descriptor() const
{
    Json prompt_json = {{"name", name}};
    if (description)
        prompt_json["description"] = *description;
    if (!arguments.empty())
    {
        Json args_array = Json::array();
        for (const auto& arg : arguments)
        {
            Json arg_json = {{"name", arg.name}, {"required", arg.required}};
            if (arg.description)
                arg_json["description"] = *arg.description;
            args_array.push_back(arg_json);
        }
        prompt_json["arguments"] = args_array;
    }
    return prompt_json;
}

void PromptManager::add(Prompt p)
{
    if (has(p.name))
        throw Error("prompt already registered: " + p.name);
    index_.emplace(p.name, prompts_.size());
    prompts_.push_back(std::move(p));
}

const Prompt& PromptManager::get(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        throw NotFoundError("Unknown prompt: " + name);
    return prompts_[it->second];
}

std::vector<PromptMessage> PromptManager::render(const std::string& name,
                                                 const Json& arguments) const
{
    const auto& prompt = get(name);
    if (!arguments.is_object())
        throw ValidationError("arguments must be an object");

    for (const auto& arg : prompt.arguments)
    {
        if (!arg.required)
            continue;
        auto it = arguments.find(arg.name);
        if (it == arguments.end() || it->is_null() || (it->is_string() && it->get_ref<const std::string&>().empty()))
            throw ValidationError("Missing required argument '" + arg.name + "'.");
    }

    if (!prompt.generator)
        return {};
    return prompt.generator(arguments);
}

} // namespace oshub::prompts
