#include "../test_helpers.hpp"
#include "oshub/prompts/facility_prompts.hpp"
#include "oshub/prompts/manager.hpp"

#include <cassert>
#include <string>

int main()
{
    using namespace oshub;
    using namespace oshub::prompts;

    // Generic manager behaviour
    PromptManager pm;
    Prompt greet;
    greet.name = "greet";
    greet.arguments = {PromptArgument{"who", std::nullopt, true},
                       PromptArgument{"tone", std::string("formal or casual"), false}};
    greet.generator = [](const Json& args)
    {
        return std::vector<PromptMessage>{
            PromptMessage{"user", "Hello " + args.at("who").get<std::string>()}};
    };
    pm.add(greet);
    assert(pm.has("greet"));
    assert(pm.list().size() == 1);

    // Names are unique, same rule as the tool registry
    bool duplicate = false;
    try { pm.add(greet); } catch (const Error&) { duplicate = true; }
    assert(duplicate);
    assert(pm.list().size() == 1);

    auto d = pm.get("greet").descriptor();
    assert(d["name"] == "greet");
    assert(!d.contains("description"));
    assert(d["arguments"].size() == 2);
    assert(d["arguments"][0]["required"] == true);
    assert(d["arguments"][1]["description"] == "formal or casual");

    auto msgs = pm.render("greet", Json{{"who", "Ada"}});
    assert(msgs.size() == 1 && msgs[0].content == "Hello Ada");

    bool threw = false;
    try { pm.render("greet", Json::object()); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { pm.render("nope", Json::object()); } catch (const NotFoundError&) { threw = true; }
    assert(threw);

    // search_facilities prompt
    test::FakeUpstream upstream;
    PromptManager facility;
    register_facility_prompts(facility, upstream);
    assert(facility.list().size() == 1);
    const auto& p = facility.get("search_facilities");
    assert(p.description && *p.description == "Search facilities in Open Supply Hub");
    assert(p.arguments.size() == 1 && p.arguments[0].name == "query" && p.arguments[0].required);

    msgs = facility.render("search_facilities", Json{{"query", "acme"}});
    assert(msgs.size() == 1);
    assert(msgs[0].role == "user");
    assert(msgs[0].content.find("acme") != std::string::npos);
    assert(msgs[0].content.find("Acme Garments Ltd") != std::string::npos);
    assert(upstream.queries.size() == 1);

    threw = false;
    try { facility.render("search_facilities", Json{{"query", ""}}); }
    catch (const ValidationError& e) { threw = std::string(e.what()).find("'query'") != std::string::npos; }
    assert(threw);
    assert(upstream.queries.size() == 1);
    return 0;
}
