/// @file dispatcher.cpp
/// @brief Tests for request routing, session gating and error codes

#include "../test_helpers.hpp"
#include "oshub/mcp/handler.hpp"
#include "oshub/prompts/facility_prompts.hpp"
#include "oshub/tools/facility_tools.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace oshub;
using namespace oshub::mcp;
using oshub::test::call_params;
using oshub::test::make_request;

namespace
{

struct Fixture
{
    test::FakeUpstream upstream;
    tools::ToolManager tools;
    prompts::PromptManager prompts;
    util::Logger logger = util::Logger::silent();
    Dispatcher dispatcher;

    explicit Fixture(bool enable_prompts = true)
        : dispatcher(make_options(enable_prompts), tools, prompts, upstream, logger)
    {
        tools::register_facility_tools(tools, upstream);
        prompts::register_facility_prompts(prompts, upstream);
    }

    static DispatcherOptions make_options(bool enable_prompts)
    {
        DispatcherOptions o;
        o.server_info = ServerInfo{"test_server", "9.9.9"};
        o.enable_prompts = enable_prompts;
        o.probe_query = "probe";
        return o;
    }

    Json send(Json id, const std::string& method, Json params = Json::object())
    {
        return to_json(dispatcher.handle(make_request(std::move(id), method, std::move(params))));
    }

    void initialize()
    {
        auto resp = send(0, "initialize");
        assert(resp.contains("result"));
    }
};

int error_code_of(const Json& resp)
{
    assert(resp.contains("error"));
    assert(!resp.contains("result"));
    return resp["error"]["code"].get<int>();
}

} // namespace

void test_method_table()
{
    assert(method_from_string("tools/call") == Method::ToolsCall);
    assert(!method_from_string("resources/list"));
    assert(std::string(to_string(Method::PromptsGet)) == "prompts/get");
    assert(allowed_before_initialize(Method::ToolsList));
    assert(allowed_before_initialize(Method::Initialize));
    assert(!allowed_before_initialize(Method::ToolsCall));
    assert(!allowed_before_initialize(Method::PromptsGet));
}

void test_scenario()
{
    Fixture f;

    auto init = f.send(1, "initialize");
    assert(init["id"] == 1);
    assert(init["jsonrpc"] == "2.0");
    const auto& r = init["result"];
    assert(r["protocolVersion"] == kProtocolVersion);
    assert(r["capabilities"]["tools"] == true);
    assert(r["capabilities"]["resources"] == false);
    assert(r["capabilities"]["prompts"] == true);
    assert(r["serverInfo"]["name"] == "test_server");
    assert(r["serverInfo"]["version"] == "9.9.9");
    assert(f.upstream.queries.size() == 1 && f.upstream.queries[0] == "probe");
    assert(f.dispatcher.session().initialized());

    auto list = f.send(2, "tools/list");
    assert(list["id"] == 2);
    const auto& tools = list["result"]["tools"];
    assert(tools.size() == 2);
    assert(tools[0]["name"] == "search_facilities");
    assert(tools[1]["name"] == "get_facility_details");
    assert(tools[0]["inputSchema"]["required"][0] == "query");
    assert(tools[1].contains("description"));

    auto call = f.send(3, "tools/call", call_params("search_facilities", Json{{"query", "acme"}}));
    assert(call["id"] == 3);
    const auto& content = call["result"]["content"];
    assert(content.size() == 1);
    assert(content[0]["type"] == "text");
    assert(Json::parse(content[0]["text"].get<std::string>()) == f.upstream.search_result);
    assert(call["result"]["isError"] == false);
    std::cout << "[PASS] initialize -> tools/list -> tools/call scenario\n";
}

void test_gating_before_initialize()
{
    Fixture f;

    auto resp = f.send("a", "tools/call", call_params("search_facilities", Json{{"query", "x"}}));
    assert(resp["id"] == "a");
    assert(error_code_of(resp) == error_code::ServerNotInitialized);
    assert(f.upstream.queries.empty());

    resp = f.send("b", "prompts/get", Json{{"name", "search_facilities"}, {"arguments", {{"query", "x"}}}});
    assert(error_code_of(resp) == error_code::ServerNotInitialized);

    // Discovery is allowed
    assert(f.send(5, "tools/list").contains("result"));
    assert(f.send(6, "prompts/list").contains("result"));
    assert(f.send(7, "ping")["result"].empty());
    assert(!f.dispatcher.session().initialized());
    std::cout << "[PASS] session gating\n";
}

void test_initialize_probe_failure_and_retry()
{
    Fixture f;
    f.upstream.fail_search = true;

    auto resp = f.send(1, "initialize");
    assert(resp["id"] == 1);
    assert(error_code_of(resp) == error_code::InternalError);
    assert(resp["error"]["message"].get<std::string>().find("Initialization failed") == 0);
    assert(!f.dispatcher.session().initialized());

    f.upstream.fail_search = false;
    assert(f.send(2, "initialize").contains("result"));
    assert(f.dispatcher.session().initialized());

    // Second initialize re-runs the probe; a failure does not uninitialize
    size_t probes = f.upstream.queries.size();
    f.upstream.fail_search = true;
    resp = f.send(3, "initialize");
    assert(resp.contains("error"));
    assert(f.upstream.queries.size() == probes + 1);
    assert(f.dispatcher.session().initialized());

    f.upstream.fail_search = false;
    assert(f.send(4, "initialize").contains("result"));
    assert(f.upstream.queries.size() == probes + 2);
    std::cout << "[PASS] initialize probe failure and retry\n";
}

void test_tools_call_errors()
{
    Fixture f;
    f.initialize();
    size_t searches = f.upstream.queries.size();

    // Unknown tool
    auto resp = f.send(10, "tools/call", call_params("nonexistent_tool", Json::object()));
    assert(resp["id"] == 10);
    assert(error_code_of(resp) == error_code::InternalError);
    assert(resp["error"]["data"]["kind"] == "unknown_tool");

    // Missing tool name
    resp = f.send(11, "tools/call", Json{{"arguments", Json::object()}});
    assert(error_code_of(resp) == error_code::InvalidRequest);

    // Params that are not an object
    resp = f.send(12, "tools/call", Json::array({1, 2}));
    assert(error_code_of(resp) == error_code::InvalidRequest);

    // Missing required argument: cited, upstream untouched
    resp = f.send(13, "tools/call", call_params("search_facilities", Json::object()));
    assert(error_code_of(resp) == error_code::InternalError);
    assert(resp["error"]["message"].get<std::string>().find("query") != std::string::npos);
    assert(resp["error"]["data"]["kind"] == "invalid_arguments");
    assert(f.upstream.queries.size() == searches);

    // Arguments omitted entirely behave like {}
    resp = f.send(14, "tools/call", Json{{"name", "search_facilities"}});
    assert(resp["error"]["data"]["kind"] == "invalid_arguments");

    // Upstream failure
    f.upstream.fail_lookup = true;
    resp = f.send(15, "tools/call", call_params("get_facility_details", Json{{"os_id", "CN2019303BQ3FZP"}}));
    assert(error_code_of(resp) == error_code::InternalError);
    assert(resp["error"]["data"]["kind"] == "upstream_failure");
    std::cout << "[PASS] tools/call errors\n";
}

void test_not_found_is_content()
{
    Fixture f;
    f.initialize();
    auto resp = f.send(20, "tools/call", call_params("get_facility_details", Json{{"os_id", "NOPE"}}));
    assert(resp.contains("result"));
    auto text = resp["result"]["content"][0]["text"].get<std::string>();
    assert(text == tools::facility_not_found_text("NOPE"));
    std::cout << "[PASS] not found is content\n";
}

void test_unknown_method()
{
    Fixture f;
    auto resp = f.send("x", "resources/list");
    assert(resp["id"] == "x");
    assert(error_code_of(resp) == error_code::MethodNotFound);
    assert(resp["error"]["message"] == "Method 'resources/list' not found");
    std::cout << "[PASS] unknown method\n";
}

void test_prompts()
{
    Fixture f;
    auto list = f.send(1, "prompts/list");
    assert(list["result"]["prompts"].size() == 1);
    assert(list["result"]["prompts"][0]["name"] == "search_facilities");
    assert(list["result"]["prompts"][0]["arguments"][0]["name"] == "query");

    f.initialize();
    auto got = f.send(2, "prompts/get", Json{{"name", "search_facilities"}, {"arguments", {{"query", "acme"}}}});
    assert(got["result"]["description"] == "Search facilities in Open Supply Hub");
    const auto& msgs = got["result"]["messages"];
    assert(msgs.size() == 1);
    assert(msgs[0]["role"] == "user");
    assert(msgs[0]["content"]["type"] == "text");

    auto missing = f.send(3, "prompts/get", Json{{"name", "search_facilities"}});
    assert(error_code_of(missing) == error_code::InvalidParams);
    assert(missing["error"]["message"] == "Missing required argument 'query'.");

    assert(error_code_of(f.send(4, "prompts/get", Json::object())) == error_code::InvalidParams);
    assert(error_code_of(f.send(5, "prompts/get", Json{{"name", "nope"}})) == error_code::InvalidParams);

    f.upstream.fail_search = true;
    auto failed = f.send(6, "prompts/get", Json{{"name", "search_facilities"}, {"arguments", {{"query", "acme"}}}});
    assert(error_code_of(failed) == error_code::InternalError);
    std::cout << "[PASS] prompts\n";
}

void test_prompts_disabled()
{
    Fixture f(false);
    auto init = f.send(1, "initialize");
    assert(init["result"]["capabilities"]["prompts"] == false);
    assert(error_code_of(f.send(2, "prompts/list")) == error_code::MethodNotFound);
    assert(error_code_of(f.send(3, "prompts/get", Json{{"name", "search_facilities"}})) ==
           error_code::MethodNotFound);
    std::cout << "[PASS] prompts disabled\n";
}

void test_id_type_preserved()
{
    Fixture f;
    auto resp = f.send("42", "ping");
    assert(resp["id"].is_string());
    resp = f.send(42, "ping");
    assert(resp["id"].is_number_integer());
    std::cout << "[PASS] id type preserved\n";
}

int main()
{
    test_method_table();
    test_scenario();
    test_gating_before_initialize();
    test_initialize_probe_failure_and_retry();
    test_tools_call_errors();
    test_not_found_is_content();
    test_unknown_method();
    test_prompts();
    test_prompts_disabled();
    test_id_type_preserved();
    return 0;
}
