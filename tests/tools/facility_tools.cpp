/// @file facility_tools.cpp
/// @brief Tests for search_facilities and get_facility_details

#include "../test_helpers.hpp"
#include "oshub/tools/facility_tools.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace oshub;
using namespace oshub::tools;

int main()
{
    test::FakeUpstream upstream;
    ToolManager tm;
    register_facility_tools(tm, upstream);

    assert(tm.size() == 2);
    assert(tm.list()[0].name() == "search_facilities");
    assert(tm.list()[1].name() == "get_facility_details");

    // search returns the serialized result document as one text block
    {
        auto out = tm.dispatch("search_facilities", Json{{"query", "acme"}});
        assert(succeeded(out));
        const auto& result = std::get<ToolResult>(out);
        assert(result.content.size() == 1);
        assert(result.content[0].type == "text");
        assert(Json::parse(result.content[0].text) == upstream.search_result);
        assert(upstream.queries.size() == 1 && upstream.queries[0] == "acme");
        std::cout << "[PASS] search_facilities returns results\n";
    }

    // missing query: error citing the argument, upstream untouched
    {
        upstream.queries.clear();
        auto out = tm.dispatch("search_facilities", Json::object());
        assert(!succeeded(out));
        const auto& err = std::get<ToolError>(out);
        assert(err.kind == FailureKind::InvalidArguments);
        assert(err.message.find("query") != std::string::npos);

        out = tm.dispatch("search_facilities", Json{{"query", ""}});
        assert(std::get<ToolError>(out).kind == FailureKind::InvalidArguments);
        assert(upstream.queries.empty());
        std::cout << "[PASS] search_facilities validates query\n";
    }

    // upstream failure surfaces as a handler error
    {
        upstream.fail_search = true;
        auto out = tm.dispatch("search_facilities", Json{{"query", "acme"}});
        assert(std::get<ToolError>(out).kind == FailureKind::UpstreamFailure);
        upstream.fail_search = false;
        std::cout << "[PASS] search_facilities upstream failure\n";
    }

    // details for a known facility
    {
        auto out = tm.dispatch("get_facility_details", Json{{"os_id", "CN2019303BQ3FZP"}});
        const auto& result = std::get<ToolResult>(out);
        assert(Json::parse(result.content[0].text)["name"] == "Acme Garments Ltd");
        std::cout << "[PASS] get_facility_details found\n";
    }

    // not found is content, not an error
    {
        auto out = tm.dispatch("get_facility_details", Json{{"os_id", "XX000"}});
        assert(succeeded(out));
        assert(std::get<ToolResult>(out).content[0].text == facility_not_found_text("XX000"));
        assert(facility_not_found_text("XX000").find("not found") != std::string::npos);
        std::cout << "[PASS] get_facility_details not found\n";
    }

    // any other failure is an error
    {
        upstream.fail_lookup = true;
        auto out = tm.dispatch("get_facility_details", Json{{"os_id", "CN2019303BQ3FZP"}});
        assert(std::get<ToolError>(out).kind == FailureKind::UpstreamFailure);
        std::cout << "[PASS] get_facility_details transport failure\n";
    }

    return 0;
}
