/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for the main oshub.hpp header
///
/// Verifies that including just <oshub.hpp> is enough to assemble a server.

#include "oshub.hpp"

#include "../test_helpers.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace oshub;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    test::FakeUpstream upstream;
    auto logger = util::Logger::silent();

    tools::ToolManager tools;
    tools::register_facility_tools(tools, upstream);
    prompts::PromptManager prompts;
    prompts::register_facility_prompts(prompts, upstream);

    mcp::Dispatcher dispatcher({}, tools, prompts, upstream, logger);
    server::StdioServer server(dispatcher, logger);

    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n");
    std::ostringstream out;
    assert(server.run(in, out) == server::kExitOk);
    assert(Json::parse(out.str())["result"]["serverInfo"]["name"] == "opensupplyhub-server");
    assert(std::string(VERSION_STRING) == "0.1.0");
    std::cout << "  PASSED" << std::endl;
    return 0;
}
