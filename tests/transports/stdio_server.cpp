/// @file stdio_server.cpp
/// @brief StdioServerWrapper over in-memory streams

#include "spotifymcp/server/stdio_server.hpp"
#include "spotifymcp/util/log.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace spotifymcp;

static std::vector<Json> read_responses(const std::string& text)
{
    std::vector<Json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        if (!line.empty())
            out.push_back(Json::parse(line));
    return out;
}

static void build(tools::ToolRegistry& registry, int& calls)
{
    registry.register_tool(tools::Tool(
        "add", "Add two integers",
        tools::InputSchema{tools::FieldSpec::integer("a").required(),
                           tools::FieldSpec::integer("b").required()},
        [&calls](const Json& args)
        {
            ++calls;
            return tools::HandlerOutcome::success(
                Json{{"sum", args["a"].get<long long>() + args["b"].get<long long>()}});
        }));
}

void test_session_in_order()
{
    std::cout << "test_session_in_order...\n";
    tools::ToolRegistry registry;
    int calls = 0;
    build(registry, calls);
    mcp::Dispatcher dispatcher(registry);

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
        "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
        "\n\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
        "\r\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3}}})"
        "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"add","arguments":{"a":2}}})"
        "\n");
    std::ostringstream out;

    server::StdioServerWrapper srv(mcp::ServerInfo{}, dispatcher, in, out);
    assert(srv.run());
    assert(!srv.faulted());
    assert(srv.session_state() == mcp::SessionState::Closed);

    auto responses = read_responses(out.str());
    assert(responses.size() == 4);
    assert(responses[0]["id"] == 1);
    assert(responses[1]["id"] == 2);
    assert(responses[1]["result"]["tools"][0]["name"] == "add");
    assert(responses[2]["id"] == 3);
    assert(responses[2]["result"]["structuredContent"]["result"]["sum"] == 5);
    assert(responses[3]["id"] == 4);
    assert(responses[3]["result"]["isError"] == true);
    assert(responses[3]["result"]["structuredContent"]["error"] == "missing required field: b");
    assert(calls == 1);
    std::cout << "  [PASS]\n";
}

void test_parse_error_closes()
{
    std::cout << "test_parse_error_closes...\n";
    tools::ToolRegistry registry;
    int calls = 0;
    build(registry, calls);
    mcp::Dispatcher dispatcher(registry);

    std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"
                          "\n"
                          "{not json\n"
                          R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
                          "\n");
    std::ostringstream out;

    server::StdioServerWrapper srv(mcp::ServerInfo{}, dispatcher, in, out);
    assert(!srv.run());
    assert(srv.faulted());
    assert(srv.session_state() == mcp::SessionState::Closed);

    auto responses = read_responses(out.str());
    assert(responses.size() == 2);
    assert(responses[1]["error"]["code"] == mcp::PARSE_ERROR);
    assert(responses[1]["id"].is_null());
    std::cout << "  [PASS]\n";
}

void test_not_initialized()
{
    std::cout << "test_not_initialized...\n";
    tools::ToolRegistry registry;
    int calls = 0;
    build(registry, calls);
    mcp::Dispatcher dispatcher(registry);

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"add","arguments":{"a":1,"b":1}}})"
        "\n");
    std::ostringstream out;
    server::StdioServerWrapper srv(mcp::ServerInfo{}, dispatcher, in, out);
    assert(srv.run());

    auto responses = read_responses(out.str());
    assert(responses.size() == 1);
    assert(responses[0]["id"] == 7);
    assert(responses[0]["error"]["code"] == mcp::SERVER_NOT_INITIALIZED);
    assert(calls == 0);
    std::cout << "  [PASS]\n";
}

void test_empty_input()
{
    std::cout << "test_empty_input...\n";
    tools::ToolRegistry registry;
    mcp::Dispatcher dispatcher(registry);
    std::istringstream in("");
    std::ostringstream out;
    server::StdioServerWrapper srv(mcp::ServerInfo{}, dispatcher, in, out);
    assert(srv.run());
    assert(out.str().empty());
    assert(!srv.running());
    std::cout << "  [PASS]\n";
}

void test_async_run()
{
    std::cout << "test_async_run...\n";
    tools::ToolRegistry registry;
    int calls = 0;
    build(registry, calls);
    mcp::Dispatcher dispatcher(registry);

    std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                          "\n");
    std::ostringstream out;
    server::StdioServerWrapper srv(mcp::ServerInfo{}, dispatcher, in, out);
    assert(srv.start_async());
    srv.stop();
    assert(!srv.running());
    assert(srv.session_state() == mcp::SessionState::Closed);
    std::cout << "  [PASS]\n";
}

void test_restart_after_loop_ends()
{
    std::cout << "test_restart_after_loop_ends...\n";
    tools::ToolRegistry registry;
    mcp::Dispatcher dispatcher(registry);
    std::istringstream in("");
    std::ostringstream out;
    server::StdioServerWrapper srv(mcp::ServerInfo{}, dispatcher, in, out);

    assert(srv.start_async());
    // EOF ends the loop without stop()
    for (int i = 0; i < 500 && srv.running(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    assert(!srv.running());
    assert(srv.session_state() == mcp::SessionState::Closed);

    // Closed has no way back
    assert(!srv.start_async());
    assert(!srv.run());
    assert(!srv.running());
    srv.stop();
    std::cout << "  [PASS]\n";
}

int main()
{
    util::log::set_level(util::log::Level::Error);
    std::cout << "=== StdioServerWrapper Tests ===\n\n";
    test_session_in_order();
    test_parse_error_closes();
    test_not_initialized();
    test_empty_input();
    test_async_run();
    test_restart_after_loop_ends();
    std::cout << "\n=== All StdioServerWrapper tests passed ===\n";
    return 0;
}
