/// @file dispatcher.cpp
/// @brief Dispatch semantics: resolution, validation, handler faults, idempotence

#include "spotifymcp/mcp/dispatcher.hpp"
#include "spotifymcp/spotify/tools.hpp"
#include "spotifymcp/util/log.hpp"

#include "../spotify/fake_api.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace spotifymcp;
using namespace spotifymcp::tools;
using mcp::CallRequest;
using mcp::Dispatcher;

struct Counters
{
    std::atomic<int> calls{0};
    Json last_args;
};

void build_registry(ToolRegistry& reg, Counters& c)
{
    reg.register_tool(Tool("greet", "Say hello",
                           InputSchema{
                               FieldSpec::string("name").required(),
                               FieldSpec::integer("times").between(1, 5).with_default(1),
                           },
                           [&c](const Json& args)
                           {
                               ++c.calls;
                               c.last_args = args;
                               return HandlerOutcome::success(
                                   Json{{"greeting", "hello " + args["name"].get<std::string>()}});
                           }));
    reg.register_tool(Tool("refuse", "Always fails", InputSchema{},
                           [&c](const Json&)
                           {
                               ++c.calls;
                               return HandlerOutcome::failure("not today");
                           }));
    reg.register_tool(Tool("explode", "Always throws", InputSchema{},
                           [&c](const Json&) -> HandlerOutcome
                           {
                               ++c.calls;
                               throw std::runtime_error("boom");
                           }));
}

void test_unknown_tool()
{
    std::cout << "test_unknown_tool...\n";
    ToolRegistry reg;
    Counters c;
    build_registry(reg, c);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"nonexistent_tool", Json::object()});
    assert(!env.success());
    assert(*env.error() == "unknown tool: nonexistent_tool");
    assert(env.result().is_null());
    assert(c.calls == 0);
    std::cout << "  [PASS]\n";
}

void test_validation_failure_skips_handler()
{
    std::cout << "test_validation_failure_skips_handler...\n";
    ToolRegistry reg;
    Counters c;
    build_registry(reg, c);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"greet", Json::object()});
    assert(!env.success());
    assert(env.error()->find("missing required field: name") != std::string::npos);

    env = d.dispatch(CallRequest{"greet", Json{{"name", "x"}, {"times", 9}}});
    assert(!env.success());
    assert(env.error()->find("out of range") != std::string::npos);
    assert(c.calls == 0);
    std::cout << "  [PASS]\n";
}

void test_handler_sees_defaults()
{
    std::cout << "test_handler_sees_defaults...\n";
    ToolRegistry reg;
    Counters c;
    build_registry(reg, c);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"greet", Json{{"name", "ada"}, {"ignored", 1}}});
    assert(env.success());
    assert(env.result()["greeting"] == "hello ada");
    assert(c.last_args == (Json{{"name", "ada"}, {"times", 1}}));
    assert(c.calls == 1);
    std::cout << "  [PASS]\n";
}

void test_handler_failure_and_exception()
{
    std::cout << "test_handler_failure_and_exception...\n";
    ToolRegistry reg;
    Counters c;
    build_registry(reg, c);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"refuse", Json::object()});
    assert(!env.success());
    assert(*env.error() == "not today");

    env = d.dispatch(CallRequest{"explode", Json::object()});
    assert(!env.success());
    assert(env.error()->find("boom") != std::string::npos);
    assert(env.error()->find("explode") != std::string::npos);
    assert(c.calls == 2);
    std::cout << "  [PASS]\n";
}

void test_repeated_calls_invoke_each_time()
{
    std::cout << "test_repeated_calls_invoke_each_time...\n";
    ToolRegistry reg;
    Counters c;
    build_registry(reg, c);
    Dispatcher d(reg);

    CallRequest req{"greet", Json{{"name", "bo"}}};
    auto first = d.dispatch(req);
    auto second = d.dispatch(req);
    assert(first.to_json() == second.to_json());
    assert(c.calls == 2);
    std::cout << "  [PASS]\n";
}

void test_concurrent_dispatch()
{
    std::cout << "test_concurrent_dispatch...\n";
    ToolRegistry reg;
    Counters c;
    reg.register_tool(Tool("count", "", InputSchema{},
                           [&c](const Json&)
                           {
                               ++c.calls;
                               return HandlerOutcome::success(Json::object());
                           }));
    Dispatcher d(reg);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back(
            [&d]
            {
                for (int i = 0; i < 50; ++i)
                    assert(d.dispatch(CallRequest{"count", Json::object()}).success());
            });
    for (auto& th : threads)
        th.join();
    assert(c.calls == 200);
    std::cout << "  [PASS]\n";
}

void test_spotify_volume_out_of_range()
{
    std::cout << "test_spotify_volume_out_of_range...\n";
    auto api = std::make_shared<testing::FakeSpotifyApi>();
    ToolRegistry reg;
    spotify::register_spotify_tools(reg, api);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"spotify_set_volume", Json{{"volume", 150}}});
    assert(!env.success());
    assert(env.error()->find("out of range") != std::string::npos);
    assert(env.error()->find("volume") != std::string::npos);
    assert(api->call_count() == 0);
    std::cout << "  [PASS]\n";
}

void test_spotify_search_defaults()
{
    std::cout << "test_spotify_search_defaults...\n";
    auto api = std::make_shared<testing::FakeSpotifyApi>();
    ToolRegistry reg;
    spotify::register_spotify_tools(reg, api);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"spotify_search", Json{{"query", "test"}}});
    assert(env.success());
    assert(api->call_count() == 1);
    const auto& call = api->last_call();
    assert(call.method == "search");
    assert(call.args == (Json{{"query", "test"}, {"type", "track"}, {"limit", 20}}));
    std::cout << "  [PASS]\n";
}

void test_spotify_upstream_failure()
{
    std::cout << "test_spotify_upstream_failure...\n";
    auto api = std::make_shared<testing::FakeSpotifyApi>();
    api->fail_with = "The access token expired";
    ToolRegistry reg;
    spotify::register_spotify_tools(reg, api);
    Dispatcher d(reg);

    auto env = d.dispatch(CallRequest{"spotify_get_user_profile", Json::object()});
    assert(!env.success());
    assert(env.result().is_null());
    assert(!env.error()->empty());
    assert(env.error()->find("The access token expired") != std::string::npos);
    assert(api->call_count() == 1);
    std::cout << "  [PASS]\n";
}

void test_list_tools_shape()
{
    std::cout << "test_list_tools_shape...\n";
    ToolRegistry reg;
    Counters c;
    build_registry(reg, c);
    Dispatcher d(reg);

    Json tools = d.list_tools();
    assert(tools.is_array());
    assert(tools.size() == 3);
    assert(tools[0]["name"] == "greet");
    assert(tools[0]["inputSchema"]["properties"]["times"]["default"] == 1);
    assert(tools[2]["name"] == "explode");
    std::cout << "  [PASS]\n";
}

int main()
{
    util::log::set_level(util::log::Level::Error);
    std::cout << "=== Dispatcher Tests ===\n\n";
    test_unknown_tool();
    test_validation_failure_skips_handler();
    test_handler_sees_defaults();
    test_handler_failure_and_exception();
    test_repeated_calls_invoke_each_time();
    test_concurrent_dispatch();
    test_spotify_volume_out_of_range();
    test_spotify_search_defaults();
    test_spotify_upstream_failure();
    test_list_tools_shape();
    std::cout << "\n=== All Dispatcher tests passed ===\n";
    return 0;
}
