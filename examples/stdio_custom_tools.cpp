// Serves a small hand-written catalogue over stdin/stdout, without Spotify.
//
// Try it:
//   printf '%s\n' '{"jsonrpc":"2.0","id":1,"method":"initialize"}' \
//     '{"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"repeat","arguments":{"text":"hi"}}}' \
//     | ./stdio_custom_tools
#include "spotifymcp/server/stdio_server.hpp"
#include "spotifymcp/tools/registry.hpp"

#include <string>

int main()
{
    using namespace spotifymcp;
    using tools::FieldSpec;

    tools::ToolRegistry registry;
    registry.register_tool(tools::Tool{
        "repeat", "Repeat a piece of text",
        tools::InputSchema{
            FieldSpec::string("text", "Text to repeat").required(),
            FieldSpec::integer("times", "How many copies").between(1, 10).with_default(2),
            FieldSpec::string("separator").one_of({" ", ",", "\n"}).with_default(" "),
        },
        [](const Json& args)
        {
            std::string out;
            for (long long i = 0; i < args["times"].get<long long>(); ++i)
            {
                if (i > 0)
                    out += args["separator"].get<std::string>();
                out += args["text"].get<std::string>();
            }
            return tools::HandlerOutcome::success(Json{{"text", out}});
        }});

    mcp::Dispatcher dispatcher(registry);
    mcp::ServerInfo info;
    info.name = "repeat_stdio";
    info.version = "0.1.0";

    server::StdioServerWrapper server(info, dispatcher);
    return server.run() ? 0 : 1;
}
