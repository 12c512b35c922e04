#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/mcp/dispatcher.hpp"
#include "spotifymcp/mcp/handler.hpp"
#include "spotifymcp/server/http_server.hpp"
#include "spotifymcp/server/stdio_server.hpp"
#include "spotifymcp/settings.hpp"
#include "spotifymcp/spotify/tools.hpp"
#include "spotifymcp/spotify/web_api.hpp"
#include "spotifymcp/util/json.hpp"
#include "spotifymcp/util/log.hpp"
#include "spotifymcp/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_shutdown{false};

void on_signal(int)
{
    g_shutdown = true;
}

static int usage(int exit_code = 1)
{
    // stdout may be the MCP channel; help goes to stderr
    std::cerr << "spotifymcp " << spotifymcp::VERSION_MAJOR << "." << spotifymcp::VERSION_MINOR
              << "." << spotifymcp::VERSION_PATCH << "\n";
    std::cerr << "Usage:\n";
    std::cerr << "  spotifymcp [--stdio | --http] [--host <addr>] [--port <n>] [--config <file>]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --stdio           Serve MCP over stdin/stdout (default)\n";
    std::cerr << "  --http            Serve HTTP: GET /, /health, /tools; POST /call_tool, /mcp\n";
    std::cerr << "  --host <addr>     HTTP bind address (default 127.0.0.1)\n";
    std::cerr << "  --port <n>        HTTP port (default 8000)\n";
    std::cerr << "  --config <file>   JSON settings file, applied over the environment\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  SPOTIFY_ACCESS_TOKEN, SPOTIFY_API_BASE, SPOTIFYMCP_LOG_LEVEL,\n";
    std::cerr << "  SPOTIFYMCP_HTTP_HOST, SPOTIFYMCP_HTTP_PORT, SPOTIFYMCP_CORS_ORIGIN,\n";
    std::cerr << "  MCP_SERVER_NAME, MCP_SERVER_VERSION, MCP_SERVER_DESCRIPTION\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static spotifymcp::Json load_config_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw spotifymcp::Error("cannot open config file: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return spotifymcp::util::json::parse(ss.str());
}

static int serve_http(const spotifymcp::Settings& settings, const spotifymcp::mcp::ServerInfo& info,
                      std::shared_ptr<const spotifymcp::mcp::Dispatcher> dispatcher)
{
    using namespace spotifymcp;
    server::HttpServerWrapper http(info, std::move(dispatcher), settings.http_host,
                                   settings.http_port, settings.cors_origin);
    if (!http.start())
        return 1;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_shutdown && http.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    util::log::info("shutting down HTTP server");
    http.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace spotifymcp;

    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    Settings settings = Settings::from_env();
    bool use_http = false;
    try
    {
        if (auto path = consume_flag_value(args, "--config"))
            settings.merge_json(load_config_file(*path));
        if (auto host = consume_flag_value(args, "--host"))
            settings.http_host = *host;
        if (auto port = consume_flag_value(args, "--port"))
        {
            auto parsed = Settings::parse_port(*port);
            if (!parsed)
                throw Error("invalid port: " + *port);
            settings.http_port = *parsed;
        }
        use_http = consume_flag(args, "--http");
        if (consume_flag(args, "--stdio") && use_http)
        {
            std::cerr << "--stdio and --http are mutually exclusive\n";
            return usage(1);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    if (!args.empty())
    {
        std::cerr << "Unknown option: " << args.front() << "\n";
        return usage(1);
    }

    util::log::set_level(util::log::level_from_string(settings.log_level));

    mcp::ServerInfo info;
    info.name = settings.server_name;
    info.version = settings.server_version;
    info.description = settings.server_description;
    info.instructions = "Tools for searching Spotify and controlling playback.";

    if (settings.spotify_access_token.empty())
        util::log::warning("SPOTIFY_ACCESS_TOKEN is not set; Spotify tools will fail");

    auto api = std::make_shared<spotify::WebApiClient>(settings.spotify_api_base,
                                                       settings.spotify_access_token);

    // Registration errors are the only fatal condition once configuration is loaded
    tools::ToolRegistry registry;
    try
    {
        spotify::register_spotify_tools(registry, api);
    }
    catch (const RegistrationError& e)
    {
        util::log::error(std::string("tool registration failed: ") + e.what());
        return 1;
    }

    // registry outlives every transport: both are torn down before main returns
    auto dispatcher = std::make_shared<const mcp::Dispatcher>(registry);
    util::log::info("Starting " + info.name + " v" + info.version + " with " +
                    std::to_string(registry.size()) + " tools");

    if (use_http)
        return serve_http(settings, info, dispatcher);

    server::StdioServerWrapper stdio(info, *dispatcher);
    return stdio.run() ? 0 : 1;
}
