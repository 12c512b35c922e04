// Spotify catalogue over HTTP, backed by a canned SpotifyApi so it runs offline.
//
//   curl -s localhost:18080/tools
//   curl -s -X POST localhost:18080/call_tool -d '{"name":"spotify_search","arguments":{"query":"x"}}'
#include "spotifymcp/server/http_server.hpp"
#include "spotifymcp/spotify/tools.hpp"
#include "spotifymcp/util/log.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace
{

class CannedSpotify : public spotifymcp::spotify::SpotifyApi
{
  public:
    using Json = spotifymcp::Json;

    Json search(const std::string& query, const std::string& type, int) override
    {
        Json track = {{"name", "Echo of " + query},
                      {"uri", "spotify:track:canned"},
                      {"artists", Json::array({Json{{"name", "Offline Band"}}})},
                      {"album", Json{{"name", "Cached"}}}};
        return Json{{type + "s", Json{{"items", Json::array({track})}}}};
    }
    Json current_playback() override
    {
        return Json();
    }
    void start_playback(const std::optional<std::string>&, const std::optional<std::string>&,
                        const std::vector<std::string>&) override
    {
    }
    void pause_playback(const std::optional<std::string>&) override {}
    void next_track(const std::optional<std::string>&) override {}
    void previous_track(const std::optional<std::string>&) override {}
    void set_volume(int, const std::optional<std::string>&) override {}
    Json devices() override
    {
        return Json::array({Json{{"id", "local"}, {"name", "Speaker"}, {"is_active", true}}});
    }
    Json user_playlists(int) override
    {
        return Json::array();
    }
    Json create_playlist(const std::string& name, const std::string&, bool) override
    {
        return Json{{"id", "new"}, {"name", name}, {"uri", "spotify:playlist:new"}};
    }
    void add_tracks_to_playlist(const std::string&, const std::vector<std::string>&) override {}
    Json top_tracks(const std::string&, int) override
    {
        return Json::array();
    }
    Json recently_played(int) override
    {
        return Json::array();
    }
    Json current_user() override
    {
        return Json{{"id", "offline"}, {"display_name", "Offline User"}};
    }
};

} // namespace

int main()
{
    using namespace spotifymcp;
    util::log::set_level(util::log::Level::Debug);

    tools::ToolRegistry registry;
    spotify::register_spotify_tools(registry, std::make_shared<CannedSpotify>());
    auto dispatcher = std::make_shared<const mcp::Dispatcher>(registry);

    server::HttpServerWrapper http{mcp::ServerInfo{}, dispatcher, "127.0.0.1", 18080};
    if (!http.start())
    {
        std::cerr << "failed to bind 127.0.0.1:18080\n";
        return 1;
    }
    std::cout << "Serving " << registry.size() << " tools on http://127.0.0.1:18080 for 60s\n";
    std::this_thread::sleep_for(std::chrono::seconds(60));
    http.stop();
    return 0;
}
