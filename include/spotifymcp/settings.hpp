#pragma once
#include "spotifymcp/types.hpp"

#include <optional>
#include <string>

namespace spotifymcp
{

struct Settings
{
    std::string log_level{"INFO"};

    std::string server_name{"spotify-mcp-server"};
    std::string server_version{"1.0.0"};
    std::string server_description{"Spotify API integration via MCP"};

    std::string http_host{"127.0.0.1"};
    int http_port{8000};
    std::string cors_origin;

    std::string spotify_api_base{"https://api.spotify.com"};
    std::string spotify_access_token;

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Decimal port in 0..65535; nullopt for anything else, including trailing junk.
    static std::optional<int> parse_port(const std::string& text);

    /// Values present in `j` override those already in this object.
    void merge_json(const Json& j);
};

} // namespace spotifymcp
