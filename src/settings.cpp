#include "spotifymcp/settings.hpp"

#include "spotifymcp/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace spotifymcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

std::optional<int> Settings::parse_port(const std::string& text)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; }))
        return std::nullopt;
    try
    {
        size_t pos = 0;
        long v = std::stol(text, &pos, 10);
        if (pos != text.size() || v < 0 || v > 65535)
            return std::nullopt;
        return static_cast<int>(v);
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = upper(getenv_str("SPOTIFYMCP_LOG_LEVEL", s.log_level));
    s.server_name = getenv_str("MCP_SERVER_NAME", s.server_name);
    s.server_version = getenv_str("MCP_SERVER_VERSION", s.server_version);
    s.server_description = getenv_str("MCP_SERVER_DESCRIPTION", s.server_description);
    s.http_host = getenv_str("SPOTIFYMCP_HTTP_HOST", s.http_host);
    s.http_port = parse_port(getenv_str("PORT", "")).value_or(s.http_port);
    s.http_port = parse_port(getenv_str("SPOTIFYMCP_HTTP_PORT", "")).value_or(s.http_port);
    s.cors_origin = getenv_str("SPOTIFYMCP_CORS_ORIGIN", s.cors_origin);
    s.spotify_api_base = getenv_str("SPOTIFY_API_BASE", s.spotify_api_base);
    s.spotify_access_token = getenv_str("SPOTIFY_ACCESS_TOKEN", s.spotify_access_token);
    return s;
}

void Settings::merge_json(const Json& j)
{
    if (!j.is_object())
        throw Error("settings must be a JSON object");
    if (j.contains("log_level"))
        log_level = upper(j.at("log_level").get<std::string>());
    if (j.contains("server_name"))
        server_name = j.at("server_name").get<std::string>();
    if (j.contains("server_version"))
        server_version = j.at("server_version").get<std::string>();
    if (j.contains("server_description"))
        server_description = j.at("server_description").get<std::string>();
    if (j.contains("http_host"))
        http_host = j.at("http_host").get<std::string>();
    if (j.contains("http_port"))
    {
        // Out-of-range ports are ignored, as for the environment
        const auto& port = j.at("http_port");
        if (port.is_number_integer())
        {
            bool in_range = port.is_number_unsigned()
                                ? port.get<unsigned long long>() <= 65535
                                : port.get<long long>() >= 0 && port.get<long long>() <= 65535;
            if (in_range)
                http_port = port.get<int>();
        }
        else if (port.is_string())
        {
            http_port = parse_port(port.get<std::string>()).value_or(http_port);
        }
        else
        {
            throw Error("settings field 'http_port' must be an integer");
        }
    }
    if (j.contains("cors_origin"))
        cors_origin = j.at("cors_origin").get<std::string>();
    if (j.contains("spotify_api_base"))
        spotify_api_base = j.at("spotify_api_base").get<std::string>();
    if (j.contains("spotify_access_token"))
        spotify_access_token = j.at("spotify_access_token").get<std::string>();
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.merge_json(j);
    return s;
}

} // namespace spotifymcp
