#include "spotifymcp/spotify/web_api.hpp"

#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/util/json.hpp"
#include "spotifymcp/util/log.hpp"

#include <cctype>
#include <httplib.h>

namespace spotifymcp::spotify
{

namespace
{

class Query
{
  public:
    Query& add(const std::string& key, const std::string& value)
    {
        text_ += text_.empty() ? "?" : "&";
        text_ += key + "=" + url_encode(value);
        return *this;
    }
    Query& add(const std::string& key, int value)
    {
        return add(key, std::to_string(value));
    }
    Query& add(const std::string& key, const std::optional<std::string>& value)
    {
        if (value)
            add(key, *value);
        return *this;
    }
    const std::string& str() const
    {
        return text_;
    }

  private:
    std::string text_;
};

std::string error_message(const httplib::Response& res)
{
    // Spotify errors look like {"error": {"status": 404, "message": "..."}}
    Json body = util::json::try_parse(res.body);
    if (!body.is_discarded() && body.is_object() && body.contains("error"))
    {
        const auto& err = body["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
        if (err.is_string())
            return err.get<std::string>();
    }
    return res.body.empty() ? std::string("no details") : res.body;
}

Json items_of(const Json& response, const char* key)
{
    if (response.is_object() && response.contains(key) && response[key].is_array())
        return response[key];
    return Json::array();
}

} // namespace

std::string url_encode(const std::string& value)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

WebApiClient::WebApiClient(std::string api_base, std::string access_token)
    : api_base_(std::move(api_base)), access_token_(std::move(access_token))
{
    while (!api_base_.empty() && api_base_.back() == '/')
        api_base_.pop_back();
}

Json WebApiClient::request(const std::string& method, const std::string& path,
                           const Json& body) const
{
    if (access_token_.empty())
        throw UpstreamError("Spotify access token not configured");

    httplib::Client cli(api_base_);
    if (!cli.is_valid())
        throw UpstreamError("invalid Spotify API base URL: " + api_base_);
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(30, 0);
    cli.set_write_timeout(30, 0);

    httplib::Headers headers = {{"Authorization", "Bearer " + access_token_},
                                {"Accept", "application/json"}};
    const std::string payload = body.is_null() ? std::string() : body.dump();

    util::log::debug("Spotify API " + method + " " + path);

    httplib::Result res;
    if (method == "GET")
        res = cli.Get(path, headers);
    else if (method == "POST")
        res = cli.Post(path, headers, payload, "application/json");
    else if (method == "PUT")
        res = cli.Put(path, headers, payload, "application/json");
    else
        throw UpstreamError("unsupported HTTP method: " + method);

    if (!res)
        throw UpstreamError("Spotify API request failed: " + httplib::to_string(res.error()));

    if (res->status >= 400)
        throw UpstreamError("Spotify API error " + std::to_string(res->status) + ": " +
                                error_message(*res),
                            res->status);

    if (res->status == 204 || res->body.empty())
        return Json();

    Json parsed = util::json::try_parse(res->body);
    if (parsed.is_discarded())
        throw UpstreamError("Spotify API returned malformed JSON", res->status);
    return parsed;
}

Json WebApiClient::search(const std::string& query, const std::string& type, int limit)
{
    Query q;
    q.add("q", query).add("type", type).add("limit", limit);
    return request("GET", "/v1/search" + q.str());
}

Json WebApiClient::current_playback()
{
    return request("GET", "/v1/me/player");
}

void WebApiClient::start_playback(const std::optional<std::string>& device_id,
                                  const std::optional<std::string>& context_uri,
                                  const std::vector<std::string>& uris)
{
    Json body;
    if (context_uri)
        body = Json{{"context_uri", *context_uri}};
    else if (!uris.empty())
        body = Json{{"uris", uris}};
    Query q;
    q.add("device_id", device_id);
    request("PUT", "/v1/me/player/play" + q.str(), body);
}

void WebApiClient::pause_playback(const std::optional<std::string>& device_id)
{
    Query q;
    q.add("device_id", device_id);
    request("PUT", "/v1/me/player/pause" + q.str());
}

void WebApiClient::next_track(const std::optional<std::string>& device_id)
{
    Query q;
    q.add("device_id", device_id);
    request("POST", "/v1/me/player/next" + q.str());
}

void WebApiClient::previous_track(const std::optional<std::string>& device_id)
{
    Query q;
    q.add("device_id", device_id);
    request("POST", "/v1/me/player/previous" + q.str());
}

void WebApiClient::set_volume(int volume_percent, const std::optional<std::string>& device_id)
{
    Query q;
    q.add("volume_percent", volume_percent).add("device_id", device_id);
    request("PUT", "/v1/me/player/volume" + q.str());
}

Json WebApiClient::devices()
{
    return items_of(request("GET", "/v1/me/player/devices"), "devices");
}

Json WebApiClient::user_playlists(int limit)
{
    Query q;
    q.add("limit", limit);
    return items_of(request("GET", "/v1/me/playlists" + q.str()), "items");
}

Json WebApiClient::create_playlist(const std::string& name, const std::string& description,
                                   bool is_public)
{
    Json me = current_user();
    if (!me.is_object() || !me.contains("id") || !me["id"].is_string())
        throw UpstreamError("could not determine current user id");
    Json body = {{"name", name}, {"description", description}, {"public", is_public}};
    return request("POST", "/v1/users/" + url_encode(me["id"].get<std::string>()) + "/playlists",
                   body);
}

void WebApiClient::add_tracks_to_playlist(const std::string& playlist_id,
                                          const std::vector<std::string>& uris)
{
    request("POST", "/v1/playlists/" + url_encode(playlist_id) + "/tracks",
            Json{{"uris", uris}});
}

Json WebApiClient::top_tracks(const std::string& time_range, int limit)
{
    Query q;
    q.add("time_range", time_range).add("limit", limit);
    return items_of(request("GET", "/v1/me/top/tracks" + q.str()), "items");
}

Json WebApiClient::recently_played(int limit)
{
    Query q;
    q.add("limit", limit);
    return items_of(request("GET", "/v1/me/player/recently-played" + q.str()), "items");
}

Json WebApiClient::current_user()
{
    return request("GET", "/v1/me");
}

} // namespace spotifymcp::spotify
