#pragma once
#include "spotifymcp/spotify/api.hpp"

#include <string>

namespace spotifymcp::spotify
{

/// SpotifyApi over HTTP(S) with a pre-issued bearer token.
///
/// No token refresh, caching or retries: a failed request is reported once as
/// UpstreamError. Each call uses its own connection, so instances are thread-safe.
class WebApiClient : public SpotifyApi
{
  public:
    /// @param api_base     Scheme, host and optional port, e.g. "https://api.spotify.com"
    /// @param access_token OAuth access token; empty makes every call fail
    WebApiClient(std::string api_base, std::string access_token);

    Json search(const std::string& query, const std::string& type, int limit) override;
    Json current_playback() override;
    void start_playback(const std::optional<std::string>& device_id,
                        const std::optional<std::string>& context_uri,
                        const std::vector<std::string>& uris) override;
    void pause_playback(const std::optional<std::string>& device_id) override;
    void next_track(const std::optional<std::string>& device_id) override;
    void previous_track(const std::optional<std::string>& device_id) override;
    void set_volume(int volume_percent, const std::optional<std::string>& device_id) override;
    Json devices() override;
    Json user_playlists(int limit) override;
    Json create_playlist(const std::string& name, const std::string& description,
                         bool is_public) override;
    void add_tracks_to_playlist(const std::string& playlist_id,
                                const std::vector<std::string>& uris) override;
    Json top_tracks(const std::string& time_range, int limit) override;
    Json recently_played(int limit) override;
    Json current_user() override;

    const std::string& api_base() const
    {
        return api_base_;
    }

  private:
    Json request(const std::string& method, const std::string& path,
                 const Json& body = Json()) const;

    std::string api_base_;
    std::string access_token_;
};

/// Percent-encodes a query-string component.
std::string url_encode(const std::string& value);

} // namespace spotifymcp::spotify
