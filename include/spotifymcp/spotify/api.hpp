#pragma once
#include "spotifymcp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace spotifymcp::spotify
{

/**
 * Capability interface to the Spotify Web API.
 *
 * Tool handlers are the only callers. Every method may block on network I/O and
 * reports failure by throwing UpstreamError; implementations must be safe to call
 * from several threads at once.
 */
class SpotifyApi
{
  public:
    virtual ~SpotifyApi() = default;

    /// Raw search response, e.g. {"tracks": {"items": [...]}} for type "track".
    virtual Json search(const std::string& query, const std::string& type, int limit) = 0;

    /// Current playback state, or null when nothing is playing.
    virtual Json current_playback() = 0;

    /// Resume when neither context_uri nor uris is given.
    virtual void start_playback(const std::optional<std::string>& device_id,
                                const std::optional<std::string>& context_uri,
                                const std::vector<std::string>& uris) = 0;
    virtual void pause_playback(const std::optional<std::string>& device_id) = 0;
    virtual void next_track(const std::optional<std::string>& device_id) = 0;
    virtual void previous_track(const std::optional<std::string>& device_id) = 0;
    virtual void set_volume(int volume_percent, const std::optional<std::string>& device_id) = 0;

    /// Array of device objects.
    virtual Json devices() = 0;
    /// Array of simplified playlist objects.
    virtual Json user_playlists(int limit) = 0;
    /// The created playlist object.
    virtual Json create_playlist(const std::string& name, const std::string& description,
                                 bool is_public) = 0;
    virtual void add_tracks_to_playlist(const std::string& playlist_id,
                                        const std::vector<std::string>& uris) = 0;
    /// Array of track objects.
    virtual Json top_tracks(const std::string& time_range, int limit) = 0;
    /// Array of play-history objects ({"track": ..., "played_at": ...}).
    virtual Json recently_played(int limit) = 0;
    /// Current user's profile object.
    virtual Json current_user() = 0;
};

} // namespace spotifymcp::spotify
