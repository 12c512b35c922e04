#pragma once
#include "spotifymcp/spotify/api.hpp"
#include "spotifymcp/tools/registry.hpp"

#include <memory>

namespace spotifymcp::spotify
{

/// Registers the Spotify tool catalogue, in its published order:
/// spotify_search, spotify_play, spotify_pause, spotify_resume, spotify_skip_next,
/// spotify_skip_previous, spotify_set_volume, spotify_get_current_track,
/// spotify_get_devices, spotify_get_user_playlists, spotify_create_playlist,
/// spotify_add_to_playlist, spotify_get_user_top_tracks, spotify_get_recently_played,
/// spotify_get_user_profile.
///
/// Every handler shares `api`; failures it throws come back as HandlerOutcome failures.
void register_spotify_tools(tools::ToolRegistry& registry, std::shared_ptr<SpotifyApi> api);

// Payload shaping, exposed for reuse by callers that talk to SpotifyApi directly.
Json format_track(const Json& track, int rank);
Json format_search_results(const Json& results, const std::string& type);

} // namespace spotifymcp::spotify
