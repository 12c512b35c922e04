/// @file tests/spotify/fake_api.hpp
/// @brief In-process SpotifyApi double that records calls and can be told to fail
#pragma once

#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/spotify/api.hpp"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace spotifymcp::testing
{

class FakeSpotifyApi : public spotify::SpotifyApi
{
  public:
    struct Call
    {
        std::string method;
        Json args;
    };

    // When set, every method throws UpstreamError with this message.
    std::optional<std::string> fail_with;
    // When set, every method throws std::runtime_error (not an UpstreamError).
    std::optional<std::string> crash_with;

    Json search_response = Json::object();
    Json playback = Json();
    Json device_list = Json::array();
    Json playlists = Json::array();
    Json top = Json::array();
    Json recent = Json::array();
    Json profile = Json{{"id", "user-1"},
                        {"display_name", "Test User"},
                        {"followers", Json{{"total", 42}}},
                        {"country", "SE"},
                        {"product", "premium"}};

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    size_t call_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }
    Call last_call() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.back();
    }

    Json search(const std::string& query, const std::string& type, int limit) override
    {
        record("search", Json{{"query", query}, {"type", type}, {"limit", limit}});
        return search_response;
    }
    Json current_playback() override
    {
        record("current_playback", Json::object());
        return playback;
    }
    void start_playback(const std::optional<std::string>& device_id,
                        const std::optional<std::string>& context_uri,
                        const std::vector<std::string>& uris) override
    {
        record("start_playback", Json{{"device_id", opt(device_id)},
                                      {"context_uri", opt(context_uri)},
                                      {"uris", uris}});
    }
    void pause_playback(const std::optional<std::string>& device_id) override
    {
        record("pause_playback", Json{{"device_id", opt(device_id)}});
    }
    void next_track(const std::optional<std::string>& device_id) override
    {
        record("next_track", Json{{"device_id", opt(device_id)}});
    }
    void previous_track(const std::optional<std::string>& device_id) override
    {
        record("previous_track", Json{{"device_id", opt(device_id)}});
    }
    void set_volume(int volume_percent, const std::optional<std::string>& device_id) override
    {
        record("set_volume", Json{{"volume", volume_percent}, {"device_id", opt(device_id)}});
    }
    Json devices() override
    {
        record("devices", Json::object());
        return device_list;
    }
    Json user_playlists(int limit) override
    {
        record("user_playlists", Json{{"limit", limit}});
        return playlists;
    }
    Json create_playlist(const std::string& name, const std::string& description,
                         bool is_public) override
    {
        record("create_playlist",
               Json{{"name", name}, {"description", description}, {"public", is_public}});
        return Json{{"id", "pl-new"}, {"name", name}, {"uri", "spotify:playlist:pl-new"}};
    }
    void add_tracks_to_playlist(const std::string& playlist_id,
                                const std::vector<std::string>& uris) override
    {
        record("add_tracks_to_playlist", Json{{"playlist_id", playlist_id}, {"uris", uris}});
    }
    Json top_tracks(const std::string& time_range, int limit) override
    {
        record("top_tracks", Json{{"time_range", time_range}, {"limit", limit}});
        return top;
    }
    Json recently_played(int limit) override
    {
        record("recently_played", Json{{"limit", limit}});
        return recent;
    }
    Json current_user() override
    {
        record("current_user", Json::object());
        return profile;
    }

  private:
    static Json opt(const std::optional<std::string>& v)
    {
        return v ? Json(*v) : Json();
    }

    void record(const std::string& method, Json args)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{method, std::move(args)});
        }
        if (crash_with)
            throw std::runtime_error(*crash_with);
        if (fail_with)
            throw UpstreamError(*fail_with, 502);
    }

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

inline Json sample_track(const std::string& name, const std::string& artist)
{
    return Json{{"name", name},
                {"uri", "spotify:track:" + name},
                {"artists", Json::array({Json{{"name", artist}}})},
                {"album", Json{{"name", name + " (Album)"}}},
                {"popularity", 70},
                {"duration_ms", 180000},
                {"external_urls", Json{{"spotify", "https://open.spotify.com/track/" + name}}}};
}

} // namespace spotifymcp::testing
