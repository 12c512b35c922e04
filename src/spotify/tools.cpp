#include "spotifymcp/spotify/tools.hpp"

#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/util/log.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spotifymcp::spotify
{

using tools::FieldSpec;
using tools::HandlerOutcome;
using tools::InputSchema;
using tools::Tool;

namespace
{

using Body = std::function<Json(SpotifyApi&, const Json&)>;

// Binds a handler body to the shared client. Anything the client throws becomes a
// Failure prefixed with `context`, so no exception leaves the handler.
Tool::Fn bind_handler(std::shared_ptr<SpotifyApi> api, std::string context, Body body)
{
    return [api = std::move(api), context = std::move(context),
            body = std::move(body)](const Json& args) -> HandlerOutcome
    {
        try
        {
            return HandlerOutcome::success(body(*api, args));
        }
        catch (const UpstreamError& e)
        {
            util::log::warning(context + ": " + e.what());
            return HandlerOutcome::failure(context + ": " + e.what());
        }
        catch (const std::exception& e)
        {
            util::log::error(context + ": " + e.what());
            return HandlerOutcome::failure(context + ": " + e.what());
        }
    };
}

std::optional<std::string> opt_string(const Json& args, const char* key)
{
    auto it = args.find(key);
    if (it == args.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
        return std::nullopt;
    return it->get<std::string>();
}

std::string str_or(const Json& obj, const char* key, const std::string& fallback)
{
    if (obj.is_object() && obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return fallback;
}

long long total_of(const Json& obj, const char* key)
{
    if (obj.is_object() && obj.contains(key) && obj[key].is_object())
    {
        const auto& inner = obj[key];
        if (inner.contains("total") && inner["total"].is_number_integer())
            return inner["total"].get<long long>();
    }
    return 0;
}

Json artist_names(const Json& obj)
{
    Json names = Json::array();
    if (obj.is_object() && obj.contains("artists") && obj["artists"].is_array())
        for (const auto& a : obj["artists"])
            names.push_back(str_or(a, "name", "Unknown"));
    return names;
}

Json list_payload(const char* key, Json items)
{
    size_t count = items.size();
    return Json{{key, std::move(items)}, {"count", count}};
}

Json message(const std::string& text)
{
    return Json{{"message", text}};
}

FieldSpec device_id(const std::string& action)
{
    return FieldSpec::string("device_id", "Device ID to " + action + " on (optional)");
}

FieldSpec limit(const std::string& what, long long def)
{
    return FieldSpec::integer("limit", "Number of " + what + " to return")
        .between(1, 50)
        .with_default(def);
}

} // namespace

Json format_track(const Json& track, int rank)
{
    Json album = track.is_object() && track.contains("album") ? track["album"] : Json();
    return Json{
        {"rank", rank},
        {"name", str_or(track, "name", "Unknown")},
        {"artists", artist_names(track)},
        {"album", str_or(album, "name", "Unknown Album")},
        {"uri", str_or(track, "uri", "")},
        {"popularity", track.is_object() ? track.value("popularity", 0) : 0},
        {"duration_ms", track.is_object() ? track.value("duration_ms", 0LL) : 0LL},
        {"external_urls", track.is_object() && track.contains("external_urls")
                              ? track["external_urls"]
                              : Json::object()},
    };
}

Json format_search_results(const Json& results, const std::string& type)
{
    const std::string key = type + "s";
    Json source = Json::array();
    if (results.is_object() && results.contains(key) && results[key].is_object() &&
        results[key].contains("items") && results[key]["items"].is_array())
        source = results[key]["items"];

    Json items = Json::array();
    int rank = 0;
    for (const auto& item : source)
    {
        // Spotify may return null entries for unavailable playlists
        if (!item.is_object())
            continue;
        ++rank;
        if (type == "track")
        {
            items.push_back(format_track(item, rank));
        }
        else if (type == "album")
        {
            items.push_back(Json{{"rank", rank},
                                 {"name", str_or(item, "name", "Unknown")},
                                 {"artists", artist_names(item)},
                                 {"total_tracks", item.value("total_tracks", 0)},
                                 {"uri", str_or(item, "uri", "")}});
        }
        else if (type == "artist")
        {
            items.push_back(Json{{"rank", rank},
                                 {"name", str_or(item, "name", "Unknown")},
                                 {"followers", total_of(item, "followers")},
                                 {"uri", str_or(item, "uri", "")}});
        }
        else
        {
            Json owner = item.contains("owner") ? item["owner"] : Json();
            items.push_back(Json{{"rank", rank},
                                 {"name", str_or(item, "name", "Unknown")},
                                 {"owner", str_or(owner, "display_name", "Unknown")},
                                 {"tracks", total_of(item, "tracks")},
                                 {"uri", str_or(item, "uri", "")}});
        }
    }

    size_t count = items.size();
    return Json{{"type", type}, {"items", std::move(items)}, {"count", count}};
}

void register_spotify_tools(tools::ToolRegistry& registry, std::shared_ptr<SpotifyApi> api)
{
    if (!api)
        throw RegistrationError("Spotify tools need a SpotifyApi instance");

    registry.register_tool(Tool{
        "spotify_search", "Search for tracks, albums, artists, or playlists on Spotify",
        InputSchema{
            FieldSpec::string("query", "Search query").required(),
            FieldSpec::string("type", "Type of content to search for")
                .one_of({"track", "album", "artist", "playlist"})
                .with_default("track"),
            limit("results", 20),
        },
        bind_handler(api, "Search failed",
             [](SpotifyApi& sp, const Json& args)
             {
                 const std::string type = args.at("type").get<std::string>();
                 Json raw = sp.search(args.at("query").get<std::string>(), type,
                                      args.at("limit").get<int>());
                 Json out = format_search_results(raw, type);
                 out["query"] = args.at("query");
                 return out;
             })});

    registry.register_tool(Tool{
        "spotify_play", "Start or resume Spotify playback",
        InputSchema{
            FieldSpec::string("track_uri", "Spotify URI of the track to play (optional)"),
            FieldSpec::string("playlist_uri", "Spotify URI of the playlist to play (optional)"),
            device_id("play"),
        },
        bind_handler(api, "Failed to start playback",
             [](SpotifyApi& sp, const Json& args)
             {
                 auto device = opt_string(args, "device_id");
                 if (auto track = opt_string(args, "track_uri"))
                 {
                     sp.start_playback(device, std::nullopt, {*track});
                     return message("Playing track: " + *track);
                 }
                 if (auto playlist = opt_string(args, "playlist_uri"))
                 {
                     sp.start_playback(device, playlist, {});
                     return message("Playing playlist: " + *playlist);
                 }
                 sp.start_playback(device, std::nullopt, {});
                 return message("Resumed playback");
             })});

    registry.register_tool(Tool{"spotify_pause", "Pause Spotify playback",
                                InputSchema{device_id("pause")},
                                bind_handler(api, "Failed to pause playback",
                                     [](SpotifyApi& sp, const Json& args)
                                     {
                                         sp.pause_playback(opt_string(args, "device_id"));
                                         return message("Playback paused");
                                     })});

    registry.register_tool(Tool{"spotify_resume", "Resume paused Spotify playback",
                                InputSchema{device_id("resume")},
                                bind_handler(api, "Failed to resume playback",
                                     [](SpotifyApi& sp, const Json& args)
                                     {
                                         sp.start_playback(opt_string(args, "device_id"),
                                                           std::nullopt, {});
                                         return message("Playback resumed");
                                     })});

    registry.register_tool(Tool{"spotify_skip_next", "Skip to the next track",
                                InputSchema{device_id("skip")},
                                bind_handler(api, "Failed to skip to next track",
                                     [](SpotifyApi& sp, const Json& args)
                                     {
                                         sp.next_track(opt_string(args, "device_id"));
                                         return message("Skipped to next track");
                                     })});

    registry.register_tool(Tool{"spotify_skip_previous", "Skip to the previous track",
                                InputSchema{device_id("skip")},
                                bind_handler(api, "Failed to skip to previous track",
                                     [](SpotifyApi& sp, const Json& args)
                                     {
                                         sp.previous_track(opt_string(args, "device_id"));
                                         return message("Skipped to previous track");
                                     })});

    registry.register_tool(Tool{
        "spotify_set_volume", "Set Spotify playback volume",
        InputSchema{
            FieldSpec::integer("volume", "Volume percentage (0-100)").between(0, 100).required(),
            device_id("set volume"),
        },
        bind_handler(api, "Failed to set volume",
             [](SpotifyApi& sp, const Json& args)
             {
                 int volume = args.at("volume").get<int>();
                 sp.set_volume(volume, opt_string(args, "device_id"));
                 Json out = message("Volume set to " + std::to_string(volume) + "%");
                 out["volume"] = volume;
                 return out;
             })});

    registry.register_tool(Tool{
        "spotify_get_current_track", "Get information about the currently playing track",
        InputSchema{},
        bind_handler(api, "Failed to get current playback",
             [](SpotifyApi& sp, const Json&)
             {
                 Json playback = sp.current_playback();
                 if (!playback.is_object() || !playback.contains("item") ||
                     !playback["item"].is_object())
                     return Json{{"is_playing", false},
                                 {"message", "No track currently playing"}};

                 Json out = {{"is_playing", playback.value("is_playing", false)},
                             {"track", format_track(playback["item"], 1)}};
                 if (playback.contains("progress_ms") && playback["progress_ms"].is_number())
                     out["progress_ms"] = playback["progress_ms"];
                 if (playback.contains("device") && playback["device"].is_object())
                     out["device"] = str_or(playback["device"], "name", "Unknown");
                 return out;
             })});

    registry.register_tool(Tool{
        "spotify_get_devices", "Get available Spotify devices", InputSchema{},
        bind_handler(api, "Failed to get devices",
             [](SpotifyApi& sp, const Json&)
             {
                 Json devices = Json::array();
                 for (const auto& d : sp.devices())
                 {
                     if (!d.is_object())
                         continue;
                     devices.push_back(
                         Json{{"id", d.contains("id") ? d["id"] : Json()},
                              {"name", str_or(d, "name", "Unknown")},
                              {"type", str_or(d, "type", "Unknown")},
                              {"is_active", d.value("is_active", false)},
                              {"volume_percent",
                               d.contains("volume_percent") ? d["volume_percent"] : Json()}});
                 }
                 return list_payload("devices", std::move(devices));
             })});

    registry.register_tool(Tool{
        "spotify_get_user_playlists", "Get user's playlists", InputSchema{limit("playlists", 50)},
        bind_handler(api, "Failed to get user playlists",
             [](SpotifyApi& sp, const Json& args)
             {
                 Json playlists = Json::array();
                 for (const auto& p : sp.user_playlists(args.at("limit").get<int>()))
                 {
                     if (!p.is_object())
                         continue;
                     playlists.push_back(Json{{"id", str_or(p, "id", "")},
                                              {"name", str_or(p, "name", "Unknown")},
                                              {"tracks", total_of(p, "tracks")},
                                              {"public", p.contains("public") ? p["public"]
                                                                              : Json()},
                                              {"uri", str_or(p, "uri", "")}});
                 }
                 return list_payload("playlists", std::move(playlists));
             })});

    registry.register_tool(Tool{
        "spotify_create_playlist", "Create a new playlist",
        InputSchema{
            FieldSpec::string("name", "Playlist name").at_least(1).required(),
            FieldSpec::string("description", "Playlist description").with_default(""),
            FieldSpec::boolean("public", "Whether the playlist should be public")
                .with_default(false),
        },
        bind_handler(api, "Failed to create playlist",
             [](SpotifyApi& sp, const Json& args)
             {
                 Json playlist = sp.create_playlist(args.at("name").get<std::string>(),
                                                    args.at("description").get<std::string>(),
                                                    args.at("public").get<bool>());
                 const std::string id = str_or(playlist, "id", "");
                 const std::string name = str_or(playlist, "name", args.at("name").get<std::string>());
                 return Json{{"id", id},
                             {"name", name},
                             {"uri", str_or(playlist, "uri", "")},
                             {"message", "Created playlist: " + name + " (ID: " + id + ")"}};
             })});

    registry.register_tool(Tool{
        "spotify_add_to_playlist", "Add tracks to a playlist",
        InputSchema{
            FieldSpec::string("playlist_id", "Spotify playlist ID").at_least(1).required(),
            FieldSpec::string_array("track_uris", "List of Spotify track URIs to add")
                .between(1, 100)
                .required(),
        },
        bind_handler(api, "Failed to add tracks to playlist",
             [](SpotifyApi& sp, const Json& args)
             {
                 auto uris = args.at("track_uris").get<std::vector<std::string>>();
                 const std::string playlist_id = args.at("playlist_id").get<std::string>();
                 sp.add_tracks_to_playlist(playlist_id, uris);
                 return Json{{"playlist_id", playlist_id},
                             {"added", uris.size()},
                             {"message", "Added " + std::to_string(uris.size()) +
                                             " tracks to playlist"}};
             })});

    registry.register_tool(Tool{
        "spotify_get_user_top_tracks", "Get user's top tracks",
        InputSchema{
            FieldSpec::string("time_range", "Time range for top tracks")
                .one_of({"short_term", "medium_term", "long_term"})
                .with_default("medium_term"),
            limit("tracks", 20),
        },
        bind_handler(api, "Failed to get user top tracks",
             [](SpotifyApi& sp, const Json& args)
             {
                 const std::string range = args.at("time_range").get<std::string>();
                 Json tracks = Json::array();
                 int rank = 0;
                 for (const auto& t : sp.top_tracks(range, args.at("limit").get<int>()))
                     if (t.is_object())
                         tracks.push_back(format_track(t, ++rank));
                 Json out = list_payload("tracks", std::move(tracks));
                 out["time_range"] = range;
                 return out;
             })});

    registry.register_tool(Tool{
        "spotify_get_recently_played", "Get recently played tracks",
        InputSchema{limit("tracks", 20)},
        bind_handler(api, "Failed to get recently played tracks",
             [](SpotifyApi& sp, const Json& args)
             {
                 Json tracks = Json::array();
                 int rank = 0;
                 for (const auto& item : sp.recently_played(args.at("limit").get<int>()))
                 {
                     if (!item.is_object() || !item.contains("track"))
                         continue;
                     Json entry = format_track(item["track"], ++rank);
                     entry["played_at"] = str_or(item, "played_at", "Unknown time");
                     tracks.push_back(std::move(entry));
                 }
                 return list_payload("tracks", std::move(tracks));
             })});

    registry.register_tool(Tool{
        "spotify_get_user_profile", "Get current user's profile information", InputSchema{},
        bind_handler(api, "Failed to get user profile",
             [](SpotifyApi& sp, const Json&)
             {
                 Json profile = sp.current_user();
                 if (!profile.is_object())
                     throw UpstreamError("empty profile response");
                 return Json{{"id", str_or(profile, "id", "")},
                             {"display_name", str_or(profile, "display_name", "")},
                             {"followers", total_of(profile, "followers")},
                             {"country", str_or(profile, "country", "")},
                             {"product", str_or(profile, "product", "")}};
             })});
}

} // namespace spotifymcp::spotify
