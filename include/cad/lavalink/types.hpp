#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

namespace cad::lavalink {

struct track {
    std::string  encoded;
    std::string  identifier;
    std::string  title;
    std::string  author;
    std::string  uri;
    std::int64_t length_ms   = 0;
    bool         is_stream   = false;
    bool         is_seekable = true;
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type          type = load_type::empty;
    std::vector<track> tracks;
    std::string        playlist_name;
    std::size_t        selected_index = 0;  // playlists only
    std::string        error_message;       // for load_type::error
};

/// Voice credentials for one guild, always replaced as a whole.
struct voice_session {
    dpp::snowflake guild_id;
    dpp::snowflake channel_id;
    std::string    session_id;  // Discord voice session id
    std::string    token;
    std::string    endpoint;
};

struct node_stats {
    std::uint64_t players         = 0;
    std::uint64_t playing_players = 0;
    std::uint64_t uptime_ms       = 0;
    std::uint64_t memory_used     = 0;
    std::uint64_t memory_free     = 0;
    int           cpu_cores       = 0;
    double        system_load     = 0.0;
    double        lavalink_load   = 0.0;
    std::optional<std::int64_t> frames_sent;
    std::optional<std::int64_t> frames_nulled;
    std::optional<std::int64_t> frames_deficit;
};

} // namespace cad::lavalink
