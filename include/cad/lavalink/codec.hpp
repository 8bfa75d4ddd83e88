#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <dpp/snowflake.h>

#include "cad/lavalink/types.hpp"

namespace cad::lavalink {

// ---------- outbound ----------

struct play_command {
    dpp::snowflake              guild_id;
    std::string                 track;       // encoded track
    std::optional<std::int64_t> start_ms;
    std::optional<std::int64_t> end_ms;
    std::optional<int>          volume;
    std::optional<bool>         paused;
    bool                        no_replace = false;
};

struct stop_command {
    dpp::snowflake guild_id;
};

struct pause_command {
    dpp::snowflake guild_id;
    bool           state = true;
};

struct seek_command {
    dpp::snowflake guild_id;
    std::int64_t   position_ms = 0;
};

struct volume_command {
    dpp::snowflake guild_id;
    int            volume = 100;
};

struct voice_update_command {
    dpp::snowflake guild_id;
    std::string    session_id;
    std::string    token;
    std::string    endpoint;
};

struct destroy_command {
    dpp::snowflake guild_id;
};

using outbound_command = std::variant<play_command,
                                      stop_command,
                                      pause_command,
                                      seek_command,
                                      volume_command,
                                      voice_update_command,
                                      destroy_command>;

dpp::snowflake guild_of(const outbound_command& cmd);
const char* op_name(const outbound_command& cmd);

std::string encode(const outbound_command& cmd);

// ---------- inbound ----------

enum class end_reason {
    finished,
    load_failed,
    stopped,
    replaced,
    cleanup,
    unknown     // a reason newer than this client
};

const char* to_string(end_reason r);

// Whether the queue may advance after a track ended for this reason.
bool may_start_next(end_reason r);

struct track_start {
    std::string track;
};

struct track_end {
    std::string track;
    end_reason  reason = end_reason::finished;
};

struct track_exception {
    std::string track;
    std::string message;
    std::string severity;
    std::string cause;
};

struct track_stuck {
    std::string  track;
    std::int64_t threshold_ms = 0;
};

struct connection_closed {
    int         code = 0;
    std::string reason;
    bool        by_remote = false;
};

using player_event = std::variant<track_start,
                                  track_end,
                                  track_exception,
                                  track_stuck,
                                  connection_closed>;

struct ready_message {
    std::string session_id;
    bool        resumed = false;
};

struct player_update_message {
    dpp::snowflake guild_id;
    std::int64_t   position_ms = 0;
    std::int64_t   timestamp   = 0;
    bool           connected   = false;
    int            ping_ms     = -1;
};

struct stats_message {
    node_stats stats;
};

struct event_message {
    dpp::snowflake guild_id;
    player_event   event;
};

// Ops or event types this client does not know. Callers ignore these.
struct unknown_message {
    std::string op;
    std::string type;
};

using inbound_message = std::variant<ready_message,
                                     player_update_message,
                                     stats_message,
                                     event_message,
                                     unknown_message>;

// Throws malformed_frame when the frame is not JSON or a required field is
// missing or has the wrong type. Unknown fields are ignored.
inbound_message decode(std::string_view frame);

} // namespace cad::lavalink
