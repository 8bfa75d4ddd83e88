#include "cad/lavalink/codec.hpp"
#include "cad/core/errors.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace cad::lavalink {

using json = dpp::json;

namespace {

struct encoder {
    json operator()(const play_command& c) const
    {
        json j;
        j["op"]      = "play";
        j["guildId"] = c.guild_id.str();
        j["track"]   = c.track;
        if (c.start_ms.has_value()) {
            j["startTimeMs"] = *c.start_ms;
        }
        if (c.end_ms.has_value()) {
            j["endTimeMs"] = *c.end_ms;
        }
        if (c.volume.has_value()) {
            j["volume"] = *c.volume;
        }
        if (c.paused.has_value()) {
            j["pause"] = *c.paused;
        }
        if (c.no_replace) {
            j["noReplace"] = true;
        }
        return j;
    }

    json operator()(const stop_command& c) const
    {
        return json{{"op", "stop"}, {"guildId", c.guild_id.str()}};
    }

    json operator()(const pause_command& c) const
    {
        return json{{"op", "pause"}, {"guildId", c.guild_id.str()}, {"state", c.state}};
    }

    json operator()(const seek_command& c) const
    {
        return json{{"op", "seek"}, {"guildId", c.guild_id.str()}, {"positionMs", c.position_ms}};
    }

    json operator()(const volume_command& c) const
    {
        return json{{"op", "volume"}, {"guildId", c.guild_id.str()}, {"volume", c.volume}};
    }

    json operator()(const voice_update_command& c) const
    {
        json j;
        j["op"]        = "voiceUpdate";
        j["guildId"]   = c.guild_id.str();
        j["sessionId"] = c.session_id;
        j["event"]["token"]    = c.token;
        j["event"]["endpoint"] = c.endpoint;
        j["event"]["guild_id"] = c.guild_id.str();
        return j;
    }

    json operator()(const destroy_command& c) const
    {
        return json{{"op", "destroy"}, {"guildId", c.guild_id.str()}};
    }
};

[[noreturn]] void malformed(const std::string& what)
{
    throw malformed_frame(what);
}

const json& require(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        malformed(std::string("missing field '") + key + "'");
    }
    return *it;
}

// First of two alias keys that is present, or nullptr.
const json* either(const json& j, const char* key, const char* alias)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        return &*it;
    }
    it = j.find(alias);
    if (it != j.end() && !it->is_null()) {
        return &*it;
    }
    return nullptr;
}

std::string as_string(const json& v, const char* key)
{
    if (!v.is_string()) {
        malformed(std::string("field '") + key + "' is not a string");
    }
    return v.get<std::string>();
}

std::int64_t as_int(const json& v, const char* key)
{
    if (!v.is_number_integer()) {
        malformed(std::string("field '") + key + "' is not an integer");
    }
    return v.get<std::int64_t>();
}

std::uint64_t as_count(const json& v, const char* key)
{
    if (!v.is_number_integer() || v.get<std::int64_t>() < 0) {
        malformed(std::string("field '") + key + "' is not a non-negative integer");
    }
    return v.get<std::uint64_t>();
}

bool as_bool(const json& v, const char* key)
{
    if (!v.is_boolean()) {
        malformed(std::string("field '") + key + "' is not a boolean");
    }
    return v.get<bool>();
}

dpp::snowflake guild_id(const json& j)
{
    const auto& v = require(j, "guildId");
    if (v.is_number_unsigned()) {
        return dpp::snowflake(v.get<std::uint64_t>());
    }
    const std::string s = as_string(v, "guildId");
    std::uint64_t id = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
    if (ec != std::errc() || ptr != s.data() + s.size() || id == 0) {
        malformed("field 'guildId' is not a snowflake: '" + s + "'");
    }
    return dpp::snowflake(id);
}

// v3 sends "encodedTrack", v4 sends "track": { "encoded": ... }.
std::string event_track(const json& j)
{
    if (const json* v = either(j, "encodedTrack", "track")) {
        if (v->is_string()) {
            return v->get<std::string>();
        }
        if (v->is_object()) {
            auto it = v->find("encoded");
            if (it != v->end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    return {};
}

end_reason parse_reason(const std::string& raw)
{
    std::string r;
    for (char c : raw) {
        if (c != '_') {
            r += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (r == "finished")   return end_reason::finished;
    if (r == "loadfailed") return end_reason::load_failed;
    if (r == "stopped")    return end_reason::stopped;
    if (r == "replaced")   return end_reason::replaced;
    if (r == "cleanup")    return end_reason::cleanup;
    return end_reason::unknown;
}

inbound_message decode_event(const json& j)
{
    const std::string type = as_string(require(j, "type"), "type");

    if (type == "TrackStartEvent") {
        return event_message{guild_id(j), track_start{event_track(j)}};
    }
    if (type == "TrackEndEvent") {
        track_end ev;
        ev.track  = event_track(j);
        ev.reason = parse_reason(as_string(require(j, "reason"), "reason"));
        return event_message{guild_id(j), ev};
    }
    if (type == "TrackExceptionEvent") {
        track_exception ev;
        ev.track = event_track(j);
        auto it = j.find("exception");
        if (it != j.end() && it->is_object()) {
            const auto& ex = *it;
            if (ex.contains("message") && ex["message"].is_string()) {
                ev.message = ex["message"].get<std::string>();
            }
            ev.severity = ex.value("severity", "");
            ev.cause    = ex.value("cause", "");
        } else if (j.contains("error") && j["error"].is_string()) {
            ev.message = j["error"].get<std::string>();
        }
        return event_message{guild_id(j), ev};
    }
    if (type == "TrackStuckEvent") {
        const json* threshold = either(j, "thresholdMs", "threshold");
        if (threshold == nullptr) {
            malformed("missing field 'thresholdMs'");
        }
        track_stuck ev;
        ev.track        = event_track(j);
        ev.threshold_ms = as_int(*threshold, "thresholdMs");
        return event_message{guild_id(j), ev};
    }
    if (type == "WebSocketClosedEvent") {
        connection_closed ev;
        ev.code = static_cast<int>(as_int(require(j, "code"), "code"));
        ev.reason    = j.value("reason", "");
        ev.by_remote = j.value("byRemote", false);
        return event_message{guild_id(j), ev};
    }

    return unknown_message{"event", type};
}

inbound_message decode_player_update(const json& j)
{
    const json& state = require(j, "state");
    if (!state.is_object()) {
        malformed("field 'state' is not an object");
    }
    const json* position = either(state, "positionMs", "position");
    if (position == nullptr) {
        malformed("missing field 'state.positionMs'");
    }

    player_update_message m;
    m.guild_id    = guild_id(j);
    m.position_ms = as_int(*position, "positionMs");
    if (const json* ts = either(state, "timestamp", "time")) {
        m.timestamp = as_int(*ts, "timestamp");
    }
    if (auto it = state.find("connected"); it != state.end()) {
        m.connected = as_bool(*it, "connected");
    }
    if (auto it = state.find("ping"); it != state.end()) {
        m.ping_ms = static_cast<int>(as_int(*it, "ping"));
    }
    return m;
}

inbound_message decode_stats(const json& j)
{
    stats_message m;
    auto& s = m.stats;
    s.players         = as_count(require(j, "players"), "players");
    s.playing_players = as_count(require(j, "playingPlayers"), "playingPlayers");
    if (auto it = j.find("uptime"); it != j.end()) {
        s.uptime_ms = as_count(*it, "uptime");
    }
    if (auto it = j.find("memory"); it != j.end() && it->is_object()) {
        s.memory_used = it->value("used", std::uint64_t{0});
        s.memory_free = it->value("free", std::uint64_t{0});
    }
    if (auto it = j.find("cpu"); it != j.end() && it->is_object()) {
        s.cpu_cores     = it->value("cores", 0);
        s.system_load   = it->value("systemLoad", 0.0);
        s.lavalink_load = it->value("lavalinkLoad", 0.0);
    }
    if (auto it = j.find("frameStats"); it != j.end() && it->is_object()) {
        s.frames_sent    = it->value("sent", std::int64_t{0});
        s.frames_nulled  = it->value("nulled", std::int64_t{0});
        s.frames_deficit = it->value("deficit", std::int64_t{0});
    }
    return m;
}

} // namespace

dpp::snowflake guild_of(const outbound_command& cmd)
{
    return std::visit([](const auto& c) { return c.guild_id; }, cmd);
}

const char* op_name(const outbound_command& cmd)
{
    static const char* names[] = {"play", "stop", "pause", "seek", "volume", "voiceUpdate", "destroy"};
    return names[cmd.index()];
}

std::string encode(const outbound_command& cmd)
{
    return std::visit(encoder{}, cmd).dump();
}

const char* to_string(end_reason r)
{
    switch (r) {
        case end_reason::finished:    return "finished";
        case end_reason::load_failed: return "loadFailed";
        case end_reason::stopped:     return "stopped";
        case end_reason::replaced:    return "replaced";
        case end_reason::cleanup:     return "cleanup";
        case end_reason::unknown:     return "unknown";
    }
    return "unknown";
}

bool may_start_next(end_reason r)
{
    return r == end_reason::finished || r == end_reason::load_failed;
}

inbound_message decode(std::string_view frame)
{
    json j;
    try {
        j = json::parse(frame.begin(), frame.end());
    } catch (const json::parse_error& e) {
        throw malformed_frame(std::string("not JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw malformed_frame("frame is not a JSON object");
    }

    try {
        const std::string op = as_string(require(j, "op"), "op");

        if (op == "ready") {
            ready_message m;
            m.session_id = as_string(require(j, "sessionId"), "sessionId");
            if (auto it = j.find("resumed"); it != j.end()) {
                m.resumed = as_bool(*it, "resumed");
            }
            return m;
        }
        if (op == "playerUpdate") {
            return decode_player_update(j);
        }
        if (op == "stats") {
            return decode_stats(j);
        }
        if (op == "event") {
            return decode_event(j);
        }
        return unknown_message{op, {}};
    } catch (const json::exception& e) {
        // value() with a mistyped optional field
        throw malformed_frame(e.what());
    }
}

} // namespace cad::lavalink
