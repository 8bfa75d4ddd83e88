#include "cad/music/format.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cad::music {

std::string format_duration(std::int64_t ms)
{
    if (ms < 0) {
        ms = 0;
    }
    const std::int64_t total = ms / 1000;
    const std::int64_t h = total / 3600;
    const std::int64_t m = (total / 60) % 60;
    const std::int64_t s = total % 60;

    std::ostringstream oss;
    if (h > 0) {
        oss << h << ":" << std::setw(2) << std::setfill('0') << m;
    } else {
        oss << m;
    }
    oss << ":" << std::setw(2) << std::setfill('0') << s;
    return oss.str();
}

std::int64_t seek_position_ms(std::int64_t seconds)
{
    constexpr std::int64_t max_seconds = std::numeric_limits<std::int64_t>::max() / 1000;
    return std::clamp<std::int64_t>(seconds, 0, max_seconds) * 1000;
}

std::string format_track(const lavalink::track& t)
{
    std::ostringstream oss;
    oss << "**" << (t.title.empty() ? t.identifier : t.title) << "**";
    if (!t.author.empty()) {
        oss << " by " << t.author;
    }
    oss << " [" << (t.is_stream ? std::string("LIVE") : format_duration(t.length_ms)) << "]";
    return oss.str();
}

std::optional<player::loop_mode> parse_loop_mode(std::string_view name)
{
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "none" || n == "off") return player::loop_mode::none;
    if (n == "track" || n == "song") return player::loop_mode::track;
    if (n == "queue") return player::loop_mode::queue;
    if (n == "random" || n == "shuffle") return player::loop_mode::random;
    return std::nullopt;
}

std::string describe(status s)
{
    switch (s) {
        case status::ok:               return "Done.";
        case status::queue_full:       return "The queue is full.";
        case status::at_boundary:      return "Already at the start of the queue.";
        case status::not_active:       return "Nothing is playing.";
        case status::no_player:        return "I am not in a voice channel here.";
        case status::destroyed:        return "The player was stopped.";
        case status::stalled:          return "Lost the audio node, reconnecting. Try again shortly.";
        case status::node_unavailable: return "No audio node is available right now.";
        case status::no_matches:       return "Nothing found.";
        case status::load_failed:      return "Could not load that track.";
        case status::command_rejected: return "The audio node refused that.";
    }
    return to_string(s);
}

std::string describe(const player::play_result& r)
{
    if (r.result != status::ok) {
        std::string text = describe(r.result);
        if (!r.message.empty()) {
            text += " (" + r.message + ")";
        }
        return text;
    }

    std::ostringstream oss;
    if (!r.playlist_name.empty()) {
        oss << "Queued " << r.added << " tracks from **" << r.playlist_name << "**";
        if (r.started && r.first.has_value()) {
            oss << ", starting with " << format_track(*r.first);
        }
        return oss.str();
    }
    if (r.first.has_value()) {
        oss << (r.started ? "Playing " : "Queued ") << format_track(*r.first);
    }
    return oss.str();
}

std::string describe(const player::notification& n)
{
    using kind = player::notification::kind;
    switch (n.what) {
        case kind::now_playing:
            return n.track ? "Now playing " + format_track(*n.track) : std::string();
        case kind::queue_empty:
            return "Queue finished.";
        case kind::track_failed: {
            std::string text = "Too many tracks failed in a row, stopping";
            if (n.track) {
                text += " at " + format_track(*n.track);
            }
            if (!n.message.empty()) {
                text += ": " + n.message;
            }
            return text;
        }
        case kind::player_stalled:
            return "Lost the audio node, trying to recover...";
        case kind::player_destroyed:
            return "Leaving voice (" + n.message + ").";
        case kind::node_unavailable:
            return "No audio node is available, playback stopped.";
    }
    return {};
}

std::string format_queue(const player::player_snapshot& s, std::size_t limit)
{
    if (!s.current.has_value()) {
        if (s.queue.empty()) {
            return "The queue is empty.";
        }
        return "Nothing is playing. " + std::to_string(s.queue.size()) + " track(s) in history.";
    }

    const std::size_t current = *s.current;
    const auto& now = s.queue[current];

    std::ostringstream oss;
    oss << (s.state == player::player_state::paused ? "Paused: " : "Now: ") << format_track(now);
    if (!now.is_stream) {
        oss << " at " << format_duration(s.position_ms);
    }
    oss << "\nLoop: " << player::to_string(s.loop) << ", volume " << s.volume << "%\n";

    std::size_t shown = 0;
    for (std::size_t i = current + 1; i < s.queue.size() && shown < limit; ++i, ++shown) {
        oss << (i - current) << ". " << format_track(s.queue[i]) << "\n";
    }
    const std::size_t upcoming = s.queue.size() - current - 1;
    if (upcoming > shown) {
        oss << "... and " << (upcoming - shown) << " more";
    } else if (upcoming == 0) {
        oss << "Nothing queued after this.";
    }
    return oss.str();
}

std::string format_nodes(const std::vector<lavalink::node_snapshot>& nodes)
{
    if (nodes.empty()) {
        return "No audio nodes configured.";
    }
    std::ostringstream oss;
    for (const auto& n : nodes) {
        oss << "**" << n.name << "**: " << lavalink::to_string(n.state)
            << (n.healthy ? "" : " (unhealthy)")
            << ", " << n.players << " player(s)";
        if (n.failures > 0) {
            oss << ", " << n.failures << " failed attempt(s)";
        }
        if (n.stats.has_value()) {
            oss << ", " << n.stats->playing_players << "/" << n.stats->players << " playing"
                << ", load " << std::fixed << std::setprecision(2) << n.stats->lavalink_load * 100.0 << "%"
                << ", up " << format_duration(static_cast<std::int64_t>(n.stats->uptime_ms));
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace cad::music
