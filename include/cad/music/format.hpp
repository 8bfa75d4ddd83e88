#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cad/lavalink/node.hpp"
#include "cad/player/manager.hpp"
#include "cad/player/player.hpp"

namespace cad::music {

// "3:07", "1:02:03", or "LIVE" for streams.
std::string format_duration(std::int64_t ms);

std::string format_track(const lavalink::track& t);

// Seek target in ms from a user-supplied second count. Negative input is 0,
// input too large to scale saturates.
std::int64_t seek_position_ms(std::int64_t seconds);

std::optional<player::loop_mode> parse_loop_mode(std::string_view name);

// Reply text for a command outcome other than ok.
std::string describe(status s);

std::string describe(const player::play_result& r);

// Channel message for a notification. Empty for ones not shown to users.
std::string describe(const player::notification& n);

// Current track first, then up to `limit` upcoming tracks.
std::string format_queue(const player::player_snapshot& s, std::size_t limit = 10);

std::string format_nodes(const std::vector<lavalink::node_snapshot>& nodes);

} // namespace cad::music
