#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/dpp.h>

#include "cad/gateway/voice_bridge.hpp"
#include "cad/player/manager.hpp"

namespace cad::music {

/// Slash commands on top of the player manager, and the channel side of
/// player notifications.
class controller {
public:
    controller(dpp::cluster& bot, player::manager& players, gateway::voice_bridge& voice);

    /// /join /play /skip /prev /pause /seek /loop /volume /stop /queue /nodes
    std::vector<dpp::slashcommand> make_commands() const;

    /// Dispatch a music slash command. Other commands are ignored.
    void route_slashcommand(const dpp::slashcommand_t& ev);

    /// Posts a notification to the text channel the guild last used.
    void render(const player::notification& n);

    /// Recounts who shares the bot's voice channel.
    void refresh_occupancy(dpp::snowflake guild_id);

private:
    void handle_join(const dpp::slashcommand_t& ev);
    void handle_play(const dpp::slashcommand_t& ev);
    void handle_skip(const dpp::slashcommand_t& ev);
    void handle_prev(const dpp::slashcommand_t& ev);
    void handle_pause(const dpp::slashcommand_t& ev);
    void handle_seek(const dpp::slashcommand_t& ev);
    void handle_loop(const dpp::slashcommand_t& ev);
    void handle_volume(const dpp::slashcommand_t& ev);
    void handle_stop(const dpp::slashcommand_t& ev);
    void handle_queue(const dpp::slashcommand_t& ev);
    void handle_nodes(const dpp::slashcommand_t& ev);

    // Joins the caller's voice channel. Empty string on success.
    std::string join_caller(const dpp::slashcommand_t& ev);

    // Raw gateway op 4; channel 0 leaves.
    void send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id);

    dpp::cluster&          m_bot;
    player::manager&       m_players;
    gateway::voice_bridge& m_voice;

    std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, dpp::snowflake> m_text_channels;
};

} // namespace cad::music
