#include "cad/music/controller.hpp"
#include "cad/music/format.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <sstream>

namespace cad::music {

controller::controller(dpp::cluster& bot, player::manager& players, gateway::voice_bridge& voice)
    : m_bot(bot)
    , m_players(players)
    , m_voice(voice)
{
}

std::vector<dpp::slashcommand> controller::make_commands() const
{
    dpp::slashcommand join_cmd("join", "Join your voice channel", m_bot.me.id);
    dpp::slashcommand play_cmd("play", "Play a song or playlist, by link or search", m_bot.me.id);
    dpp::slashcommand skip_cmd("skip", "Skip to the next track", m_bot.me.id);
    dpp::slashcommand prev_cmd("prev", "Go back to the previous track", m_bot.me.id);
    dpp::slashcommand pause_cmd("pause", "Pause or resume playback", m_bot.me.id);
    dpp::slashcommand seek_cmd("seek", "Jump to a position in the current track", m_bot.me.id);
    dpp::slashcommand loop_cmd("loop", "Set the loop mode", m_bot.me.id);
    dpp::slashcommand volume_cmd("volume", "Set the playback volume", m_bot.me.id);
    dpp::slashcommand stop_cmd("stop", "Stop playback and leave voice", m_bot.me.id);
    dpp::slashcommand queue_cmd("queue", "Show the queue", m_bot.me.id);
    dpp::slashcommand nodes_cmd("nodes", "Show audio node health", m_bot.me.id);

    play_cmd.add_option(
        dpp::command_option(dpp::co_string, "query", "Link or search terms", true)
    );
    seek_cmd.add_option(
        dpp::command_option(dpp::co_integer, "seconds", "Position in seconds", true)
    );
    loop_cmd.add_option(
        dpp::command_option(dpp::co_string, "mode", "Loop mode", true)
            .add_choice(dpp::command_option_choice("Off", std::string("none")))
            .add_choice(dpp::command_option_choice("Track", std::string("track")))
            .add_choice(dpp::command_option_choice("Queue", std::string("queue")))
            .add_choice(dpp::command_option_choice("Random", std::string("random")))
    );
    volume_cmd.add_option(
        dpp::command_option(dpp::co_integer, "level", "Volume from 0 to 1000 (100 is normal)", true)
    );

    return {
        join_cmd, play_cmd, skip_cmd, prev_cmd, pause_cmd, seek_cmd,
        loop_cmd, volume_cmd, stop_cmd, queue_cmd, nodes_cmd
    };
}

void controller::route_slashcommand(const dpp::slashcommand_t& ev)
{
    const std::string name = ev.command.get_command_name();

    if (ev.command.guild_id.empty()) {
        if (name == "nodes") {
            handle_nodes(ev);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_text_channels[ev.command.guild_id] = ev.command.channel_id;
    }

    if (name == "join") {
        handle_join(ev);
    } else if (name == "play") {
        handle_play(ev);
    } else if (name == "skip") {
        handle_skip(ev);
    } else if (name == "prev") {
        handle_prev(ev);
    } else if (name == "pause") {
        handle_pause(ev);
    } else if (name == "seek") {
        handle_seek(ev);
    } else if (name == "loop") {
        handle_loop(ev);
    } else if (name == "volume") {
        handle_volume(ev);
    } else if (name == "stop") {
        handle_stop(ev);
    } else if (name == "queue") {
        handle_queue(ev);
    } else if (name == "nodes") {
        handle_nodes(ev);
    }
}

// ---------- voice ----------

void controller::send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    const auto& shards = m_bot.get_shards();
    if (shards.empty()) {
        m_bot.log(dpp::ll_warning, "No shard to send a voice state on");
        return;
    }
    const auto shard_id = static_cast<std::uint32_t>((static_cast<std::uint64_t>(guild_id) >> 22) % shards.size());
    auto it = shards.find(shard_id);
    if (it == shards.end() || it->second == nullptr) {
        m_bot.log(dpp::ll_warning, "Shard " + std::to_string(shard_id) + " is not connected");
        return;
    }

    dpp::json payload;
    payload["op"]              = 4;
    payload["d"]["guild_id"]   = guild_id.str();
    payload["d"]["channel_id"] = channel_id.empty() ? dpp::json(nullptr) : dpp::json(channel_id.str());
    payload["d"]["self_mute"]  = false;
    payload["d"]["self_deaf"]  = true;
    it->second->queue_message(payload.dump());

    std::ostringstream oss;
    oss << (channel_id.empty() ? "Leaving voice in guild " : "Joining voice in guild ") << guild_id;
    m_bot.log(dpp::ll_debug, oss.str());
}

std::string controller::join_caller(const dpp::slashcommand_t& ev)
{
    const dpp::snowflake guild_id = ev.command.guild_id;
    const dpp::snowflake user_id  = ev.command.get_issuing_user().id;

    dpp::guild* g = dpp::find_guild(guild_id);
    if (g == nullptr) {
        return "I cannot see this server yet, try again in a moment.";
    }
    auto vs = g->voice_members.find(user_id);
    if (vs == g->voice_members.end() || vs->second.channel_id.empty()) {
        return "Join a voice channel first.";
    }

    const status joined = m_players.join(guild_id);
    if (joined != status::ok) {
        return describe(joined);
    }
    if (m_voice.channel(guild_id) != vs->second.channel_id) {
        send_voice_state(guild_id, vs->second.channel_id);
    }
    return {};
}

void controller::refresh_occupancy(dpp::snowflake guild_id)
{
    const dpp::snowflake channel = m_voice.channel(guild_id);
    if (channel.empty()) {
        return;
    }
    dpp::guild* g = dpp::find_guild(guild_id);
    if (g == nullptr) {
        return;
    }

    std::size_t listeners = 0;
    for (const auto& [user, state] : g->voice_members) {
        if (user != m_bot.me.id && state.channel_id == channel) {
            ++listeners;
        }
    }
    m_players.update_occupancy(guild_id, listeners);
}

void controller::render(const player::notification& n)
{
    const std::string text = describe(n);

    dpp::snowflake channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_text_channels.find(n.guild_id);
        if (it != m_text_channels.end()) {
            channel = it->second;
        }
        if (n.what == player::notification::kind::player_destroyed) {
            m_text_channels.erase(n.guild_id);
        }
    }

    if (n.what == player::notification::kind::player_destroyed) {
        send_voice_state(n.guild_id, dpp::snowflake());
        m_voice.forget(n.guild_id);
    }
    if (!text.empty() && !channel.empty()) {
        m_bot.message_create(dpp::message(channel, text));
    }
}

// ---------- commands ----------

void controller::handle_join(const dpp::slashcommand_t& ev)
{
    const std::string error = join_caller(ev);
    ev.reply(error.empty() ? "Joining your channel." : error);
}

void controller::handle_play(const dpp::slashcommand_t& ev)
{
    ev.thinking();

    const std::string query = std::get<std::string>(ev.get_parameter("query"));
    if (m_voice.channel(ev.command.guild_id).empty()) {
        const std::string error = join_caller(ev);
        if (!error.empty()) {
            ev.edit_original_response(dpp::message(error));
            return;
        }
    }

    const player::play_result result = m_players.play(ev.command.guild_id, query);
    ev.edit_original_response(dpp::message(describe(result)));
}

void controller::handle_skip(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    const status s = p->skip();
    ev.reply(s == status::ok ? "Skipped." : describe(s));
}

void controller::handle_prev(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    const status s = p->previous();
    ev.reply(s == status::ok ? "Going back." : describe(s));
}

void controller::handle_pause(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    const bool paused = p->state() == player::player_state::paused;
    const status s    = paused ? p->resume() : p->pause();
    if (s != status::ok) {
        ev.reply(describe(s));
        return;
    }
    ev.reply(paused ? "Resumed." : "Paused.");
}

void controller::handle_seek(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    const std::int64_t seconds = std::get<std::int64_t>(ev.get_parameter("seconds"));
    const status s = p->seek(seek_position_ms(seconds));
    if (s != status::ok) {
        ev.reply(describe(s));
        return;
    }
    ev.reply("Jumped to " + format_duration(p->snapshot().position_ms) + ".");
}

void controller::handle_loop(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    const auto mode = parse_loop_mode(std::get<std::string>(ev.get_parameter("mode")));
    if (!mode.has_value()) {
        ev.reply("Unknown loop mode.");
        return;
    }
    const status s = p->set_loop_mode(*mode);
    ev.reply(s == status::ok ? std::string("Loop mode: ") + player::to_string(*mode) + "." : describe(s));
}

void controller::handle_volume(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    const auto level = std::get<std::int64_t>(ev.get_parameter("level"));
    const status s   = p->set_volume(static_cast<int>(std::clamp<std::int64_t>(level, 0, 1000)));
    if (s != status::ok) {
        ev.reply(describe(s));
        return;
    }
    ev.reply("Volume set to " + std::to_string(p->snapshot().volume) + "%.");
}

void controller::handle_stop(const dpp::slashcommand_t& ev)
{
    if (!m_players.release(ev.command.guild_id, "stopped")) {
        ev.reply(describe(status::no_player));
        return;
    }
    ev.reply("Stopped.");
}

void controller::handle_queue(const dpp::slashcommand_t& ev)
{
    auto p = m_players.find(ev.command.guild_id);
    if (!p) {
        ev.reply(describe(status::no_player));
        return;
    }
    ev.reply(format_queue(p->snapshot()));
}

void controller::handle_nodes(const dpp::slashcommand_t& ev)
{
    ev.reply(dpp::message(format_nodes(m_players.node_health())).set_flags(dpp::m_ephemeral));
}

} // namespace cad::music
