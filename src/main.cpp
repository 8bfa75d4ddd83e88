#include <dpp/dpp.h>                // D++

#include <iostream>                 // std::cout, std::cerr
#include <memory>                   // std::unique_ptr, std::shared_ptr
#include <sstream>                  // std::ostringstream
#include <vector>

#include "cad/core/config.hpp"          // Configuration
#include "cad/core/errors.hpp"          // config_error
#include "cad/core/logging.hpp"         // Logger bound to the cluster
#include "cad/core/scheduler.hpp"       // D++ timer scheduler
#include "cad/gateway/voice_bridge.hpp" // Voice session assembly
#include "cad/lavalink/node.hpp"        // Audio node connections
#include "cad/music/controller.hpp"     // Music slash commands
#include "cad/player/manager.hpp"       // Players

int main()
{
    cad::bot_config cfg;
    try {
        cfg = cad::load_config();
    } catch (const cad::config_error& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    if (cfg.token.empty()) {
        std::cerr << "No bot token, set CADENCE_TOKEN" << std::endl;
        return 1;
    }

    dpp::cluster bot(cfg.token);
    bot.on_log(dpp::utility::cout_logger()); // D++ logger

    cad::logger log([&bot](dpp::loglevel level, const std::string& message) {
        bot.log(level, message);
    });

    cad::dpp_scheduler sched(bot);

    // ---------- Players ----------
    cad::music::controller* music = nullptr;

    cad::player::manager players(sched, cfg.player,
        [&music](const cad::player::notification& n) {
            if (music != nullptr) {
                music->render(n);
            }
        },
        log);

    cad::gateway::voice_bridge voice(
        [&players, &music, &log](const cad::lavalink::voice_session& vs) {
            const cad::status s = players.assign(vs.guild_id, vs);
            if (s != cad::status::ok) {
                std::ostringstream oss;
                oss << "Voice session for guild " << vs.guild_id << " not assigned: " << cad::to_string(s);
                log.log(dpp::ll_warning, oss.str());
                return;
            }
            if (music != nullptr) {
                music->refresh_occupancy(vs.guild_id);
            }
        },
        [&players](dpp::snowflake guild_id) {
            players.release(guild_id, "disconnected from voice");
        },
        log);

    cad::music::controller controller(bot, players, voice);
    music = &controller;

    // ---------- Nodes ----------
    // Created on the first ready: the User-Id header needs the bot's id.
    std::vector<std::unique_ptr<cad::lavalink::beast_socket_transport>> sockets;
    cad::lavalink::dpp_http_transport http(bot);

    // ---------- Voice glue ----------
    bot.on_voice_state_update([&bot, &voice, &controller](const dpp::voice_state_update_t& ev) {
        if (ev.state.user_id == bot.me.id) {
            voice.on_voice_state(ev.state.guild_id, ev.state.channel_id, ev.state.session_id);
        }
        controller.refresh_occupancy(ev.state.guild_id);
    });

    bot.on_voice_server_update([&voice](const dpp::voice_server_update_t& ev) {
        voice.on_voice_server(ev.guild_id, ev.token, ev.endpoint);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&controller](const dpp::slashcommand_t& event) {
        controller.route_slashcommand(event);
    });

    // ---------- on_ready ----------
    bot.on_ready([&](const dpp::ready_t& event) {
        (void)event;

        std::cout << "Logged in as " << bot.me.username << "!" << std::endl;

        if (dpp::run_once<struct connect_nodes>()) {
            for (const auto& node_cfg : cfg.nodes) {
                sockets.push_back(std::make_unique<cad::lavalink::beast_socket_transport>(
                    log.with_prefix("Socket " + node_cfg.name)));
                auto node = std::make_shared<cad::lavalink::node>(
                    node_cfg, bot.me.id, cfg.client_name, cfg.reconnect, cfg.rest,
                    *sockets.back(), http, sched, log);
                players.add_node(std::move(node));
            }
            players.connect_all();
        }

        if (dpp::run_once<struct register_bot_commands>()) {
            std::cout << "Registering slash commands..." << std::endl;
            bot.global_bulk_command_create(controller.make_commands());
            std::cout << "Registered slash commands!" << std::endl;
        }
    });

    // ---------- Start bot ----------
    bot.start(dpp::st_wait);
    players.shutdown();
    return 0;
}
