#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "cad/core/config.hpp"
#include "cad/core/errors.hpp"
#include "cad/core/logging.hpp"
#include "cad/core/scheduler.hpp"
#include "cad/lavalink/codec.hpp"
#include "cad/lavalink/node.hpp"
#include "cad/lavalink/types.hpp"

namespace cad::player {

enum class player_state {
    idle,
    playing,
    paused,
    stalled,    // node session lost, waiting for rebind
    destroyed
};

enum class loop_mode {
    none,
    track,
    queue,
    random
};

const char* to_string(player_state s);
const char* to_string(loop_mode m);

struct notification {
    enum class kind {
        now_playing,
        queue_empty,
        track_failed,
        player_stalled,
        player_destroyed,
        node_unavailable
    };

    kind                           what = kind::now_playing;
    dpp::snowflake                 guild_id;
    std::optional<lavalink::track> track;
    std::string                    message;
};

using notifier = std::function<void(const notification&)>;

struct player_snapshot {
    dpp::snowflake               guild_id;
    player_state                 state = player_state::idle;
    loop_mode                    loop  = loop_mode::none;
    std::vector<lavalink::track> queue;
    std::optional<std::size_t>   current;
    std::int64_t                 position_ms = 0;
    int                          volume      = 100;
    bool                         voice_connected = false;
    std::string                  node_name;
};

/// Playback state of one guild.
///
/// Commands and node events are applied under one mutex, in arrival order.
/// Outbound commands and notifications are produced under the lock and
/// delivered after it is released.
class player {
public:
    player(dpp::snowflake guild_id,
           std::weak_ptr<lavalink::node> node,
           player_policy policy,
           scheduler& sched,
           notifier notify,
           logger log);

    player(const player&) = delete;
    player& operator=(const player&) = delete;

    status enqueue(const lavalink::track& t);

    // All or nothing. When idle, playback starts at `selected`.
    status enqueue_all(const std::vector<lavalink::track>& tracks, std::size_t selected = 0);

    status skip();
    status previous();
    status pause();
    status resume();
    status seek(std::int64_t position_ms);
    status set_volume(int volume);
    status set_loop_mode(loop_mode mode);

    void on_event(const lavalink::player_event& ev);
    void on_player_update(const lavalink::player_update_message& msg);

    // Replaces the whole voice session and flushes a pending play.
    void update_voice_session(const lavalink::voice_session& session);

    // Node lost its session; nothing is sent until rebind().
    void mark_stalled();

    // Moves to `node`. `replacement` is the current track re-resolved there.
    void rebind(std::weak_ptr<lavalink::node> node,
                std::optional<lavalink::track> replacement = std::nullopt);

    // Node resumed its session: re-issue the voice update, any pending play
    // and the pause, volume, seek or stop that could not be delivered.
    void resync();

    // Terminal. Sends stop and destroy; a node that is resuming destroys the
    // server-side player once resumed. False when already destroyed.
    bool destroy(const std::string& reason);

    player_snapshot snapshot() const;
    player_state state() const;
    dpp::snowflake guild_id() const { return m_guild_id; }
    std::shared_ptr<lavalink::node> node() const;
    bool bound_to(const lavalink::node& n) const;
    std::optional<lavalink::track> current_track() const;
    scheduler::clock::time_point last_activity() const;

private:
    struct effects {
        std::shared_ptr<lavalink::node>        target;
        std::vector<lavalink::outbound_command> commands;
        std::vector<notification>               notes;
    };

    void deliver(effects& fx);
    void requeue_dropped(lavalink::node& target, const std::vector<lavalink::outbound_command>& dropped);

    bool deliverable_locked() const;
    bool active_locked() const;
    void touch_locked();
    void start_current_locked(effects& fx, std::int64_t start_ms = 0);
    void advance_locked(effects& fx, bool user_skip);
    void go_idle_locked(effects& fx, bool send_stop, bool announce);
    void register_failure_locked(effects& fx, const std::string& why);
    void push_voice_update_locked(effects& fx);
    void flush_locked(effects& fx);
    bool is_current_locked(const std::string& encoded) const;
    void note_locked(effects& fx, notification::kind what, std::string message = {});

    const dpp::snowflake m_guild_id;
    const player_policy  m_policy;
    scheduler&           m_scheduler;
    notifier             m_notify;
    logger               m_log;

    mutable std::mutex                   m_mutex;
    std::weak_ptr<lavalink::node>        m_node;
    player_state                         m_state = player_state::idle;
    std::vector<lavalink::track>         m_queue;
    std::optional<std::size_t>           m_index;
    std::int64_t                         m_position_ms = 0;
    bool                                 m_paused      = false;
    int                                  m_volume      = 100;
    loop_mode                            m_loop        = loop_mode::none;
    std::uint32_t                        m_failures    = 0;
    bool                                 m_absorb_end  = false;
    bool                                 m_pending_play = false;
    bool                                 m_resend_state = false;  // pause, volume or stop was not delivered
    bool                                 m_resend_seek  = false;
    bool                                 m_voice_connected = false;
    std::optional<lavalink::voice_session> m_voice;
    scheduler::clock::time_point         m_last_activity;
    std::mt19937                         m_rng;
};

} // namespace cad::player
