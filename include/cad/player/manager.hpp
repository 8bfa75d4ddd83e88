#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/snowflake.h>

#include "cad/core/config.hpp"
#include "cad/core/errors.hpp"
#include "cad/core/logging.hpp"
#include "cad/core/scheduler.hpp"
#include "cad/lavalink/node.hpp"
#include "cad/player/player.hpp"

namespace cad::player {

struct play_result {
    status                         result = status::ok;
    std::size_t                    added  = 0;
    std::optional<lavalink::track> first;
    bool                           started = false;  // the player was idle and began with `first`
    std::string                    playlist_name;
    std::string                    message;
};

/// Registry of guild players and the nodes they run on.
///
/// Lock order is registry, then player, then node. No registry lock is held
/// while a player or node is called from here except for read-only queries.
class manager : public lavalink::node_listener {
public:
    manager(scheduler& sched, player_policy policy, notifier notify, logger log);
    ~manager() override;

    manager(const manager&) = delete;
    manager& operator=(const manager&) = delete;

    void add_node(std::shared_ptr<lavalink::node> n);
    void connect_all();

    // Destroys every player and shuts every node down.
    void shutdown();

    // Creates the guild's player on the least loaded healthy node.
    status join(dpp::snowflake guild_id);

    // Creates the player when needed and hands it the voice session.
    status assign(dpp::snowflake guild_id, const lavalink::voice_session& session);

    // Resolves `query` on the player's node and enqueues the result.
    play_result play(dpp::snowflake guild_id, const std::string& query);

    // Moves the player to a healthy node, or destroys it when there is none.
    status rebind(dpp::snowflake guild_id);

    // Idempotent. False when the guild had no player.
    bool release(dpp::snowflake guild_id, const std::string& reason);

    std::shared_ptr<player> find(dpp::snowflake guild_id) const;
    std::size_t player_count() const;

    // Listeners other than the bot. Zero arms the idle timer, anything else
    // disarms it.
    void update_occupancy(dpp::snowflake guild_id, std::size_t listeners);
    bool idle_timer_armed(dpp::snowflake guild_id) const;

    std::vector<lavalink::node_snapshot> node_health() const;

    // Healthy ready nodes first, then by bound players and reported load.
    std::shared_ptr<lavalink::node> select_node() const;

    // lavalink::node_listener
    void on_node_ready(lavalink::node& n, bool resumed) override;
    void on_node_session_lost(lavalink::node& n) override;
    void on_node_unhealthy(lavalink::node& n) override;
    void on_player_update(lavalink::node& n, const lavalink::player_update_message& msg) override;
    void on_player_event(lavalink::node& n, const lavalink::event_message& msg) override;

private:
    std::shared_ptr<lavalink::node> select_node_locked() const;
    std::shared_ptr<player> create_locked(dpp::snowflake guild_id, status& result);
    std::vector<std::shared_ptr<player>> bound_players(const lavalink::node& n) const;
    std::shared_ptr<player> route(const lavalink::node& n, dpp::snowflake guild_id) const;
    bool still_registered(dpp::snowflake guild_id, const std::shared_ptr<player>& p) const;

    // Runs `fn` on the scheduler, off the caller's thread.
    void defer(std::function<void()> fn);
    void handle_idle_timeout(dpp::snowflake guild_id, scheduler::task_id id);
    void emit(const notification& n);

    scheduler&    m_scheduler;
    player_policy m_policy;
    notifier      m_notify;
    logger        m_log;

    mutable std::mutex m_mutex;
    bool               m_shutdown = false;
    std::vector<std::shared_ptr<lavalink::node>>                   m_nodes;
    std::unordered_map<dpp::snowflake, std::shared_ptr<player>>    m_players;
    std::unordered_map<dpp::snowflake, scheduler::task_id>         m_idle_timers;
    std::set<scheduler::task_id>                                   m_tasks;
};

} // namespace cad::player
