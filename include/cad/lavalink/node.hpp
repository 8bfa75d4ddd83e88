#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <dpp/snowflake.h>

#include "cad/core/config.hpp"
#include "cad/core/logging.hpp"
#include "cad/core/scheduler.hpp"
#include "cad/lavalink/codec.hpp"
#include "cad/lavalink/rest.hpp"
#include "cad/lavalink/socket.hpp"

namespace cad::lavalink {

enum class node_state {
    disconnected,
    connecting,
    authenticated,
    ready,
    reconnecting
};

const char* to_string(node_state s);

class node;

/// Receives node lifecycle changes and player-scoped messages. Called
/// without any node lock held, possibly from the node's socket thread.
class node_listener {
public:
    virtual ~node_listener() = default;

    // resumed: the server kept the previous session and its players.
    virtual void on_node_ready(node& n, bool resumed) = 0;

    // The previous session is gone; its players exist no more on the server.
    virtual void on_node_session_lost(node& n) = 0;

    // Failure threshold reached. Sent once per healthy -> unhealthy change.
    virtual void on_node_unhealthy(node& n) = 0;

    virtual void on_player_update(node& n, const player_update_message& msg) = 0;
    virtual void on_player_event(node& n, const event_message& msg) = 0;
};

struct node_snapshot {
    std::string               name;
    node_state                state    = node_state::disconnected;
    bool                      healthy  = true;
    std::string               session_id;
    std::uint32_t             failures = 0;
    std::size_t               players  = 0;
    std::optional<node_stats> stats;
};

/// One control connection to one audio node.
///
/// Owns the reconnect/resume state machine. A new transport session is
/// never opened while the previous one has not reported its close.
class node : public std::enable_shared_from_this<node> {
public:
    node(node_config cfg,
         dpp::snowflake user_id,
         std::string client_name,
         reconnect_policy reconnect,
         rest_policy rest,
         socket_transport& socket,
         http_transport& http,
         scheduler& sched,
         logger log);
    ~node();

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    void set_listener(node_listener* listener);

    // disconnected -> connecting. No-op in any other state or after shutdown().
    void connect();

    // Terminal.
    void shutdown();

    // Writes one command. False unless the node is ready.
    bool send(const outbound_command& cmd);

    node_state state() const;
    bool healthy() const;
    bool is_ready() const { return state() == node_state::ready; }
    std::string session_id() const;
    const node_config& config() const { return m_cfg; }
    const std::string& name() const { return m_cfg.name; }
    const rest_client& rest() const { return m_rest; }

    // Removes the server-side player over REST. While the session is being
    // resumed the call waits for the resumed ready; without a session there
    // is nothing to remove.
    void destroy_remote_player(dpp::snowflake guild_id);

    void attach_player(dpp::snowflake guild_id);
    void detach_player(dpp::snowflake guild_id);
    std::size_t player_count() const;

    std::optional<node_stats> stats() const;
    node_snapshot snapshot() const;

private:
    void open_session();
    void schedule_retry_locked(std::chrono::milliseconds delay);
    std::chrono::milliseconds backoff_locked() const;

    void handle_open(std::uint64_t generation);
    void handle_message(std::uint64_t generation, const std::string& text);
    void handle_close(std::uint64_t generation, std::uint16_t code, const std::string& reason);
    void handle_ready(const ready_message& msg);
    void handle_retry();
    void handle_connect_timeout(std::uint64_t generation);

    void remove_remote_player(const std::string& session_id, dpp::snowflake guild_id);

    node_listener* listener() const;

    node_config       m_cfg;
    dpp::snowflake    m_user_id;
    std::string       m_client_name;
    reconnect_policy  m_policy;
    socket_transport& m_socket;
    scheduler&        m_scheduler;
    logger            m_log;
    rest_client       m_rest;

    mutable std::mutex m_mutex;
    node_listener*     m_listener   = nullptr;
    node_state         m_state      = node_state::disconnected;
    bool               m_healthy    = true;
    bool               m_shutdown   = false;
    bool               m_live       = false;  // transport session not yet closed
    bool               m_open_after_close = false;
    std::uint64_t      m_generation = 0;
    std::uint32_t      m_failures   = 0;
    std::string        m_session_id;
    std::optional<scheduler::clock::time_point> m_lost_at;  // set while resuming
    scheduler::task_id m_retry_task   = 0;
    scheduler::task_id m_timeout_task = 0;
    std::set<dpp::snowflake>  m_players;
    std::set<dpp::snowflake>  m_orphans;  // destroy once resumed
    std::optional<node_stats> m_stats;
};

} // namespace cad::lavalink
