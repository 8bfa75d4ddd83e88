#include "cad/lavalink/node.hpp"
#include "cad/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cad::lavalink {

const char* to_string(node_state s)
{
    switch (s) {
        case node_state::disconnected:  return "disconnected";
        case node_state::connecting:    return "connecting";
        case node_state::authenticated: return "authenticated";
        case node_state::ready:         return "ready";
        case node_state::reconnecting:  return "reconnecting";
    }
    return "unknown";
}

node::node(node_config cfg,
           dpp::snowflake user_id,
           std::string client_name,
           reconnect_policy reconnect,
           rest_policy rest,
           socket_transport& socket,
           http_transport& http,
           scheduler& sched,
           logger log)
    : m_cfg(std::move(cfg))
    , m_user_id(user_id)
    , m_client_name(std::move(client_name))
    , m_policy(reconnect)
    , m_socket(socket)
    , m_scheduler(sched)
    , m_log(log.with_prefix("Node " + m_cfg.name))
    , m_rest(http, m_cfg, user_id, m_client_name, rest, m_log)
{
    std::ostringstream oss;
    oss << "Using " << (m_cfg.secure ? "wss://" : "ws://") << m_cfg.host << ":" << m_cfg.port
        << m_cfg.api_prefix << "/websocket";
    m_log.log(dpp::ll_info, oss.str());
}

node::~node()
{
    shutdown();
}

void node::set_listener(node_listener* listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = listener;
}

node_listener* node::listener() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_listener;
}

void node::connect()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || m_state != node_state::disconnected || m_retry_task != 0) {
            return;
        }
        m_state = node_state::connecting;
    }
    open_session();
}

void node::shutdown()
{
    bool live = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        m_state    = node_state::disconnected;
        if (m_retry_task != 0) {
            m_scheduler.cancel(m_retry_task);
            m_retry_task = 0;
        }
        if (m_timeout_task != 0) {
            m_scheduler.cancel(m_timeout_task);
            m_timeout_task = 0;
        }
        live = m_live;
    }
    m_log.log(dpp::ll_info, "Shutting down");
    if (live) {
        m_socket.close();
    }
}

void node::open_session()
{
    socket_request req;
    std::uint64_t  generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        if (m_live) {
            // previous session still tearing down; reopen from handle_close
            m_open_after_close = true;
            return;
        }
        m_live     = true;
        generation = ++m_generation;

        req.host   = m_cfg.host;
        req.port   = m_cfg.port;
        req.secure = m_cfg.secure;
        req.path   = m_cfg.api_prefix + "/websocket";
        req.headers.emplace_back("Authorization", m_cfg.password);
        req.headers.emplace_back("User-Id", m_user_id.str());
        req.headers.emplace_back("Client-Name", m_client_name);
        if (m_lost_at.has_value() && !m_session_id.empty()) {
            req.headers.emplace_back("Session-Id", m_session_id);
            req.headers.emplace_back("Resume-Key", m_session_id);
        }

        std::weak_ptr<node> weak = weak_from_this();
        m_timeout_task = m_scheduler.schedule(m_policy.connect_timeout, [weak, generation] {
            if (auto self = weak.lock()) {
                self->handle_connect_timeout(generation);
            }
        });
    }

    {
        std::ostringstream oss;
        oss << "Connecting (attempt " << generation
            << (req.headers.size() > 3 ? ", resuming" : "") << ")";
        m_log.log(dpp::ll_debug, oss.str());
    }

    std::weak_ptr<node> weak = weak_from_this();
    socket_transport::handlers h;
    h.on_open = [weak, generation] {
        if (auto self = weak.lock()) {
            self->handle_open(generation);
        }
    };
    h.on_message = [weak, generation](const std::string& text) {
        if (auto self = weak.lock()) {
            self->handle_message(generation, text);
        }
    };
    h.on_close = [weak, generation](std::uint16_t code, const std::string& reason) {
        if (auto self = weak.lock()) {
            self->handle_close(generation, code, reason);
        }
    };
    m_socket.open(req, std::move(h));
}

std::chrono::milliseconds node::backoff_locked() const
{
    const double scaled = static_cast<double>(m_policy.base_delay.count())
                        * std::pow(m_policy.multiplier, static_cast<double>(m_failures));
    const double capped = std::min(scaled, static_cast<double>(m_policy.max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

void node::schedule_retry_locked(std::chrono::milliseconds delay)
{
    if (m_retry_task != 0) {
        m_scheduler.cancel(m_retry_task);
    }
    std::weak_ptr<node> weak = weak_from_this();
    m_retry_task = m_scheduler.schedule(delay, [weak] {
        if (auto self = weak.lock()) {
            self->handle_retry();
        }
    });
}

void node::handle_open(std::uint64_t generation)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation != m_generation || m_shutdown) {
        return;
    }
    if (m_state == node_state::connecting || m_state == node_state::reconnecting) {
        m_state = node_state::authenticated;
    }
    m_log.log(dpp::ll_debug, "Handshake accepted, waiting for ready");
}

void node::handle_message(std::uint64_t generation, const std::string& text)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || m_shutdown) {
            return;
        }
    }

    inbound_message msg;
    try {
        msg = decode(text);
    } catch (const malformed_frame& e) {
        m_log.log(dpp::ll_warning, std::string("Dropping malformed frame: ") + e.what());
        return;
    }

    if (auto* ready = std::get_if<ready_message>(&msg)) {
        handle_ready(*ready);
    } else if (auto* update = std::get_if<player_update_message>(&msg)) {
        if (auto* l = listener()) {
            l->on_player_update(*this, *update);
        }
    } else if (auto* stats = std::get_if<stats_message>(&msg)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats = stats->stats;
    } else if (auto* event = std::get_if<event_message>(&msg)) {
        if (auto* l = listener()) {
            l->on_player_event(*this, *event);
        }
    } else if (auto* unknown = std::get_if<unknown_message>(&msg)) {
        m_log.log(dpp::ll_debug, "Ignoring op '" + unknown->op + "' " + unknown->type);
    }
}

void node::handle_ready(const ready_message& msg)
{
    enum class outcome { fresh, resumed, rejected };
    outcome result = outcome::fresh;
    node_listener* l = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_timeout_task != 0) {
            m_scheduler.cancel(m_timeout_task);
            m_timeout_task = 0;
        }

        const bool resuming = m_lost_at.has_value() && !m_session_id.empty();
        if (resuming) {
            result = (msg.resumed && msg.session_id == m_session_id) ? outcome::resumed : outcome::rejected;
        }

        m_session_id = msg.session_id;
        m_state      = node_state::ready;
        m_failures   = 0;
        m_healthy    = true;
        m_lost_at.reset();
        l = m_listener;

        std::set<dpp::snowflake> orphans;
        orphans.swap(m_orphans);
        if (result != outcome::resumed) {
            orphans.clear();
        }

        const std::string sid = m_session_id;
        const auto window     = m_policy.resume_window;
        std::weak_ptr<node> weak = weak_from_this();
        m_scheduler.schedule(std::chrono::milliseconds(0), [weak, sid, window, orphans] {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            try {
                self->m_rest.configure_resuming(sid, window);
            } catch (const rest_error& e) {
                self->m_log.log(dpp::ll_warning, std::string("Could not enable resuming: ") + e.what());
            }
            for (const auto& guild_id : orphans) {
                self->remove_remote_player(sid, guild_id);
            }
        });
    }

    switch (result) {
        case outcome::resumed:
            m_log.log(dpp::ll_info, "Session '" + msg.session_id + "' resumed");
            break;
        case outcome::rejected:
            m_log.log(dpp::ll_warning, "Resume rejected, new session '" + msg.session_id + "'");
            break;
        case outcome::fresh:
            m_log.log(dpp::ll_info, "Ready, session '" + msg.session_id + "'");
            break;
    }

    if (l == nullptr) {
        return;
    }
    if (result == outcome::rejected) {
        l->on_node_session_lost(*this);
    }
    l->on_node_ready(*this, result == outcome::resumed);
}

void node::handle_close(std::uint64_t generation, std::uint16_t code, const std::string& reason)
{
    bool reopen          = false;
    bool notify_unhealthy = false;
    node_listener* l     = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
        m_live = false;
        if (m_timeout_task != 0) {
            m_scheduler.cancel(m_timeout_task);
            m_timeout_task = 0;
        }
        if (m_shutdown) {
            return;
        }

        if (m_open_after_close) {
            m_open_after_close = false;
            reopen = true;
        } else if (m_state == node_state::ready) {
            m_state   = node_state::reconnecting;
            m_lost_at = m_scheduler.now();
            schedule_retry_locked(backoff_locked());
        } else {
            ++m_failures;
            if (m_failures >= m_policy.failure_threshold && m_healthy) {
                m_healthy        = false;
                notify_unhealthy = true;
            }
            m_state = m_lost_at.has_value() ? node_state::reconnecting : node_state::disconnected;
            schedule_retry_locked(backoff_locked());
        }
        l = m_listener;
    }

    {
        std::ostringstream oss;
        oss << "Connection closed (" << code << (reason.empty() ? "" : ": " + reason) << ")";
        m_log.log(dpp::ll_warning, oss.str());
    }

    if (reopen) {
        open_session();
        return;
    }
    if (notify_unhealthy) {
        m_log.log(dpp::ll_error, "Failure threshold reached, node marked unhealthy");
        if (l != nullptr) {
            l->on_node_unhealthy(*this);
        }
    }
}

void node::handle_retry()
{
    bool session_lost = false;
    node_listener* l  = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_retry_task = 0;
        if (m_shutdown) {
            return;
        }
        if (m_lost_at.has_value()) {
            if (m_scheduler.now() - *m_lost_at > m_policy.resume_window) {
                m_lost_at.reset();
                m_session_id.clear();
                m_orphans.clear();
                m_state      = node_state::connecting;
                session_lost = true;
            }
        } else {
            m_state = node_state::connecting;
        }
        l = m_listener;
    }

    if (session_lost) {
        m_log.log(dpp::ll_warning, "Resume window expired, starting a new session");
        if (l != nullptr) {
            l->on_node_session_lost(*this);
        }
    }
    open_session();
}

void node::handle_connect_timeout(std::uint64_t generation)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
        m_timeout_task = 0;
        if (m_shutdown || !m_live || m_state == node_state::ready) {
            return;
        }
    }
    m_log.log(dpp::ll_warning, "No ready within " + std::to_string(m_policy.connect_timeout.count()) + "ms");
    m_socket.close();
}

bool node::send(const outbound_command& cmd)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != node_state::ready) {
            return false;
        }
    }

    std::ostringstream oss;
    oss << "Sending " << op_name(cmd) << " for guild " << guild_of(cmd);
    m_log.log(dpp::ll_debug, oss.str());

    return m_socket.send(encode(cmd));
}

node_state node::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool node::healthy() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_healthy && !m_shutdown;
}

std::string node::session_id() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session_id;
}

void node::remove_remote_player(const std::string& session_id, dpp::snowflake guild_id)
{
    try {
        m_rest.destroy_player(session_id, guild_id);
    } catch (const rest_error& e) {
        m_log.log(dpp::ll_warning, "Could not destroy player for guild " + guild_id.str() + ": " + e.what());
    }
}

void node::destroy_remote_player(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown || m_session_id.empty()) {
        return;
    }
    if (m_state != node_state::ready) {
        if (m_lost_at.has_value()) {
            m_orphans.insert(guild_id);
            m_log.log(dpp::ll_debug, "Destroy of guild " + guild_id.str() + " deferred until resumed");
        }
        return;
    }

    const std::string sid = m_session_id;
    std::weak_ptr<node> weak = weak_from_this();
    m_scheduler.schedule(std::chrono::milliseconds(0), [weak, sid, guild_id] {
        if (auto self = weak.lock()) {
            self->remove_remote_player(sid, guild_id);
        }
    });
}

void node::attach_player(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_players.insert(guild_id);
}

void node::detach_player(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_players.erase(guild_id);
}

std::size_t node::player_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_players.size();
}

std::optional<node_stats> node::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

node_snapshot node::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    node_snapshot s;
    s.name       = m_cfg.name;
    s.state      = m_state;
    s.healthy    = m_healthy && !m_shutdown;
    s.session_id = m_session_id;
    s.failures   = m_failures;
    s.players    = m_players.size();
    s.stats      = m_stats;
    return s;
}

} // namespace cad::lavalink
