#include "cad/player/player.hpp"

#include <algorithm>
#include <sstream>

namespace cad::player {

using namespace cad::lavalink;

const char* to_string(player_state s)
{
    switch (s) {
        case player_state::idle:      return "idle";
        case player_state::playing:   return "playing";
        case player_state::paused:    return "paused";
        case player_state::stalled:   return "stalled";
        case player_state::destroyed: return "destroyed";
    }
    return "unknown";
}

const char* to_string(loop_mode m)
{
    switch (m) {
        case loop_mode::none:   return "none";
        case loop_mode::track:  return "track";
        case loop_mode::queue:  return "queue";
        case loop_mode::random: return "random";
    }
    return "unknown";
}

player::player(dpp::snowflake guild_id,
               std::weak_ptr<lavalink::node> node,
               player_policy policy,
               scheduler& sched,
               notifier notify,
               logger log)
    : m_guild_id(guild_id)
    , m_policy(std::move(policy))
    , m_scheduler(sched)
    , m_notify(std::move(notify))
    , m_log(log.with_prefix("Player " + guild_id.str()))
    , m_node(std::move(node))
    , m_volume(std::clamp(m_policy.default_volume, 0, 1000))
    , m_last_activity(sched.now())
    , m_rng(std::random_device{}())
{
}

// ---------- helpers (m_mutex held) ----------

bool player::deliverable_locked() const
{
    if (m_state == player_state::stalled || m_state == player_state::destroyed || !m_voice.has_value()) {
        return false;
    }
    auto n = m_node.lock();
    return n && n->is_ready();
}

bool player::active_locked() const
{
    return m_state == player_state::playing || m_state == player_state::paused;
}

void player::touch_locked()
{
    m_last_activity = m_scheduler.now();
}

bool player::is_current_locked(const std::string& encoded) const
{
    if (!m_index.has_value()) {
        return false;
    }
    // events without a track blob cannot be checked
    return encoded.empty() || m_queue[*m_index].encoded == encoded;
}

void player::note_locked(effects& fx, notification::kind what, std::string message)
{
    notification n;
    n.what     = what;
    n.guild_id = m_guild_id;
    if (m_index.has_value()) {
        n.track = m_queue[*m_index];
    }
    n.message = std::move(message);
    fx.notes.push_back(std::move(n));
}

void player::push_voice_update_locked(effects& fx)
{
    voice_update_command cmd;
    cmd.guild_id   = m_guild_id;
    cmd.session_id = m_voice->session_id;
    cmd.token      = m_voice->token;
    cmd.endpoint   = m_voice->endpoint;
    fx.commands.emplace_back(std::move(cmd));
}

void player::flush_locked(effects& fx)
{
    push_voice_update_locked(fx);
    if (active_locked() && m_pending_play) {
        start_current_locked(fx, m_position_ms);
        return;
    }
    if (active_locked()) {
        if (m_resend_state) {
            fx.commands.emplace_back(pause_command{m_guild_id, m_paused});
            fx.commands.emplace_back(volume_command{m_guild_id, m_volume});
        }
        if (m_resend_seek) {
            fx.commands.emplace_back(seek_command{m_guild_id, m_position_ms});
        }
    } else if (m_resend_state) {
        fx.commands.emplace_back(stop_command{m_guild_id});
    }
    m_resend_state = false;
    m_resend_seek  = false;
}

void player::start_current_locked(effects& fx, std::int64_t start_ms)
{
    m_state       = m_paused ? player_state::paused : player_state::playing;
    m_position_ms = start_ms;

    if (!deliverable_locked()) {
        m_pending_play = true;
        return;
    }
    m_pending_play = false;
    m_resend_state = false;
    m_resend_seek  = false;

    play_command cmd;
    cmd.guild_id = m_guild_id;
    cmd.track    = m_queue[*m_index].encoded;
    cmd.volume   = m_volume;
    if (start_ms > 0) {
        cmd.start_ms = start_ms;
    }
    if (m_paused) {
        cmd.paused = true;
    }
    fx.commands.emplace_back(std::move(cmd));
}

void player::go_idle_locked(effects& fx, bool send_stop, bool announce)
{
    m_resend_seek = false;
    if (send_stop) {
        if (deliverable_locked()) {
            fx.commands.emplace_back(stop_command{m_guild_id});
            m_resend_state = false;
        } else {
            m_resend_state = true;
        }
    }
    if (announce) {
        note_locked(fx, notification::kind::queue_empty);
    }
    m_state        = player_state::idle;
    m_index.reset();
    m_position_ms  = 0;
    m_paused       = false;
    m_pending_play = false;
    m_absorb_end   = false;
    m_failures     = 0;
}

void player::advance_locked(effects& fx, bool user_skip)
{
    if (!m_index.has_value() || m_queue.empty()) {
        go_idle_locked(fx, user_skip, true);
        return;
    }

    const std::size_t n = m_queue.size();
    const std::size_t i = *m_index;
    std::size_t next    = i;

    switch (m_loop) {
        case loop_mode::track:
            if (!user_skip) {
                break;
            }
            [[fallthrough]];
        case loop_mode::none:
            if (i + 1 >= n) {
                go_idle_locked(fx, user_skip, true);
                return;
            }
            next = i + 1;
            break;
        case loop_mode::queue:
            next = (i + 1) % n;
            break;
        case loop_mode::random:
            if (n > 1) {
                std::uniform_int_distribution<std::size_t> pick(0, n - 2);
                next = pick(m_rng);
                if (next >= i) {
                    ++next;
                }
            }
            break;
    }

    m_index = next;
    start_current_locked(fx);
}

void player::register_failure_locked(effects& fx, const std::string& why)
{
    ++m_failures;
    {
        std::ostringstream oss;
        oss << "Track failed (" << m_failures << "/" << m_policy.auto_skip_ceiling << "): " << why;
        m_log.log(dpp::ll_warning, oss.str());
    }

    if (m_failures >= m_policy.auto_skip_ceiling) {
        note_locked(fx, notification::kind::track_failed, why);
        go_idle_locked(fx, true, false);
        return;
    }
    advance_locked(fx, false);
}

void player::deliver(effects& fx)
{
    if (fx.target) {
        std::vector<outbound_command> dropped;
        for (const auto& cmd : fx.commands) {
            if (!fx.target->send(cmd)) {
                std::ostringstream oss;
                oss << "Node not ready, dropped " << op_name(cmd);
                m_log.log(dpp::ll_debug, oss.str());
                dropped.push_back(cmd);
            }
        }
        if (!dropped.empty()) {
            requeue_dropped(*fx.target, dropped);
        }
    }
    if (m_notify) {
        for (const auto& n : fx.notes) {
            m_notify(n);
        }
    }
}

// Commands the node refused are replayed by the next resync, and a refused
// destroy is handed to the node.
void player::requeue_dropped(lavalink::node& target, const std::vector<outbound_command>& dropped)
{
    bool destroy_remote = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& cmd : dropped) {
            if (std::holds_alternative<destroy_command>(cmd)) {
                destroy_remote = true;
            } else if (m_state == player_state::destroyed || m_state == player_state::stalled) {
                continue;
            } else if (std::holds_alternative<play_command>(cmd)) {
                m_pending_play = m_pending_play || active_locked();
            } else if (std::holds_alternative<seek_command>(cmd)) {
                m_resend_seek = true;
            } else if (!std::holds_alternative<voice_update_command>(cmd)) {
                m_resend_state = true;
            }
        }
    }
    if (destroy_remote) {
        target.destroy_remote_player(m_guild_id);
    }
}

// ---------- commands ----------

status player::enqueue(const track& t)
{
    effects fx;
    status result = status::ok;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (m_queue.size() >= m_policy.max_queue_length) {
            return status::queue_full;
        }
        touch_locked();
        m_queue.push_back(t);

        if (m_state == player_state::idle) {
            m_index = m_queue.size() - 1;
            start_current_locked(fx);
        } else if (m_state == player_state::stalled && !m_index.has_value()) {
            m_index        = m_queue.size() - 1;
            m_pending_play = true;
        }
        fx.target = m_node.lock();
    }
    deliver(fx);
    return result;
}

status player::enqueue_all(const std::vector<track>& tracks, std::size_t selected)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (tracks.empty()) {
            return status::no_matches;
        }
        if (m_queue.size() + tracks.size() > m_policy.max_queue_length) {
            return status::queue_full;
        }
        touch_locked();
        const std::size_t first = m_queue.size();
        m_queue.insert(m_queue.end(), tracks.begin(), tracks.end());

        const std::size_t start = first + std::min(selected, tracks.size() - 1);
        if (m_state == player_state::idle) {
            m_index = start;
            start_current_locked(fx);
        } else if (m_state == player_state::stalled && !m_index.has_value()) {
            m_index        = start;
            m_pending_play = true;
        }
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::skip()
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (m_state == player_state::stalled) {
            return status::stalled;
        }
        if (!active_locked()) {
            return status::not_active;
        }
        touch_locked();
        m_failures = 0;
        m_paused   = false;
        advance_locked(fx, true);
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::previous()
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (m_state == player_state::stalled) {
            return status::stalled;
        }
        if (!active_locked()) {
            return status::not_active;
        }
        if (*m_index == 0) {
            return status::at_boundary;
        }
        touch_locked();
        m_failures = 0;
        m_paused   = false;
        m_index    = *m_index - 1;
        start_current_locked(fx);
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::pause()
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (m_state == player_state::stalled) {
            return status::stalled;
        }
        if (m_state == player_state::idle) {
            return status::not_active;
        }
        if (m_state == player_state::paused) {
            return status::ok;
        }
        touch_locked();
        m_paused = true;
        m_state  = player_state::paused;
        if (!m_pending_play) {
            if (deliverable_locked()) {
                fx.commands.emplace_back(pause_command{m_guild_id, true});
            } else {
                m_resend_state = true;
            }
        }
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::resume()
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (m_state == player_state::stalled) {
            return status::stalled;
        }
        if (m_state == player_state::idle) {
            return status::not_active;
        }
        if (m_state == player_state::playing) {
            return status::ok;
        }
        touch_locked();
        m_paused = false;
        m_state  = player_state::playing;
        if (!m_pending_play) {
            if (deliverable_locked()) {
                fx.commands.emplace_back(pause_command{m_guild_id, false});
            } else {
                m_resend_state = true;
            }
        }
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::seek(std::int64_t position_ms)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        if (m_state == player_state::stalled) {
            return status::stalled;
        }
        if (!active_locked()) {
            return status::not_active;
        }
        const track& current = m_queue[*m_index];
        if (!current.is_seekable || current.is_stream) {
            return status::command_rejected;
        }
        touch_locked();
        m_position_ms = std::clamp<std::int64_t>(position_ms, 0, std::max<std::int64_t>(current.length_ms, 0));
        if (!m_pending_play) {
            if (deliverable_locked()) {
                fx.commands.emplace_back(seek_command{m_guild_id, m_position_ms});
            } else {
                m_resend_seek = true;
            }
        }
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::set_volume(int volume)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return status::destroyed;
        }
        touch_locked();
        m_volume = std::clamp(volume, 0, 1000);
        if (active_locked() && !m_pending_play) {
            if (deliverable_locked()) {
                fx.commands.emplace_back(volume_command{m_guild_id, m_volume});
            } else {
                m_resend_state = true;
            }
        }
        fx.target = m_node.lock();
    }
    deliver(fx);
    return status::ok;
}

status player::set_loop_mode(loop_mode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == player_state::destroyed) {
        return status::destroyed;
    }
    touch_locked();
    m_loop = mode;
    return status::ok;
}

// ---------- node events ----------

void player::on_event(const player_event& ev)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed || m_state == player_state::stalled) {
            return;
        }
        touch_locked();

        if (const auto* start = std::get_if<track_start>(&ev)) {
            if (!is_current_locked(start->track)) {
                m_log.log(dpp::ll_debug, "Ignoring start of a track that is not current");
                return;
            }
            m_absorb_end = false;
            note_locked(fx, notification::kind::now_playing);
        } else if (const auto* end = std::get_if<track_end>(&ev)) {
            if (!active_locked() || !is_current_locked(end->track)) {
                m_log.log(dpp::ll_debug, std::string("Ignoring stale end (") + to_string(end->reason) + ")");
                return;
            }
            if (m_absorb_end && end->reason == end_reason::load_failed) {
                // trailing end of a failure already handled
                m_absorb_end = false;
                return;
            }
            m_absorb_end = false;
            if (end->reason == end_reason::finished) {
                m_failures = 0;
                advance_locked(fx, false);
            } else if (end->reason == end_reason::load_failed) {
                register_failure_locked(fx, "load failed");
            } else if (end->reason == end_reason::unknown) {
                m_log.log(dpp::ll_warning, "Track ended for an unknown reason, not advancing");
            }
        } else if (const auto* ex = std::get_if<track_exception>(&ev)) {
            if (!active_locked() || !is_current_locked(ex->track)) {
                return;
            }
            m_absorb_end = true;
            register_failure_locked(fx, ex->message.empty() ? "playback error" : ex->message);
        } else if (const auto* stuck = std::get_if<track_stuck>(&ev)) {
            if (!active_locked() || !is_current_locked(stuck->track)) {
                return;
            }
            m_absorb_end = true;
            register_failure_locked(fx, "stuck for " + std::to_string(stuck->threshold_ms) + "ms");
        } else if (const auto* closed = std::get_if<connection_closed>(&ev)) {
            m_voice_connected = false;
            std::ostringstream oss;
            oss << "Voice connection closed (" << closed->code << " " << closed->reason
                << (closed->by_remote ? ", by remote" : "") << ")";
            m_log.log(dpp::ll_warning, oss.str());
        }

        fx.target = m_node.lock();
    }
    deliver(fx);
}

void player::on_player_update(const player_update_message& msg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == player_state::destroyed || m_state == player_state::stalled) {
        return;
    }
    if (active_locked()) {
        m_position_ms = msg.position_ms;
    }
    m_voice_connected = msg.connected;
}

void player::update_voice_session(const voice_session& session)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return;
        }
        touch_locked();
        m_voice = session;

        if (!deliverable_locked()) {
            m_log.log(dpp::ll_debug, "Voice session stored, node not ready");
            return;
        }
        flush_locked(fx);
        fx.target = m_node.lock();
    }
    deliver(fx);
}

void player::mark_stalled()
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed || m_state == player_state::stalled) {
            return;
        }
        if (m_index.has_value()) {
            m_pending_play = true;
        }
        m_state = player_state::stalled;
        note_locked(fx, notification::kind::player_stalled);
    }
    m_log.log(dpp::ll_warning, "Stalled, waiting for a node");
    deliver(fx);
}

void player::rebind(std::weak_ptr<lavalink::node> node, std::optional<track> replacement)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return;
        }
        m_node = std::move(node);
        if (replacement.has_value() && m_index.has_value()) {
            m_queue[*m_index] = std::move(*replacement);
        }

        // the new node has no player yet
        m_resend_state = false;
        m_resend_seek  = false;
        if (!m_index.has_value()) {
            m_state        = player_state::idle;
            m_pending_play = false;
        } else {
            m_state        = m_paused ? player_state::paused : player_state::playing;
            m_pending_play = true;
        }

        if (deliverable_locked()) {
            push_voice_update_locked(fx);
            if (m_pending_play) {
                start_current_locked(fx, m_position_ms);
            }
        }
        fx.target = m_node.lock();
    }
    if (fx.target) {
        m_log.log(dpp::ll_info, "Bound to node " + fx.target->name());
    }
    deliver(fx);
}

void player::resync()
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed || m_state == player_state::stalled) {
            return;
        }
        if (!deliverable_locked()) {
            return;
        }
        flush_locked(fx);
        fx.target = m_node.lock();
    }
    deliver(fx);
}

bool player::destroy(const std::string& reason)
{
    effects fx;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == player_state::destroyed) {
            return false;
        }
        auto n = m_node.lock();
        if (m_state != player_state::stalled && n) {
            // a refused destroy goes to the node, see requeue_dropped
            fx.commands.emplace_back(stop_command{m_guild_id});
            fx.commands.emplace_back(destroy_command{m_guild_id});
        }
        note_locked(fx, notification::kind::player_destroyed, reason);

        m_state        = player_state::destroyed;
        m_queue.clear();
        m_index.reset();
        m_pending_play = false;
        m_resend_state = false;
        m_resend_seek  = false;
        m_voice.reset();
        fx.target = std::move(n);
    }
    m_log.log(dpp::ll_info, "Destroyed: " + reason);
    deliver(fx);
    return true;
}

// ---------- queries ----------

player_snapshot player::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    player_snapshot s;
    s.guild_id        = m_guild_id;
    s.state           = m_state;
    s.loop            = m_loop;
    s.queue           = m_queue;
    s.current         = m_index;
    s.position_ms     = m_position_ms;
    s.volume          = m_volume;
    s.voice_connected = m_voice_connected;
    if (auto n = m_node.lock()) {
        s.node_name = n->name();
    }
    return s;
}

player_state player::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::shared_ptr<lavalink::node> player::node() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_node.lock();
}

bool player::bound_to(const lavalink::node& n) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_node.lock().get() == &n;
}

std::optional<track> player::current_track() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index.has_value()) {
        return std::nullopt;
    }
    return m_queue[*m_index];
}

scheduler::clock::time_point player::last_activity() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_activity;
}

} // namespace cad::player
