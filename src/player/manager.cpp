#include "cad/player/manager.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <tuple>

namespace cad::player {

using lavalink::load_result;
using lavalink::load_type;

namespace {

// URLs and "<source>search:" queries go to the node as they are.
bool is_identifier(const std::string& query)
{
    if (query.find("://") != std::string::npos) {
        return true;
    }
    auto colon = query.find(':');
    if (colon == std::string::npos || colon < 6) {
        return false;
    }
    const std::string prefix = query.substr(0, colon);
    if (!std::all_of(prefix.begin(), prefix.end(), [](unsigned char c) { return std::isalnum(c); })) {
        return false;
    }
    return prefix.compare(prefix.size() - 6, 6, "search") == 0;
}

} // namespace

manager::manager(scheduler& sched, player_policy policy, notifier notify, logger log)
    : m_scheduler(sched)
    , m_policy(std::move(policy))
    , m_notify(std::move(notify))
    , m_log(log.with_prefix("Manager"))
{
}

manager::~manager()
{
    shutdown();
}

void manager::add_node(std::shared_ptr<lavalink::node> n)
{
    n->set_listener(this);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_nodes.push_back(std::move(n));
}

void manager::connect_all()
{
    std::vector<std::shared_ptr<lavalink::node>> nodes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        nodes = m_nodes;
    }
    for (auto& n : nodes) {
        n->connect();
    }
}

void manager::shutdown()
{
    std::unordered_map<dpp::snowflake, std::shared_ptr<player>> players;
    std::vector<std::shared_ptr<lavalink::node>> nodes;
    std::vector<scheduler::task_id> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        players.swap(m_players);
        nodes = m_nodes;
        for (const auto& [guild, id] : m_idle_timers) {
            (void)guild;
            tasks.push_back(id);
        }
        m_idle_timers.clear();
        tasks.insert(tasks.end(), m_tasks.begin(), m_tasks.end());
        m_tasks.clear();
    }

    for (auto id : tasks) {
        m_scheduler.cancel(id);
    }
    for (auto& [guild, p] : players) {
        (void)guild;
        p->destroy("shutting down");
    }
    for (auto& n : nodes) {
        n->set_listener(nullptr);
        n->shutdown();
    }
}

// ---------- node selection ----------

std::shared_ptr<lavalink::node> manager::select_node_locked() const
{
    std::shared_ptr<lavalink::node> best;
    auto key = [](const lavalink::node& n) {
        const auto stats   = n.stats();
        const auto playing = stats ? stats->playing_players : 0;
        const auto load    = stats ? stats->system_load : 0.0;
        return std::make_tuple(n.is_ready() ? 0 : 1, n.player_count(), playing, load);
    };

    for (const auto& n : m_nodes) {
        if (!n->healthy()) {
            continue;
        }
        if (!best || key(*n) < key(*best)) {
            best = n;
        }
    }
    return best;
}

std::shared_ptr<lavalink::node> manager::select_node() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return select_node_locked();
}

// ---------- registry ----------

std::shared_ptr<player> manager::create_locked(dpp::snowflake guild_id, status& result)
{
    if (m_shutdown) {
        result = status::node_unavailable;
        return nullptr;
    }
    auto it = m_players.find(guild_id);
    if (it != m_players.end()) {
        result = status::ok;
        return it->second;
    }

    auto n = select_node_locked();
    if (!n) {
        result = status::node_unavailable;
        return nullptr;
    }

    auto p = std::make_shared<player>(guild_id, n, m_policy, m_scheduler, m_notify, m_log);
    n->attach_player(guild_id);
    m_players.emplace(guild_id, p);

    std::ostringstream oss;
    oss << "Created player for guild " << guild_id << " on node " << n->name();
    m_log.log(dpp::ll_info, oss.str());

    result = status::ok;
    return p;
}

status manager::join(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    status result = status::ok;
    create_locked(guild_id, result);
    return result;
}

status manager::assign(dpp::snowflake guild_id, const lavalink::voice_session& session)
{
    std::shared_ptr<player> p;
    status result = status::ok;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        p = create_locked(guild_id, result);
    }
    if (!p) {
        return result;
    }
    p->update_voice_session(session);
    return status::ok;
}

std::shared_ptr<player> manager::find(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(guild_id);
    return it == m_players.end() ? nullptr : it->second;
}

std::size_t manager::player_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_players.size();
}

bool manager::still_registered(dpp::snowflake guild_id, const std::shared_ptr<player>& p) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(guild_id);
    return it != m_players.end() && it->second == p;
}

play_result manager::play(dpp::snowflake guild_id, const std::string& query)
{
    play_result out;

    std::shared_ptr<player> p;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        p = create_locked(guild_id, out.result);
    }
    if (!p) {
        return out;
    }
    if (p->state() == player_state::stalled) {
        out.result = status::stalled;
        return out;
    }
    auto n = p->node();
    if (!n) {
        out.result = status::node_unavailable;
        return out;
    }

    load_result res;
    try {
        res = n->rest().load_tracks(query);
        if (res.type == load_type::empty && !is_identifier(query) && !m_policy.search_prefix.empty()) {
            res = n->rest().load_tracks(m_policy.search_prefix + query);
        }
    } catch (const rest_error& e) {
        out.result  = e.retryable() ? status::node_unavailable : status::command_rejected;
        out.message = e.what();
        return out;
    }

    // the player may have been released while the node was resolving
    if (!still_registered(guild_id, p) || p->state() == player_state::destroyed) {
        m_log.log(dpp::ll_debug, "Dropping resolve result for released guild " + guild_id.str());
        out.result = status::destroyed;
        return out;
    }

    const bool was_idle = p->state() == player_state::idle;

    switch (res.type) {
        case load_type::empty:
            out.result = status::no_matches;
            return out;
        case load_type::error:
            out.result  = status::load_failed;
            out.message = res.error_message;
            return out;
        case load_type::track:
        case load_type::search:
            out.result = p->enqueue(res.tracks.front());
            out.first  = res.tracks.front();
            out.added  = out.result == status::ok ? 1 : 0;
            break;
        case load_type::playlist:
            out.result        = p->enqueue_all(res.tracks, res.selected_index);
            out.first         = res.tracks[res.selected_index];
            out.added         = out.result == status::ok ? res.tracks.size() : 0;
            out.playlist_name = res.playlist_name;
            break;
    }
    out.started = was_idle && out.result == status::ok;
    return out;
}

status manager::rebind(dpp::snowflake guild_id)
{
    auto p = find(guild_id);
    if (!p) {
        return status::no_player;
    }
    auto previous = p->node();

    std::shared_ptr<lavalink::node> target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        target = select_node_locked();
    }
    if (!target) {
        m_log.log(dpp::ll_warning, "No healthy node for guild " + guild_id.str());
        if (release(guild_id, "no audio node available")) {
            notification n;
            n.what     = notification::kind::node_unavailable;
            n.guild_id = guild_id;
            n.message  = "no audio node available";
            emit(n);
        }
        return status::node_unavailable;
    }

    // encoded tracks are node specific; resolve the current one again
    std::optional<lavalink::track> replacement;
    auto current = p->current_track();
    if (current.has_value() && target != previous) {
        const std::string identifier = current->uri.empty() ? current->identifier : current->uri;
        try {
            if (!identifier.empty()) {
                load_result res = target->rest().load_tracks(identifier);
                if (!res.tracks.empty()) {
                    replacement = res.tracks.front();
                }
            }
        } catch (const rest_error& e) {
            m_log.log(dpp::ll_warning, std::string("Re-resolving current track failed: ") + e.what());
        }
    }

    if (!still_registered(guild_id, p)) {
        return status::destroyed;
    }
    if (previous && previous != target) {
        previous->detach_player(guild_id);
    }
    target->attach_player(guild_id);
    p->rebind(target, std::move(replacement));
    return status::ok;
}

bool manager::release(dpp::snowflake guild_id, const std::string& reason)
{
    std::shared_ptr<player> p;
    scheduler::task_id timer = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(guild_id);
        if (it == m_players.end()) {
            return false;
        }
        p = std::move(it->second);
        m_players.erase(it);

        auto t = m_idle_timers.find(guild_id);
        if (t != m_idle_timers.end()) {
            timer = t->second;
            m_idle_timers.erase(t);
        }
    }

    if (timer != 0) {
        m_scheduler.cancel(timer);
    }
    if (auto n = p->node()) {
        n->detach_player(guild_id);
    }
    p->destroy(reason);
    return true;
}

// ---------- occupancy ----------

void manager::update_occupancy(dpp::snowflake guild_id, std::size_t listeners)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_players.find(guild_id) == m_players.end()) {
        return;
    }

    auto it = m_idle_timers.find(guild_id);
    if (it != m_idle_timers.end()) {
        m_scheduler.cancel(it->second);
        m_idle_timers.erase(it);
    }
    if (listeners > 0) {
        return;
    }

    auto holder = std::make_shared<scheduler::task_id>(0);
    const auto id = m_scheduler.schedule(
        std::chrono::duration_cast<std::chrono::milliseconds>(m_policy.idle_timeout),
        [this, guild_id, holder] { handle_idle_timeout(guild_id, *holder); });
    *holder = id;
    m_idle_timers[guild_id] = id;

    std::ostringstream oss;
    oss << "Guild " << guild_id << " has no listeners, leaving in " << m_policy.idle_timeout.count() << "s";
    m_log.log(dpp::ll_debug, oss.str());
}

bool manager::idle_timer_armed(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle_timers.find(guild_id) != m_idle_timers.end();
}

void manager::handle_idle_timeout(dpp::snowflake guild_id, scheduler::task_id id)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_idle_timers.find(guild_id);
        if (it == m_idle_timers.end() || it->second != id) {
            return; // re-armed or cancelled
        }
        m_idle_timers.erase(it);
    }
    m_log.log(dpp::ll_info, "Idle timeout for guild " + guild_id.str());
    release(guild_id, "idle timeout");
}

std::vector<lavalink::node_snapshot> manager::node_health() const
{
    std::vector<std::shared_ptr<lavalink::node>> nodes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        nodes = m_nodes;
    }
    std::vector<lavalink::node_snapshot> out;
    out.reserve(nodes.size());
    for (const auto& n : nodes) {
        out.push_back(n->snapshot());
    }
    return out;
}

// ---------- node events ----------

void manager::defer(std::function<void()> fn)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown) {
        return;
    }
    auto holder = std::make_shared<scheduler::task_id>(0);
    const auto id = m_scheduler.schedule(std::chrono::milliseconds(0), [this, holder, fn = std::move(fn)] {
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            m_tasks.erase(*holder);
            if (m_shutdown) {
                return;
            }
        }
        fn();
    });
    *holder = id;
    m_tasks.insert(id);
}

std::vector<std::shared_ptr<player>> manager::bound_players(const lavalink::node& n) const
{
    std::vector<std::shared_ptr<player>> out;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [guild, p] : m_players) {
        (void)guild;
        if (p->bound_to(n)) {
            out.push_back(p);
        }
    }
    return out;
}

std::shared_ptr<player> manager::route(const lavalink::node& n, dpp::snowflake guild_id) const
{
    auto p = find(guild_id);
    if (!p || !p->bound_to(n)) {
        std::ostringstream oss;
        oss << "Dropping message for guild " << guild_id << " not bound to node " << n.name();
        m_log.log(dpp::ll_debug, oss.str());
        return nullptr;
    }
    return p;
}

void manager::on_node_ready(lavalink::node& n, bool resumed)
{
    std::vector<dpp::snowflake> stalled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [guild, p] : m_players) {
            if (p->state() == player_state::stalled) {
                stalled.push_back(guild);
            }
        }
    }

    for (auto& p : bound_players(n)) {
        if (p->state() != player_state::stalled) {
            p->resync();
        }
    }

    std::ostringstream oss;
    oss << "Node " << n.name() << " ready (" << (resumed ? "resumed" : "new session")
        << "), " << stalled.size() << " stalled player(s) to rebind";
    m_log.log(dpp::ll_info, oss.str());

    for (auto guild : stalled) {
        defer([this, guild] { rebind(guild); });
    }
}

void manager::on_node_session_lost(lavalink::node& n)
{
    auto players = bound_players(n);
    std::ostringstream oss;
    oss << "Node " << n.name() << " lost its session, stalling " << players.size() << " player(s)";
    m_log.log(dpp::ll_warning, oss.str());

    for (auto& p : players) {
        p->mark_stalled();
    }
}

void manager::on_node_unhealthy(lavalink::node& n)
{
    auto players = bound_players(n);
    std::ostringstream oss;
    oss << "Node " << n.name() << " unhealthy, moving " << players.size() << " player(s)";
    m_log.log(dpp::ll_error, oss.str());

    for (auto& p : players) {
        const auto guild = p->guild_id();
        defer([this, guild] { rebind(guild); });
    }
}

void manager::on_player_update(lavalink::node& n, const lavalink::player_update_message& msg)
{
    if (auto p = route(n, msg.guild_id)) {
        p->on_player_update(msg);
    }
}

void manager::on_player_event(lavalink::node& n, const lavalink::event_message& msg)
{
    if (auto p = route(n, msg.guild_id)) {
        p->on_event(msg.event);
    }
}

void manager::emit(const notification& n)
{
    if (m_notify) {
        m_notify(n);
    }
}

} // namespace cad::player
