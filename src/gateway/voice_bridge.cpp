#include "cad/gateway/voice_bridge.hpp"

#include <sstream>

namespace cad::gateway {

voice_bridge::voice_bridge(session_handler on_session, disconnect_handler on_disconnect, logger log)
    : m_on_session(std::move(on_session))
    , m_on_disconnect(std::move(on_disconnect))
    , m_log(log.with_prefix("Voice"))
{
}

std::optional<lavalink::voice_session> voice_bridge::complete_locked(dpp::snowflake guild_id, entry& e)
{
    if (e.channel_id.empty() || e.session_id.empty() || e.token.empty() || e.endpoint.empty()) {
        return std::nullopt;
    }

    lavalink::voice_session vs;
    vs.guild_id   = guild_id;
    vs.channel_id = e.channel_id;
    vs.session_id = e.session_id;
    vs.token      = e.token;
    vs.endpoint   = e.endpoint;

    if (e.last_sent.has_value() &&
        e.last_sent->channel_id == vs.channel_id &&
        e.last_sent->session_id == vs.session_id &&
        e.last_sent->token == vs.token &&
        e.last_sent->endpoint == vs.endpoint) {
        return std::nullopt;
    }
    e.last_sent = vs;
    return vs;
}

void voice_bridge::on_voice_state(dpp::snowflake guild_id,
                                  dpp::snowflake channel_id,
                                  const std::string& session_id)
{
    std::optional<lavalink::voice_session> ready;
    bool left = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (channel_id.empty()) {
            left = m_entries.erase(guild_id) > 0;
        } else {
            auto& e = m_entries[guild_id];
            e.channel_id = channel_id;
            e.session_id = session_id;
            ready = complete_locked(guild_id, e);
        }
    }

    std::ostringstream oss;
    oss << "Voice state for guild " << guild_id
        << " channel=" << channel_id << " session_id=" << session_id;
    m_log.log(dpp::ll_debug, oss.str());

    if (left && m_on_disconnect) {
        m_on_disconnect(guild_id);
    }
    if (ready.has_value() && m_on_session) {
        m_on_session(*ready);
    }
}

void voice_bridge::on_voice_server(dpp::snowflake guild_id,
                                   const std::string& token,
                                   const std::string& endpoint)
{
    std::optional<lavalink::voice_session> ready;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& e = m_entries[guild_id];
        e.token    = token;
        e.endpoint = endpoint;
        ready = complete_locked(guild_id, e);
    }

    std::ostringstream oss;
    oss << "Voice server for guild " << guild_id
        << " token=" << (!token.empty() ? "<set>" : "<empty>")
        << " endpoint=" << endpoint;
    m_log.log(dpp::ll_debug, oss.str());

    if (ready.has_value() && m_on_session) {
        m_on_session(*ready);
    }
}

std::optional<lavalink::voice_session> voice_bridge::session(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(guild_id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.last_sent;
}

dpp::snowflake voice_bridge::channel(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(guild_id);
    return it == m_entries.end() ? dpp::snowflake() : it->second.channel_id;
}

void voice_bridge::forget(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(guild_id);
}

} // namespace cad::gateway
