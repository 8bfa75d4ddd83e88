#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <dpp/snowflake.h>

#include "cad/core/logging.hpp"
#include "cad/lavalink/types.hpp"

namespace cad::gateway {

/// Joins the bot's voice state and voice server updates into complete
/// voice sessions.
///
/// The gateway sends the two halves separately and in either order. A
/// session is handed on only once all of its fields are known, and only when
/// it differs from the last one handed on for that guild.
class voice_bridge {
public:
    using session_handler    = std::function<void(const lavalink::voice_session&)>;
    using disconnect_handler = std::function<void(dpp::snowflake guild_id)>;

    voice_bridge(session_handler on_session, disconnect_handler on_disconnect, logger log);

    // Bot's own voice state. channel_id 0 means the bot left voice.
    void on_voice_state(dpp::snowflake guild_id,
                        dpp::snowflake channel_id,
                        const std::string& session_id);

    void on_voice_server(dpp::snowflake guild_id,
                         const std::string& token,
                         const std::string& endpoint);

    std::optional<lavalink::voice_session> session(dpp::snowflake guild_id) const;

    // Voice channel the bot sits in, 0 when none.
    dpp::snowflake channel(dpp::snowflake guild_id) const;

    void forget(dpp::snowflake guild_id);

private:
    struct entry {
        dpp::snowflake channel_id;
        std::string    session_id;
        std::string    token;
        std::string    endpoint;
        std::optional<lavalink::voice_session> last_sent;
    };

    std::optional<lavalink::voice_session> complete_locked(dpp::snowflake guild_id, entry& e);

    session_handler    m_on_session;
    disconnect_handler m_on_disconnect;
    logger             m_log;

    mutable std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, entry> m_entries;
};

} // namespace cad::gateway
