#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <dpp/json.h>
#include <dpp/queues.h>
#include <dpp/snowflake.h>

#include "cad/core/config.hpp"
#include "cad/core/logging.hpp"
#include "cad/lavalink/types.hpp"

namespace dpp {
class cluster;
}

namespace cad::lavalink {

struct http_response {
    std::uint32_t status = 0;  // 0 when no response arrived
    std::string   body;
};

/// One blocking HTTP exchange. Must not be called from the thread that
/// completes the request.
class http_transport {
public:
    virtual ~http_transport() = default;

    virtual http_response request(dpp::http_method method,
                                  const std::string& url,
                                  const std::string& body,
                                  const dpp::http_headers& headers) = 0;
};

/// http_transport over dpp::cluster::request.
class dpp_http_transport : public http_transport {
public:
    explicit dpp_http_transport(dpp::cluster& cluster);

    http_response request(dpp::http_method method,
                          const std::string& url,
                          const std::string& body,
                          const dpp::http_headers& headers) override;

private:
    dpp::cluster& m_cluster;
};

/// REST side of a node: track resolution and one-shot player/session calls.
///
/// Network failures are retried with exponential backoff; HTTP errors throw
/// rest_error(server_rejected) on the first response.
class rest_client {
public:
    rest_client(http_transport& http,
                node_config cfg,
                dpp::snowflake user_id,
                std::string client_name,
                rest_policy policy,
                logger log);

    load_result load_tracks(const std::string& identifier) const;

    // PATCH {prefix}/sessions/{sid}/players/{guild}
    void update_player(const std::string& session_id,
                       dpp::snowflake guild_id,
                       const dpp::json& patch,
                       bool no_replace = false) const;

    // DELETE {prefix}/sessions/{sid}/players/{guild}
    void destroy_player(const std::string& session_id, dpp::snowflake guild_id) const;

    // PATCH {prefix}/sessions/{sid} {"resuming": true, "timeout": seconds}
    void configure_resuming(const std::string& session_id, std::chrono::seconds timeout) const;

    const std::string& base_url() const { return m_base_url; }

private:
    http_response call(dpp::http_method method,
                       const std::string& path,
                       const std::string& body = "") const;

    http_transport&  m_http;
    node_config      m_cfg;
    std::string      m_base_url;
    dpp::http_headers m_headers;
    rest_policy      m_policy;
    logger           m_log;
};

// Parses a /loadtracks body in either the v4 or the pre-v4 shape.
load_result parse_load_result(const dpp::json& j);

} // namespace cad::lavalink
