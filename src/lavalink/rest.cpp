#include "cad/lavalink/rest.hpp"
#include "cad/core/errors.hpp"

#include <dpp/dpp.h>

#include <future>
#include <memory>
#include <sstream>
#include <thread>

namespace cad::lavalink {

using json = dpp::json;

namespace {

const char* method_name(dpp::http_method m)
{
    switch (m) {
        case dpp::m_get:    return "GET";
        case dpp::m_post:   return "POST";
        case dpp::m_put:    return "PUT";
        case dpp::m_patch:  return "PATCH";
        case dpp::m_delete: return "DELETE";
        default:            return "?";
    }
}

track parse_track(const json& item)
{
    track t;
    // v4 uses "encoded", older servers "track"
    if (item.contains("encoded") && item["encoded"].is_string()) {
        t.encoded = item["encoded"].get<std::string>();
    } else if (item.contains("track") && item["track"].is_string()) {
        t.encoded = item["track"].get<std::string>();
    }
    if (item.contains("info") && item["info"].is_object()) {
        const auto& info = item["info"];
        t.identifier  = info.value("identifier", "");
        t.title       = info.value("title", "");
        t.author      = info.value("author", "");
        t.uri         = info.value("uri", "");
        t.length_ms   = info.value("length", std::int64_t{0});
        t.is_stream   = info.value("isStream", false);
        t.is_seekable = info.value("isSeekable", true);
    }
    return t;
}

void parse_tracks(const json& arr, load_result& result)
{
    if (!arr.is_array()) {
        return;
    }
    for (const auto& item : arr) {
        track t = parse_track(item);
        if (!t.encoded.empty()) {
            result.tracks.push_back(std::move(t));
        }
    }
}

void parse_playlist_info(const json& info, load_result& result)
{
    if (!info.is_object()) {
        return;
    }
    result.playlist_name = info.value("name", "");
    const auto selected  = info.value("selectedTrack", -1);
    if (selected >= 0 && static_cast<std::size_t>(selected) < result.tracks.size()) {
        result.selected_index = static_cast<std::size_t>(selected);
    }
}

std::string exception_message(const json& ex)
{
    if (ex.is_object()) {
        return ex.value("message", "unknown error");
    }
    return "unknown error";
}

} // namespace

load_result parse_load_result(const json& j)
{
    load_result result;
    const std::string type = j.value("loadType", "");

    // v4
    if (type == "track") {
        result.type = load_type::track;
        if (j.contains("data") && j["data"].is_object()) {
            result.tracks.push_back(parse_track(j["data"]));
        }
    } else if (type == "playlist") {
        result.type = load_type::playlist;
        if (j.contains("data") && j["data"].is_object()) {
            const auto& data = j["data"];
            parse_tracks(data.value("tracks", json::array()), result);
            parse_playlist_info(data.value("info", json::object()), result);
        }
    } else if (type == "search") {
        result.type = load_type::search;
        parse_tracks(j.value("data", json::array()), result);
    } else if (type == "empty") {
        result.type = load_type::empty;
    } else if (type == "error") {
        result.type          = load_type::error;
        result.error_message = exception_message(j.value("data", json::object()));
    }
    // pre-v4
    else if (type == "TRACK_LOADED" || type == "SEARCH_RESULT") {
        result.type = type == "TRACK_LOADED" ? load_type::track : load_type::search;
        parse_tracks(j.value("tracks", json::array()), result);
    } else if (type == "PLAYLIST_LOADED") {
        result.type = load_type::playlist;
        parse_tracks(j.value("tracks", json::array()), result);
        parse_playlist_info(j.value("playlistInfo", json::object()), result);
    } else if (type == "NO_MATCHES") {
        result.type = load_type::empty;
    } else if (type == "LOAD_FAILED") {
        result.type          = load_type::error;
        result.error_message = exception_message(j.value("exception", json::object()));
    } else {
        result.type          = load_type::error;
        result.error_message = "unknown loadType '" + type + "'";
    }

    if ((result.type == load_type::track || result.type == load_type::search ||
         result.type == load_type::playlist) && result.tracks.empty()) {
        result.type = load_type::empty;
    }
    return result;
}

dpp_http_transport::dpp_http_transport(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

http_response dpp_http_transport::request(dpp::http_method method,
                                          const std::string& url,
                                          const std::string& body,
                                          const dpp::http_headers& headers)
{
    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_cluster.request(
        url,
        method,
        [prom](const dpp::http_request_completion_t& cc) {
            try {
                prom->set_value(cc);
            } catch (const std::future_error&) {
                // completion delivered twice
            }
        },
        body,
        body.empty() ? "" : "application/json",
        headers
    );

    http_response res;
    try {
        dpp::http_request_completion_t cc = fut.get();
        if (cc.error == dpp::h_success) {
            res.status = cc.status;
            res.body   = cc.body;
        }
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_warning,
                      std::string("HTTP: exception waiting for response: ") + e.what());
    }
    return res;
}

rest_client::rest_client(http_transport& http,
                         node_config cfg,
                         dpp::snowflake user_id,
                         std::string client_name,
                         rest_policy policy,
                         logger log)
    : m_http(http)
    , m_cfg(std::move(cfg))
    , m_policy(policy)
    , m_log(std::move(log))
{
    m_base_url = (m_cfg.secure ? "https://" : "http://")
               + m_cfg.host + ":" + std::to_string(m_cfg.port)
               + m_cfg.api_prefix;

    m_headers.emplace("Authorization", m_cfg.password);
    m_headers.emplace("User-Id", user_id.str());
    m_headers.emplace("Client-Name", client_name);
}

http_response rest_client::call(dpp::http_method method,
                                const std::string& path,
                                const std::string& body) const
{
    auto delay = m_policy.base_delay;

    for (std::uint32_t attempt = 1;; ++attempt) {
        {
            std::ostringstream oss;
            oss << "HTTP " << method_name(method) << " " << path
                << " (attempt " << attempt << ", body="
                << (body.empty() ? "empty" : std::to_string(body.size()) + " bytes") << ")";
            m_log.log(dpp::ll_debug, oss.str());
        }

        http_response res = m_http.request(method, m_base_url + path, body, m_headers);

        if (res.status == 0) {
            if (attempt >= m_policy.attempts) {
                std::ostringstream oss;
                oss << method_name(method) << " " << path << ": no response after "
                    << attempt << " attempt(s)";
                throw rest_error(rest_error::kind::network, 0, oss.str());
            }
            std::ostringstream oss;
            oss << "No response on " << method_name(method) << " " << path
                << ", retrying in " << delay.count() << "ms";
            m_log.log(dpp::ll_warning, oss.str());
            std::this_thread::sleep_for(delay);
            delay *= 2;
            continue;
        }

        if (res.status >= 400) {
            std::string message = "HTTP " + std::to_string(res.status);
            try {
                json err = json::parse(res.body);
                if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                    message += ": " + err["message"].get<std::string>();
                }
            } catch (const json::parse_error&) {
                if (!res.body.empty()) {
                    message += ": " + res.body;
                }
            }
            std::ostringstream oss;
            oss << method_name(method) << " " << path << " rejected: " << message;
            m_log.log(dpp::ll_warning, oss.str());
            throw rest_error(rest_error::kind::server_rejected, res.status, message);
        }

        return res;
    }
}

load_result rest_client::load_tracks(const std::string& identifier) const
{
    const std::string path = "/loadtracks?identifier=" + dpp::utility::url_encode(identifier);
    http_response res = call(dpp::m_get, path);

    load_result result;
    try {
        result = parse_load_result(json::parse(res.body));
    } catch (const json::exception& e) {
        result.type          = load_type::error;
        result.error_message = std::string("unparseable /loadtracks response: ") + e.what();
    }

    std::ostringstream oss;
    oss << "Loaded " << result.tracks.size()
        << " track(s) for identifier: " << identifier;
    m_log.log(dpp::ll_debug, oss.str());

    return result;
}

void rest_client::update_player(const std::string& session_id,
                                dpp::snowflake guild_id,
                                const json& patch,
                                bool no_replace) const
{
    std::string path = "/sessions/" + session_id + "/players/" + guild_id.str();
    if (no_replace) {
        path += "?noReplace=true";
    }
    call(dpp::m_patch, path, patch.dump());
}

void rest_client::destroy_player(const std::string& session_id, dpp::snowflake guild_id) const
{
    call(dpp::m_delete, "/sessions/" + session_id + "/players/" + guild_id.str());
}

void rest_client::configure_resuming(const std::string& session_id, std::chrono::seconds timeout) const
{
    json payload;
    payload["resuming"] = true;
    payload["timeout"]  = timeout.count();

    call(dpp::m_patch, "/sessions/" + session_id, payload.dump());

    m_log.log(dpp::ll_info,
              "Session '" + session_id + "' resumable for " + std::to_string(timeout.count()) + "s");
}

} // namespace cad::lavalink
