#include "cad/core/errors.hpp"

namespace cad {

const char* to_string(status s)
{
    switch (s) {
        case status::ok:               return "ok";
        case status::queue_full:       return "queue full";
        case status::at_boundary:      return "at queue boundary";
        case status::not_active:       return "nothing is playing";
        case status::no_player:        return "no player for this guild";
        case status::destroyed:        return "player destroyed";
        case status::stalled:          return "player stalled";
        case status::node_unavailable: return "no audio node available";
        case status::no_matches:       return "no matches";
        case status::load_failed:      return "track load failed";
        case status::command_rejected: return "command rejected by node";
    }
    return "unknown";
}

rest_error::rest_error(kind k, std::uint32_t http_status, const std::string& message)
    : std::runtime_error(message)
    , m_kind(k)
    , m_http_status(http_status)
{
}

} // namespace cad
