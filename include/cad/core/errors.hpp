#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cad {

/// Outcome of a player or manager command.
enum class status {
    ok,
    queue_full,
    at_boundary,
    not_active,
    no_player,
    destroyed,
    stalled,
    node_unavailable,
    no_matches,
    load_failed,
    command_rejected
};

const char* to_string(status s);

/// A REST call to a node failed. Network failures are retried by the REST
/// client before this is thrown; server rejections are thrown straight away.
class rest_error : public std::runtime_error {
public:
    enum class kind { network, server_rejected };

    rest_error(kind k, std::uint32_t http_status, const std::string& message);

    kind error_kind() const noexcept { return m_kind; }
    std::uint32_t http_status() const noexcept { return m_http_status; }
    bool retryable() const noexcept { return m_kind == kind::network; }

private:
    kind          m_kind;
    std::uint32_t m_http_status;
};

/// A frame from the node could not be decoded (wrong types, missing field).
class malformed_frame : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace cad
