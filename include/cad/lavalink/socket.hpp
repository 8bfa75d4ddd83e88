#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cad/core/logging.hpp"

namespace cad::lavalink {

struct socket_request {
    std::string   host;
    std::uint16_t port   = 0;
    bool          secure = false;
    std::string   path;
    std::vector<std::pair<std::string, std::string>> headers;
};

/// A WebSocket text channel to one node.
///
/// open() starts one session. Every open() is followed by exactly one
/// on_close, including when resolve, connect or the handshake fail. The
/// handlers may run on a transport-owned thread.
class socket_transport {
public:
    struct handlers {
        std::function<void()>                                     on_open;
        std::function<void(const std::string&)>                   on_message;
        std::function<void(std::uint16_t, const std::string&)>    on_close;
    };

    virtual ~socket_transport() = default;

    virtual void open(const socket_request& request, handlers h) = 0;

    // False when no session is open.
    virtual bool send(const std::string& text) = 0;

    // Starts teardown of the current session; on_close follows.
    virtual void close() = 0;
};

/// Boost.Beast client, ws:// or wss://. Runs one io_context thread per
/// session.
class beast_socket_transport : public socket_transport {
public:
    explicit beast_socket_transport(logger log = {});
    ~beast_socket_transport() override;

    beast_socket_transport(const beast_socket_transport&) = delete;
    beast_socket_transport& operator=(const beast_socket_transport&) = delete;

    void open(const socket_request& request, handlers h) override;
    bool send(const std::string& text) override;
    void close() override;

private:
    struct impl;
    std::unique_ptr<impl> m_impl;
};

} // namespace cad::lavalink
