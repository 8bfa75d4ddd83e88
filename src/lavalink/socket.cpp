#include "cad/lavalink/socket.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>
#include <type_traits>

namespace cad::lavalink {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;

namespace {

constexpr std::uint16_t abnormal_closure = 1006;

class session {
public:
    virtual ~session() = default;
    virtual void start() = 0;
    virtual void write(std::string text) = 0;
    virtual void shutdown() = 0;

    bool is_open() const { return m_open.load(); }

protected:
    std::atomic<bool> m_open{false};
};

// Everything below runs on the session's io_context thread.
template <bool Secure>
class ws_session : public session, public std::enable_shared_from_this<ws_session<Secure>> {
    using lower_layer = std::conditional_t<Secure, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
    using ws_stream   = websocket::stream<lower_layer>;

public:
    ws_session(net::io_context& ioc, ssl::context& ctx, socket_request req,
               socket_transport::handlers h, logger log)
        : m_resolver(ioc)
        , m_ws(make_stream(ioc, ctx))
        , m_req(std::move(req))
        , m_handlers(std::move(h))
        , m_log(std::move(log))
    {
    }

    void start() override
    {
        m_resolver.async_resolve(
            m_req.host, std::to_string(m_req.port),
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

    void write(std::string text) override
    {
        net::post(m_ws.get_executor(), [self = this->shared_from_this(), text = std::move(text)]() mutable {
            if (!self->m_open) {
                return;
            }
            self->m_queue.push_back(std::move(text));
            if (self->m_queue.size() > 1) {
                return; // write in progress
            }
            self->do_write();
        });
    }

    void shutdown() override
    {
        net::post(m_ws.get_executor(), [self = this->shared_from_this()] {
            if (self->m_finished || self->m_closing) {
                return;
            }
            self->m_closing = true;
            if (!self->m_open) {
                // still resolving, connecting or handshaking
                self->m_resolver.cancel();
                beast::error_code ignored;
                beast::get_lowest_layer(self->m_ws).socket().close(ignored);
                return;
            }
            self->m_ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
                if (ec) {
                    beast::error_code ignored;
                    beast::get_lowest_layer(self->m_ws).socket().close(ignored);
                }
            });
        });
    }

private:
    static ws_stream make_stream(net::io_context& ioc, ssl::context& ctx)
    {
        if constexpr (Secure) {
            return ws_stream(ioc, ctx);
        } else {
            (void)ctx;
            return ws_stream(ioc);
        }
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (ec) {
            return finish(abnormal_closure, "resolve: " + ec.message());
        }
        beast::get_lowest_layer(m_ws).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(m_ws).async_connect(
            results,
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec)
    {
        if (ec) {
            return finish(abnormal_closure, "connect: " + ec.message());
        }

        if constexpr (Secure) {
            auto& tls = m_ws.next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), m_req.host.c_str())) {
                beast::error_code sni(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                return finish(abnormal_closure, "SNI: " + sni.message());
            }
            tls.set_verify_callback(ssl::host_name_verification(m_req.host));
            tls.async_handshake(ssl::stream_base::client,
                                [self = this->shared_from_this()](beast::error_code ec) {
                                    if (ec) {
                                        return self->finish(abnormal_closure, "TLS handshake: " + ec.message());
                                    }
                                    self->do_handshake();
                                });
        } else {
            do_handshake();
        }
    }

    void do_handshake()
    {
        beast::get_lowest_layer(m_ws).expires_never();
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        const auto headers = m_req.headers;
        m_ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& req) {
            req.set(http::field::user_agent, "cadence");
            for (const auto& [name, value] : headers) {
                req.set(name, value);
            }
        }));

        const std::string host = m_req.host + ":" + std::to_string(m_req.port);
        m_ws.async_handshake(m_response, host, m_req.path,
                             [self = this->shared_from_this()](beast::error_code ec) {
                                 self->on_handshake(ec);
                             });
    }

    void on_handshake(beast::error_code ec)
    {
        if (ec) {
            std::ostringstream oss;
            oss << "handshake: " << ec.message();
            if (m_response.result_int() != 0) {
                oss << " (HTTP " << m_response.result_int() << ")";
            }
            return finish(abnormal_closure, oss.str());
        }
        if (m_closing) {
            // shutdown() raced with the handshake
            return finish(websocket::close_code::normal, "closed");
        }

        m_open = true;
        if (m_handlers.on_open) {
            m_handlers.on_open();
        }
        do_read();
    }

    void do_read()
    {
        m_ws.async_read(m_buffer, [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(beast::error_code ec)
    {
        if (ec) {
            if (ec == websocket::error::closed) {
                const auto& why = m_ws.reason();
                return finish(static_cast<std::uint16_t>(why.code), std::string(why.reason.c_str()));
            }
            return finish(abnormal_closure, ec.message());
        }

        std::string text = beast::buffers_to_string(m_buffer.data());
        m_buffer.consume(m_buffer.size());
        if (m_handlers.on_message) {
            m_handlers.on_message(text);
        }
        do_read();
    }

    void do_write()
    {
        m_ws.text(true);
        m_ws.async_write(net::buffer(m_queue.front()),
                         [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                             if (ec) {
                                 // the read side observes the failure and finishes
                                 self->m_log.log(dpp::ll_warning, "write failed: " + ec.message());
                                 self->m_queue.clear();
                                 beast::error_code ignored;
                                 beast::get_lowest_layer(self->m_ws).socket().close(ignored);
                                 return;
                             }
                             self->m_queue.pop_front();
                             if (!self->m_queue.empty()) {
                                 self->do_write();
                             }
                         });
    }

    void finish(std::uint16_t code, const std::string& reason)
    {
        if (m_finished) {
            return;
        }
        m_finished = true;
        m_open     = false;
        m_queue.clear();
        if (m_handlers.on_close) {
            m_handlers.on_close(code, reason);
        }
    }

    tcp::resolver                             m_resolver;
    ws_stream                                 m_ws;
    websocket::response_type                  m_response;
    beast::flat_buffer                        m_buffer;
    std::deque<std::string>                   m_queue;
    socket_request                            m_req;
    socket_transport::handlers                m_handlers;
    logger                                    m_log;
    bool                                      m_closing  = false;
    bool                                      m_finished = false;
};

void join_or_detach(std::thread& t)
{
    if (!t.joinable()) {
        return;
    }
    if (t.get_id() == std::this_thread::get_id()) {
        t.detach();
    } else {
        t.join();
    }
}

// One session and the io_context its I/O objects belong to. The session
// is declared last so it is destroyed before the io_context.
struct runner {
    net::io_context          ioc{1};
    std::shared_ptr<session> current;
};

} // namespace

struct beast_socket_transport::impl {
    explicit impl(logger l)
        : log(std::move(l))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(ssl::verify_peer);
    }

    struct retired {
        std::shared_ptr<runner> run;
        std::thread             thread;
    };

    // Starts teardown of the current session. The runner is handed back
    // with its thread so the io_context stays alive until the thread is
    // joined, even when the thread already returned from run().
    retired release()
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (active) {
            active->current->shutdown();
        }
        return retired{std::move(active), std::move(thread)};
    }

    static void finish(retired r)
    {
        join_or_detach(r.thread);
        r.run.reset();
    }

    logger                  log;
    ssl::context            ssl_ctx{ssl::context::tls_client};
    std::mutex              mutex;
    std::shared_ptr<runner> active;
    std::thread             thread;
};

beast_socket_transport::beast_socket_transport(logger log)
    : m_impl(std::make_unique<impl>(std::move(log)))
{
}

beast_socket_transport::~beast_socket_transport()
{
    impl::finish(m_impl->release());
}

void beast_socket_transport::open(const socket_request& request, handlers h)
{
    // Joined outside the lock: the old session's handlers may call send().
    impl::finish(m_impl->release());

    auto r = std::make_shared<runner>();
    if (request.secure) {
        r->current = std::make_shared<ws_session<true>>(r->ioc, m_impl->ssl_ctx, request, std::move(h), m_impl->log);
    } else {
        r->current = std::make_shared<ws_session<false>>(r->ioc, m_impl->ssl_ctx, request, std::move(h), m_impl->log);
    }
    r->current->start();

    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->active = r;

    // A detached thread keeps its own reference to the runner.
    m_impl->thread = std::thread([r, log = m_impl->log] {
        try {
            r->ioc.run();
        } catch (const std::exception& e) {
            log.log(dpp::ll_error, std::string("socket thread stopped: ") + e.what());
        }
    });
}

bool beast_socket_transport::send(const std::string& text)
{
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    if (!m_impl->active || !m_impl->active->current->is_open()) {
        return false;
    }
    m_impl->active->current->write(text);
    return true;
}

void beast_socket_transport::close()
{
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    if (m_impl->active) {
        m_impl->active->current->shutdown();
    }
}

} // namespace cad::lavalink
