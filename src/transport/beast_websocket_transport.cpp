#include "noexpp/transport/beast_websocket_transport.hpp"
#include "noexpp/log/logger.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <atomic>
#include <deque>
#include <functional>
#include <thread>
#include <type_traits>

namespace noexpp {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Bridge: start on the Beast thread, finish on the client executor
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
using BridgeChannel = asio::experimental::channel<void(asio::error_code, T)>;

template <typename T, typename Start>
asio::awaitable<T> run_bridged(asio::any_io_executor executor, boost::asio::io_context& ioc, Start start) {
    auto channel = std::make_shared<BridgeChannel<T>>(executor, 1);

    std::function<void(T)> deliver = [channel](T value) {
        asio::post(channel->get_executor(), [channel, value = std::move(value)]() mutable {
            channel->try_send(asio::error_code{}, std::move(value));
        });
    };

    boost::asio::post(ioc, [start = std::move(start), deliver = std::move(deliver)]() mutable {
        start(std::move(deliver));
    });

    co_return co_await channel->async_receive(asio::use_awaitable);
}

// ─────────────────────────────────────────────────────────────────────────────
// Session: one Beast stream, touched only from the Beast thread
// ─────────────────────────────────────────────────────────────────────────────

struct Session : std::enable_shared_from_this<Session> {
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    using OpenDone = std::function<void(TransportResult<void>)>;
    using ReadDone = std::function<void(TransportResult<std::string>)>;

    struct PendingWrite {
        std::string text;
        OpenDone done;
    };

    Session(boost::asio::io_context& io, WebSocketTransportConfig cfg)
        : ioc(io)
        , config(std::move(cfg))
        , ssl_ctx(ssl::context::tls_client)
        , resolver(io)
    {}

    template <typename F>
    bool with_stream(F&& f) {
        if (tls) {
            f(*tls);
            return true;
        }
        if (plain) {
            f(*plain);
            return true;
        }
        return false;
    }

    // ── Open ────────────────────────────────────────────────────────────────

    void start_open(security::WebSocketEndpoint endpoint, OpenDone done) {
        if (endpoint.secure) {
            auto configured = configure_tls();
            if (!configured) {
                done(tl::unexpected(configured.error()));
                return;
            }
        }

        resolver.async_resolve(endpoint.host, endpoint.port,
            [self = shared_from_this(), endpoint, done = std::move(done)](
                beast::error_code ec, tcp::resolver::results_type results) mutable {
                if (ec) {
                    done(tl::unexpected(TransportError::network("Resolve " + endpoint.host + ": " + ec.message())));
                    return;
                }
                if (endpoint.secure) {
                    self->tls = std::make_unique<TlsStream>(self->ioc, self->ssl_ctx);
                    self->connect(*self->tls, results, std::move(endpoint), std::move(done));
                } else {
                    self->plain = std::make_unique<PlainStream>(self->ioc);
                    self->connect(*self->plain, results, std::move(endpoint), std::move(done));
                }
            });
    }

    TransportResult<void> configure_tls() {
        beast::error_code ec;
        if (config.verify_peer) {
            ssl_ctx.set_verify_mode(ssl::verify_peer, ec);
            if (!ec) {
                if (config.ca_cert_path.empty()) {
                    ssl_ctx.set_default_verify_paths(ec);
                } else {
                    ssl_ctx.load_verify_file(config.ca_cert_path, ec);
                }
            }
        } else {
            ssl_ctx.set_verify_mode(ssl::verify_none, ec);
        }
        if (ec) {
            return tl::unexpected(TransportError::network("TLS setup: " + ec.message()));
        }
        return {};
    }

    template <typename Stream>
    void connect(Stream& ws, const tcp::resolver::results_type& results,
                 security::WebSocketEndpoint endpoint, OpenDone done) {
        beast::get_lowest_layer(ws).expires_after(config.open_timeout);
        beast::get_lowest_layer(ws).async_connect(results,
            [self = shared_from_this(), &ws, endpoint = std::move(endpoint), done = std::move(done)](
                beast::error_code ec, tcp::resolver::results_type::endpoint_type) mutable {
                if (ec) {
                    done(tl::unexpected(TransportError::network("Connect " + endpoint.host_header() + ": " + ec.message())));
                    return;
                }
                if constexpr (std::is_same_v<Stream, TlsStream>) {
                    self->tls_handshake(ws, std::move(endpoint), std::move(done));
                } else {
                    self->upgrade(ws, std::move(endpoint), std::move(done));
                }
            });
    }

    void tls_handshake(TlsStream& ws, security::WebSocketEndpoint endpoint, OpenDone done) {
        // SNI, required by most virtual hosts
        if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint.host.c_str())) {
            done(tl::unexpected(TransportError::network("Failed to set TLS SNI host name")));
            return;
        }
        if (config.verify_peer) {
            ws.next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
        }

        ws.next_layer().async_handshake(ssl::stream_base::client,
            [self = shared_from_this(), &ws, endpoint = std::move(endpoint), done = std::move(done)](
                beast::error_code ec) mutable {
                if (ec) {
                    done(tl::unexpected(TransportError::network("TLS handshake: " + ec.message())));
                    return;
                }
                self->upgrade(ws, std::move(endpoint), std::move(done));
            });
    }

    template <typename Stream>
    void upgrade(Stream& ws, security::WebSocketEndpoint endpoint, OpenDone done) {
        // The websocket stream has its own timeouts from here on
        beast::get_lowest_layer(ws).expires_never();

        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(
            [user_agent = config.user_agent](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, user_agent);
            }));
        ws.read_message_max(config.max_message_size);
        ws.text(true);

        const auto host = endpoint.host_header();
        const auto target = endpoint.target;
        ws.async_handshake(host, target,
            [self = shared_from_this(), done = std::move(done)](beast::error_code ec) mutable {
                if (ec) {
                    done(tl::unexpected(TransportError::protocol("WebSocket upgrade: " + ec.message())));
                    return;
                }
                self->open.store(true, std::memory_order_release);
                done({});
            });
    }

    // ── Read ────────────────────────────────────────────────────────────────

    void start_read(ReadDone done) {
        const bool started = with_stream([&](auto& ws) {
            ws.async_read(buffer,
                [self = shared_from_this(), &ws, done](beast::error_code ec, std::size_t) mutable {
                    if (ec) {
                        self->open.store(false, std::memory_order_release);
                        done(tl::unexpected(self->read_error(ec, ws.reason())));
                        return;
                    }
                    std::string text = beast::buffers_to_string(self->buffer.data());
                    self->buffer.consume(self->buffer.size());
                    done(std::move(text));
                });
        });
        if (!started) {
            done(tl::unexpected(TransportError::closed(std::nullopt, "Transport is not open")));
        }
    }

    TransportError read_error(const beast::error_code& ec, const websocket::close_reason& reason) {
        if (ec == websocket::error::closed) {
            std::optional<int> code;
            if (reason.code != websocket::close_code::none) {
                code = static_cast<int>(reason.code);
            }
            return TransportError::closed(code, std::string(reason.reason.data(), reason.reason.size()));
        }
        if (ec == boost::asio::error::operation_aborted) {
            return TransportError::closed(std::nullopt, "Connection closed locally");
        }
        return TransportError::network(ec.message());
    }

    // ── Write ───────────────────────────────────────────────────────────────

    void start_write(std::string text, OpenDone done) {
        if (!open.load(std::memory_order_acquire)) {
            done(tl::unexpected(TransportError::closed(std::nullopt, "Transport is not open")));
            return;
        }
        writes.push_back(PendingWrite{std::move(text), std::move(done)});
        if (writes.size() == 1) {
            write_next();
        }
    }

    void write_next() {
        with_stream([&](auto& ws) {
            ws.async_write(boost::asio::buffer(writes.front().text),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    auto done = std::move(self->writes.front().done);
                    self->writes.pop_front();
                    if (ec) {
                        done(tl::unexpected(TransportError::network("Write: " + ec.message())));
                    } else {
                        done({});
                    }
                    if (!self->writes.empty()) {
                        self->write_next();
                    }
                });
        });
    }

    // ── Close ───────────────────────────────────────────────────────────────

    void start_close(std::string reason, std::function<void(bool)> done) {
        if (!open.exchange(false, std::memory_order_acq_rel)) {
            done(true);
            return;
        }
        const bool started = with_stream([&](auto& ws) {
            ws.async_close(websocket::close_reason(websocket::close_code::normal, reason),
                [self = shared_from_this(), done](beast::error_code ec) {
                    if (ec) {
                        NOEXPP_LOG_DEBUG("WebSocket close: " + ec.message());
                    }
                    done(true);
                });
        });
        if (!started) {
            done(true);
        }
    }

    boost::asio::io_context& ioc;
    WebSocketTransportConfig config;
    ssl::context ssl_ctx;
    tcp::resolver resolver;
    std::unique_ptr<PlainStream> plain;
    std::unique_ptr<TlsStream> tls;
    beast::flat_buffer buffer;
    std::deque<PendingWrite> writes;
    std::atomic<bool> open{false};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Runtime: the private Boost io_context and its thread
// ═══════════════════════════════════════════════════════════════════════════

struct BeastWebSocketTransport::Runtime {
    boost::asio::io_context ioc{1};
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work{ioc.get_executor()};
    std::shared_ptr<Session> session;
    std::thread thread;

    explicit Runtime(WebSocketTransportConfig config)
        : session(std::make_shared<Session>(ioc, std::move(config)))
    {
        thread = std::thread([this] { ioc.run(); });
    }

    ~Runtime() {
        work.reset();
        ioc.stop();
        if (thread.joinable()) {
            thread.join();
        }
        session.reset();
    }
};

BeastWebSocketTransport::BeastWebSocketTransport(asio::any_io_executor executor, WebSocketTransportConfig config)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , runtime_(std::make_unique<Runtime>(config_))
{}

BeastWebSocketTransport::~BeastWebSocketTransport() = default;

asio::awaitable<TransportResult<void>> BeastWebSocketTransport::async_open(
    const security::WebSocketEndpoint& endpoint
) {
    NOEXPP_LOG_DEBUG("Opening WebSocket to " + endpoint.normalized_url);
    co_return co_await run_bridged<TransportResult<void>>(executor_, runtime_->ioc,
        [session = runtime_->session, endpoint](std::function<void(TransportResult<void>)> done) {
            session->start_open(endpoint, std::move(done));
        });
}

asio::awaitable<TransportResult<void>> BeastWebSocketTransport::async_send(std::string text) {
    co_return co_await run_bridged<TransportResult<void>>(executor_, runtime_->ioc,
        [session = runtime_->session, text = std::move(text)](std::function<void(TransportResult<void>)> done) mutable {
            session->start_write(std::move(text), std::move(done));
        });
}

asio::awaitable<TransportResult<std::string>> BeastWebSocketTransport::async_receive() {
    co_return co_await run_bridged<TransportResult<std::string>>(executor_, runtime_->ioc,
        [session = runtime_->session](std::function<void(TransportResult<std::string>)> done) {
            session->start_read(std::move(done));
        });
}

asio::awaitable<void> BeastWebSocketTransport::async_close(std::string reason) {
    co_await run_bridged<bool>(executor_, runtime_->ioc,
        [session = runtime_->session, reason = std::move(reason)](std::function<void(bool)> done) mutable {
            session->start_close(std::move(reason), std::move(done));
        });
}

bool BeastWebSocketTransport::is_open() const {
    return runtime_->session->open.load(std::memory_order_acquire);
}

TransportFactory make_beast_transport_factory(WebSocketTransportConfig config) {
    return [config = std::move(config)](asio::any_io_executor executor) -> std::unique_ptr<IWebSocketTransport> {
        return std::make_unique<BeastWebSocketTransport>(std::move(executor), config);
    };
}

}  // namespace noexpp
