#include "ws.hpp"
#include "md/errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

static constexpr std::chrono::seconds kSendTimeout{10};
static constexpr std::chrono::seconds kCloseTimeout{2};

WsUrl parse_ws_url(const std::string &url)
{
    WsUrl u;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("websocket url without scheme: " + url);
    u.scheme = url.substr(0, scheme_end);
    if (u.scheme != "wss" && u.scheme != "ws")
        throw std::invalid_argument("unsupported websocket scheme: " + u.scheme);

    auto rest = url.substr(scheme_end + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    u.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        u.host = authority.substr(0, colon);
        u.port = authority.substr(colon + 1);
    } else {
        u.host = authority;
        u.port = (u.scheme == "wss") ? "443" : "80";
    }
    if (u.host.empty() || u.port.empty())
        throw std::invalid_argument("websocket url without host/port: " + url);
    return u;
}

struct BeastWsConnection::Impl
{
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tlsv12_client};
    std::unique_ptr<Stream> ws;

    // A read started by receive() survives an idle timeout and is picked up
    // again by the next receive().
    beast::flat_buffer buffer;
    bool read_pending{false};
    bool read_done{false};
    beast::error_code read_ec;

    std::atomic<bool> interrupted{false};

    Impl()
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    // Run handlers until `done` flips or the deadline passes.
    bool run_until(const bool &done, Clock::time_point deadline)
    {
        ioc.restart();
        while (!done) {
            const auto now = Clock::now();
            if (now >= deadline) return false;
            if (ioc.run_one_for(deadline - now) == 0 && ioc.stopped())
                return done; // no outstanding work left
        }
        return true;
    }

    // Abort everything in flight and let the aborted handlers run, since they
    // reference locals of the caller.
    void abort_and_drain() noexcept
    {
        beast::error_code ec;
        if (ws) beast::get_lowest_layer(*ws).socket().close(ec);
        try {
            ioc.restart();
            ioc.run();
        } catch (const std::exception &e) {
            std::cerr << "[okx-ws] drain error: " << e.what() << "\n";
        }
        read_pending = false;
    }

    void connect(const std::string &url, std::chrono::milliseconds timeout)
    {
        if (ws) disconnect();
        interrupted.store(false, std::memory_order_relaxed);
        const WsUrl u = parse_ws_url(url);
        if (u.scheme != "wss")
            throw TransportError("plain ws:// is not supported: " + url);

        const auto deadline = Clock::now() + timeout;
        ws = std::make_unique<Stream>(ioc, ssl_ctx);

        // DNS
        tcp::resolver resolver{ioc};
        tcp::resolver::results_type endpoints;
        {
            bool done = false;
            beast::error_code ec;
            resolver.async_resolve(u.host, u.port,
                [&](beast::error_code e, tcp::resolver::results_type r) {
                    ec = e;
                    endpoints = std::move(r);
                    done = true;
                });
            if (!run_until(done, deadline)) {
                resolver.cancel();
                abort_and_drain();
                throw TransportError("resolve timed out: " + u.host);
            }
            if (ec) throw TransportError("resolve " + u.host + ": " + ec.message());
        }

        // TCP connect
        run_step("tcp connect", deadline, [&](auto handler) {
            beast::get_lowest_layer(*ws).async_connect(endpoints,
                [handler](beast::error_code e, const tcp::endpoint &) { handler(e); });
        });

        // SNI (Server Name Indication)
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), u.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw TransportError("SNI set failed: " + ec.message());
        }
        ws->next_layer().set_verify_callback(net::ssl::host_name_verification(u.host));

        // TLS handshake
        run_step("tls handshake", deadline, [&](auto handler) {
            ws->next_layer().async_handshake(net::ssl::stream_base::client,
                [handler](beast::error_code e) { handler(e); });
        });

        // WS handshake
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
            req.set(http::field::user_agent, "okx-perp-md/0.1");
        }));
        const std::string host_header = u.host + ":" + u.port;
        run_step("ws handshake", deadline, [&](auto handler) {
            ws->async_handshake(host_header, u.target,
                [handler](beast::error_code e) { handler(e); });
        });
        ws->text(true);
    }

    template <class Start>
    void run_step(const char *what, Clock::time_point deadline, Start &&start)
    {
        bool done = false;
        beast::error_code ec;
        start([&done, &ec](beast::error_code e) {
            ec = e;
            done = true;
        });
        if (!run_until(done, deadline)) {
            abort_and_drain();
            throw TransportError(std::string(what) + " timed out");
        }
        if (ec) throw TransportError(std::string(what) + ": " + ec.message());
    }

    void send(const std::string &text)
    {
        if (!ws) throw TransportError("send on a closed websocket");
        run_step("send", Clock::now() + kSendTimeout, [&](auto handler) {
            ws->async_write(net::buffer(text),
                [handler](beast::error_code e, std::size_t) { handler(e); });
        });
    }

    std::string receive(std::chrono::milliseconds timeout)
    {
        if (!ws) throw TransportError("receive on a closed websocket");
        if (interrupted.load(std::memory_order_relaxed))
            throw TransportError("websocket interrupted");

        if (!read_pending) {
            buffer.clear();
            read_done = false;
            read_pending = true;
            ws->async_read(buffer, [this](beast::error_code e, std::size_t) {
                read_ec = e;
                read_done = true;
            });
        }
        if (!run_until(read_done, Clock::now() + timeout)) {
            // Deadline passed with the read still queued: leave it pending
            if (!ioc.stopped())
                throw IdleTimeout("no message within " + std::to_string(timeout.count()) + " ms");
            read_pending = false;
            throw TransportError("read abandoned");
        }
        read_pending = false;
        if (read_ec) {
            if (read_ec == websocket::error::closed)
                throw TransportError("websocket closed by peer");
            throw TransportError("read: " + read_ec.message());
        }
        return beast::buffers_to_string(buffer.cdata());
    }

    void disconnect() noexcept
    {
        if (!ws) return;
        if (!read_pending && !interrupted.load(std::memory_order_relaxed)) {
            // Best-effort close frame; errors here are expected on a broken link
            bool done = false;
            ws->async_close(websocket::close_code::normal,
                [&done](beast::error_code) { done = true; });
            try {
                run_until(done, Clock::now() + kCloseTimeout);
            } catch (const std::exception &e) {
                std::cerr << "[okx-ws] close error: " << e.what() << "\n";
            }
        }
        abort_and_drain();
        ws.reset();
    }

    void interrupt() noexcept
    {
        interrupted.store(true, std::memory_order_relaxed);
        // Post onto the connection's own io_context so the socket is only
        // touched from the thread running it.
        net::post(ioc, [this] {
            if (ws) {
                beast::error_code ec;
                beast::get_lowest_layer(*ws).socket().cancel(ec);
            }
        });
    }
};

BeastWsConnection::BeastWsConnection() : impl_(new Impl()) {}
BeastWsConnection::~BeastWsConnection()
{
    impl_->disconnect();
    delete impl_;
}

// The outer class methods just forward to the implementation
void BeastWsConnection::connect(const std::string &url, std::chrono::milliseconds timeout) { impl_->connect(url, timeout); }
void BeastWsConnection::send(const std::string &text) { impl_->send(text); }
std::string BeastWsConnection::receive(std::chrono::milliseconds timeout) { return impl_->receive(timeout); }
void BeastWsConnection::disconnect() noexcept { impl_->disconnect(); }
void BeastWsConnection::interrupt() noexcept { impl_->interrupt(); }
