#pragma once
#include <chrono>
#include <memory>
#include <string>

// Request/response view of one websocket connection, as used by the stream
// lifecycle. Every call runs on the lifecycle thread except interrupt().
struct IWsConnection
{
    virtual ~IWsConnection() = default;
    // TCP + TLS + websocket handshake. Throws TransportError.
    virtual void connect(const std::string &url, std::chrono::milliseconds timeout) = 0;
    // One text frame. Throws TransportError.
    virtual void send(const std::string &text) = 0;
    // Next text frame. Throws IdleTimeout if nothing arrived in time (the
    // connection stays usable) or TransportError if it broke.
    virtual std::string receive(std::chrono::milliseconds timeout) = 0;
    // Close and release the socket. Safe to call more than once.
    virtual void disconnect() noexcept = 0;
    // Any thread: make a blocked receive() fail promptly.
    virtual void interrupt() noexcept = 0;
};

struct IWsConnectionFactory
{
    virtual ~IWsConnectionFactory() = default;
    virtual std::unique_ptr<IWsConnection> create() = 0;
};

// "wss://ws.okx.com:8443/ws/v5/public" -> {wss, ws.okx.com, 8443, /ws/v5/public}
struct WsUrl
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};
// Throws std::invalid_argument for anything but ws:// or wss:// URLs.
WsUrl parse_ws_url(const std::string &url);

// NOTE: Boost headers stay behind a pointer to implementation (PIMPL).
class BeastWsConnection : public IWsConnection
{
public:
    BeastWsConnection();
    ~BeastWsConnection() override;
    // Non-copyable, non-movable (interrupt() may hold a pointer to it)
    BeastWsConnection(const BeastWsConnection &) = delete;
    BeastWsConnection &operator=(const BeastWsConnection &) = delete;

    void connect(const std::string &url, std::chrono::milliseconds timeout) override;
    void send(const std::string &text) override;
    std::string receive(std::chrono::milliseconds timeout) override;
    void disconnect() noexcept override;
    void interrupt() noexcept override;

private:
    struct Impl;
    Impl *impl_;
};

class BeastWsConnectionFactory final : public IWsConnectionFactory
{
public:
    std::unique_ptr<IWsConnection> create() override
    {
        return std::make_unique<BeastWsConnection>();
    }
};
