#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "util/cancellation.hpp"
#include "ws/ws.hpp"

enum class StreamState {
    Disconnected,
    Connecting,
    Subscribing,
    Streaming,
    ErrorBackoff,
};

const char* to_string(StreamState s);

// Supervises the websocket for as long as the token is live:
// connect -> subscribe -> receive loop. A receive window with no frames is
// answered with a ping on the same connection; any other failure tears the
// connection down, waits retry_delay and starts over. Only cancellation
// ends run().
class StreamLifecycle {
public:
    struct Options {
        std::string url;
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
        std::chrono::milliseconds message_timeout{std::chrono::seconds(20)};
        std::chrono::milliseconds retry_delay{std::chrono::seconds(5)};
        std::string ping_payload{"ping"};
    };

    using SubscribeFn = std::function<void(IWsConnection&)>;
    using MessageFn = std::function<void(const std::string&)>;
    using StateFn = std::function<void(StreamState)>;

    StreamLifecycle(Options opts,
                    IWsConnectionFactory& factory,
                    IScheduler& scheduler,
                    CancellationToken& token,
                    SubscribeFn subscribe,
                    MessageFn on_message,
                    StateFn on_state = {});

    // Blocks until the token is cancelled, then throws OperationCancelled.
    // The connection is always closed on the way out.
    void run();

    // Any thread: unblock a pending receive so run() notices cancellation.
    void interrupt() noexcept;

    StreamState state() const noexcept { return state_.load(std::memory_order_acquire); }

private:
    void set_state(StreamState s);
    void session();

    Options opts_;
    IWsConnectionFactory& factory_;
    IScheduler& scheduler_;
    CancellationToken& token_;
    SubscribeFn subscribe_;
    MessageFn on_message_;
    StateFn on_state_;

    std::atomic<StreamState> state_{StreamState::Disconnected};
    std::mutex conn_m_; // protects current_
    IWsConnection* current_{nullptr};
};
