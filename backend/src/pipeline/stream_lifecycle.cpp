#include "stream_lifecycle.hpp"
#include "md/errors.hpp"

#include <iostream>

const char* to_string(StreamState s) {
    switch (s) {
        case StreamState::Disconnected: return "disconnected";
        case StreamState::Connecting:   return "connecting";
        case StreamState::Subscribing:  return "subscribing";
        case StreamState::Streaming:    return "streaming";
        case StreamState::ErrorBackoff: return "error-backoff";
    }
    return "unknown";
}

namespace {

// Publishes the live connection for interrupt() and closes it on every exit
// path out of a session.
class ConnectionGuard {
public:
    ConnectionGuard(std::unique_ptr<IWsConnection> conn, std::mutex& m, IWsConnection*& slot)
        : conn_(std::move(conn)), m_(m), slot_(slot) {
        std::lock_guard<std::mutex> lk(m_);
        slot_ = conn_.get();
    }
    ~ConnectionGuard() {
        {
            std::lock_guard<std::mutex> lk(m_);
            slot_ = nullptr;
        }
        conn_->disconnect();
    }
    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    IWsConnection& operator*() const { return *conn_; }

private:
    std::unique_ptr<IWsConnection> conn_;
    std::mutex& m_;
    IWsConnection*& slot_;
};

} // namespace

StreamLifecycle::StreamLifecycle(Options opts,
                                 IWsConnectionFactory& factory,
                                 IScheduler& scheduler,
                                 CancellationToken& token,
                                 SubscribeFn subscribe,
                                 MessageFn on_message,
                                 StateFn on_state)
    : opts_(std::move(opts)),
      factory_(factory),
      scheduler_(scheduler),
      token_(token),
      subscribe_(std::move(subscribe)),
      on_message_(std::move(on_message)),
      on_state_(std::move(on_state)) {}

void StreamLifecycle::set_state(StreamState s) {
    state_.store(s, std::memory_order_release);
    if (on_state_) on_state_(s);
}

void StreamLifecycle::session() {
    set_state(StreamState::Connecting);
    ConnectionGuard ws(factory_.create(), conn_m_, current_);
    (*ws).connect(opts_.url, opts_.connect_timeout);
    token_.throw_if_cancelled();

    set_state(StreamState::Subscribing);
    subscribe_(*ws);

    set_state(StreamState::Streaming);
    for (;;) {
        token_.throw_if_cancelled();
        std::string frame;
        try {
            frame = (*ws).receive(opts_.message_timeout);
        } catch (const IdleTimeout&) {
            token_.throw_if_cancelled();
            (*ws).send(opts_.ping_payload);
            continue;
        }
        on_message_(frame);
    }
}

void StreamLifecycle::run() {
    try {
        for (;;) {
            token_.throw_if_cancelled();
            try {
                session();
            } catch (const std::exception& e) {
                // interrupt() surfaces as a transport error; report it as what it is
                token_.throw_if_cancelled();
                set_state(StreamState::ErrorBackoff);
                std::cerr << "[okx-stream] Unexpected error occurred when listening to order book streams "
                          << opts_.url << ": " << e.what() << ". Retrying in "
                          << std::chrono::duration_cast<std::chrono::seconds>(opts_.retry_delay).count()
                          << " seconds...\n";
                scheduler_.sleep_for(opts_.retry_delay, token_);
                set_state(StreamState::Disconnected);
            }
        }
    } catch (const OperationCancelled&) {
        set_state(StreamState::Disconnected);
        throw;
    }
}

void StreamLifecycle::interrupt() noexcept {
    std::lock_guard<std::mutex> lk(conn_m_);
    if (current_) current_->interrupt();
}
