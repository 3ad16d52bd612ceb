#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "md/errors.hpp"
#include "rest/rest.hpp"
#include "util/cancellation.hpp"
#include "ws/ws.hpp"

// ---------- websocket ----------

// One scripted step returned by receive().
struct WsStep {
    enum Kind { Frame, Timeout, Fail } kind{Frame};
    std::string text;

    static WsStep frame(std::string t) { return {Frame, std::move(t)}; }
    static WsStep timeout() { return {Timeout, {}}; }
    static WsStep fail(std::string why = "connection reset") { return {Fail, std::move(why)}; }
};

struct WsScript {
    bool connect_fails{false};
    int fail_send_at{0}; // 1-based index of the send that throws; 0 = never
    std::deque<WsStep> steps;
};

// Everything the fake connections did, in order, across reconnects.
struct WsLog {
    std::mutex m;
    int connects{0};
    int disconnects{0};
    std::vector<std::vector<std::string>> sent; // per connection
    std::vector<std::string> events;            // "connect", "send:<text>", "disconnect"

    std::vector<std::string> all_sent() {
        std::lock_guard<std::mutex> lk(m);
        std::vector<std::string> out;
        for (auto& c : sent) out.insert(out.end(), c.begin(), c.end());
        return out;
    }
};

class ScriptedWsConnection : public IWsConnection {
public:
    ScriptedWsConnection(WsScript script, WsLog& log, CancellationToken& token, std::size_t index)
        : script_(std::move(script)), log_(log), token_(token), index_(index) {}

    void connect(const std::string&, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lk(log_.m);
        log_.connects++;
        log_.events.push_back("connect");
        if (script_.connect_fails) throw TransportError("connect refused");
    }
    void send(const std::string& text) override {
        std::lock_guard<std::mutex> lk(log_.m);
        if (++sends_ == script_.fail_send_at) throw TransportError("send failed");
        log_.sent[index_].push_back(text);
        log_.events.push_back("send:" + text);
    }
    std::string receive(std::chrono::milliseconds) override {
        if (script_.steps.empty()) {
            // End of the whole script: behave like stop() during a read.
            token_.cancel();
            throw TransportError("interrupted");
        }
        WsStep step = std::move(script_.steps.front());
        script_.steps.pop_front();
        switch (step.kind) {
            case WsStep::Timeout: throw IdleTimeout("no frame");
            case WsStep::Fail:    throw TransportError(step.text);
            case WsStep::Frame:   break;
        }
        return step.text;
    }
    void disconnect() noexcept override {
        std::lock_guard<std::mutex> lk(log_.m);
        log_.disconnects++;
        log_.events.push_back("disconnect");
    }
    void interrupt() noexcept override {}

private:
    WsScript script_;
    WsLog& log_;
    CancellationToken& token_;
    std::size_t index_;
    int sends_{0};
};

// Hands out one scripted connection per create(); once the scripts run out
// every further connection cancels the token on its first receive.
class ScriptedWsFactory : public IWsConnectionFactory {
public:
    ScriptedWsFactory(std::vector<WsScript> scripts, CancellationToken& token)
        : scripts_(std::move(scripts)), token_(&token) {}

    // Point end-of-script cancellation at another token (e.g. one owned by
    // the object under test).
    void bind_token(CancellationToken& token) { token_ = &token; }

    std::unique_ptr<IWsConnection> create() override {
        std::size_t index;
        {
            std::lock_guard<std::mutex> lk(log.m);
            index = log.sent.size();
            log.sent.emplace_back();
        }
        WsScript s = index < scripts_.size() ? scripts_[index] : WsScript{};
        return std::make_unique<ScriptedWsConnection>(std::move(s), log, *token_, index);
    }

    WsLog log;

private:
    std::vector<WsScript> scripts_;
    CancellationToken* token_;
};

// ---------- scheduler ----------

// Records requested delays instead of sleeping. Optionally cancels the token
// on the Nth sleep to end an otherwise endless retry loop.
class RecordingScheduler : public IScheduler {
public:
    void sleep_for(std::chrono::milliseconds d, CancellationToken& token) override {
        token.throw_if_cancelled();
        delays.push_back(d);
        if (cancel_on_sleep > 0 && static_cast<int>(delays.size()) >= cancel_on_sleep) {
            token.cancel();
            throw OperationCancelled{};
        }
        if (on_sleep) on_sleep();
    }

    std::vector<std::chrono::milliseconds> delays;
    int cancel_on_sleep{0};
    std::function<void()> on_sleep;
};

// ---------- REST ----------

// Canned bodies keyed by path suffix ("/market/books"). A missing key or a
// registered failure throws TransportError. With expect_concurrent = N, each
// call waits (up to one second) until N calls are in flight together.
class CannedRestClient : public IRestClient {
public:
    std::string execute(const RestRequest& req) override {
        std::unique_lock<std::mutex> lk(m_);
        requests.push_back(req);
        ++in_flight_;
        if (in_flight_ > max_in_flight) max_in_flight = in_flight_;
        cv_.notify_all();
        if (expect_concurrent > 0) {
            cv_.wait_for(lk, std::chrono::seconds(1), [this] { return max_in_flight >= expect_concurrent; });
        }
        --in_flight_;

        const std::string path = path_of(req.url);
        auto f = failures.find(path);
        if (f != failures.end()) throw TransportError(f->second);
        auto b = bodies.find(path);
        if (b == bodies.end()) throw TransportError("no canned body for " + path);
        return b->second;
    }

    std::vector<RestRequest> recorded() {
        std::lock_guard<std::mutex> lk(m_);
        return requests;
    }

    std::map<std::string, std::string> bodies;   // path -> body
    std::map<std::string, std::string> failures; // path -> error text
    int expect_concurrent{0};
    int max_in_flight{0};
    std::vector<RestRequest> requests;

private:
    static std::string path_of(const std::string& url) {
        auto pos = url.find("/api/v5");
        return pos == std::string::npos ? url : url.substr(pos + 7);
    }

    std::mutex m_;
    std::condition_variable cv_;
    int in_flight_{0};
};
