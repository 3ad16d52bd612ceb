#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "md/errors.hpp"

// One-shot cancellation flag shared between the owner of a worker and the
// worker itself. wait_for() doubles as an interruptible sleep.
class CancellationToken {
public:
    void cancel() noexcept {
        {
            std::lock_guard<std::mutex> lk(m_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    void throw_if_cancelled() const {
        if (is_cancelled()) throw OperationCancelled{};
    }

    // Returns true if the token was cancelled before the delay elapsed.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, d, [this] { return is_cancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex m_;
    std::condition_variable cv_;
};

// The only place the feed waits on wall-clock time between retries.
// Swapped for a recording fake in tests.
struct IScheduler {
    virtual ~IScheduler() = default;
    // Throws OperationCancelled if the token fires before or during the wait.
    virtual void sleep_for(std::chrono::milliseconds d, CancellationToken& token) = 0;
};

class SteadyScheduler final : public IScheduler {
public:
    void sleep_for(std::chrono::milliseconds d, CancellationToken& token) override {
        token.throw_if_cancelled();
        if (token.wait_for(d)) throw OperationCancelled{};
    }
};
