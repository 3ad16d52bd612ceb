#include "nonce.hpp"

#include <chrono>
#include <cmath>

static std::uint64_t now_us() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

std::uint64_t NonceSequencer::next(double timestamp_s) {
    const double us = timestamp_s * 1e6;
    if (!(timestamp_s > 0.0) || !(us <= static_cast<double>(kMaxTimestampUs))) return next();
    return next_us(static_cast<std::uint64_t>(std::llround(us)));
}

std::uint64_t NonceSequencer::next() { return next_us(now_us()); }

std::uint64_t NonceSequencer::next_us(std::uint64_t timestamp_us) {
    if (timestamp_us > kMaxTimestampUs) timestamp_us = now_us();
    std::uint64_t cur = last_.load(std::memory_order_relaxed);
    std::uint64_t candidate;
    do {
        candidate = timestamp_us > cur ? timestamp_us : cur + 1;
    } while (!last_.compare_exchange_weak(cur, candidate,
                                          std::memory_order_acq_rel,
                                          std::memory_order_relaxed));
    return candidate;
}
