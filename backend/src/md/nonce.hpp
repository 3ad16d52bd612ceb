#pragma once
#include <atomic>
#include <cstdint>

// Strictly increasing update ids for book messages, derived from microsecond
// timestamps. When two calls land on the same (or an earlier) microsecond the
// id is bumped past the last one handed out, so bursts stay ordered.
// Safe to share between the stream loop and REST snapshot callers.
// Timestamps past kMaxTimestampUs are treated like missing ones ("now").
class NonceSequencer {
public:
    // 3000-01-01T00:00:00Z
    static constexpr std::uint64_t kMaxTimestampUs = 32503680000000000ull;

    // timestamp in seconds (fractional); <= 0 or too large means "now"
    std::uint64_t next(double timestamp_s);
    std::uint64_t next_us(std::uint64_t timestamp_us);
    std::uint64_t next();

    std::uint64_t last() const noexcept { return last_.load(std::memory_order_acquire); }

private:
    std::atomic<std::uint64_t> last_{0};
};
