#pragma once

#include <chrono>
#include <cstdint>

// OKX v5 public endpoints used by the perpetual market-data feed.
namespace okx {

inline constexpr const char* kRestBaseUrl = "https://www.okx.com/api/v5";
inline constexpr const char* kWsPublicUrl = "wss://ws.okx.com:8443/ws/v5/public";

// REST paths (also used as throttler limit ids)
inline constexpr const char* kOrderBookPath = "/market/books";
inline constexpr const char* kTickerPath = "/market/ticker";
inline constexpr const char* kIndexTickersPath = "/market/index-tickers";
inline constexpr const char* kMarkPricePath = "/public/mark-price";
inline constexpr const char* kFundingRatePath = "/public/funding-rate";

inline constexpr const char* kInstTypeSwap = "SWAP";
inline constexpr int kSnapshotDepth = 100;

// Stream channels
inline constexpr const char* kTradesChannel = "trades";
inline constexpr const char* kBooksChannel = "books";
inline constexpr const char* kInstrumentsChannel = "instruments";

// OKX drops a connection after 30 s of silence; probe before that.
inline constexpr std::chrono::seconds kMessageTimeout{20};
inline constexpr std::chrono::seconds kConnectTimeout{10};
inline constexpr std::chrono::seconds kRetryDelay{5};

// Epoch values at or above this are milliseconds, below it seconds.
inline constexpr std::int64_t kEpochMsCutoff = 100000000000LL;
// Latest wire timestamp accepted: 3000-01-01T00:00:00Z in milliseconds.
inline constexpr std::int64_t kMaxEpochMs = 32503680000000LL;

inline constexpr std::int64_t to_epoch_seconds(std::int64_t t) {
    return t >= kEpochMsCutoff ? t / 1000 : t;
}

inline constexpr const char* kPingPayload = "ping";
inline constexpr const char* kPongPayload = "pong";

} // namespace okx
