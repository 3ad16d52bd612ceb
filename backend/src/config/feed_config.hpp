#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "rest/rest.hpp"
#include "venues/okx/constants.hpp"

// All canonical pairs streamed by default.
inline const std::vector<std::string> kCanonicalPairs = {
    "BTC-USDT",
    "ETH-USDT",
    "SOL-USDT",
};

struct FeedConfig {
    std::vector<std::string> trading_pairs{kCanonicalPairs};

    std::string rest_base_url{okx::kRestBaseUrl};
    std::string ws_url{okx::kWsPublicUrl};

    std::chrono::milliseconds connect_timeout{okx::kConnectTimeout};
    std::chrono::milliseconds message_timeout{okx::kMessageTimeout};
    std::chrono::milliseconds retry_delay{okx::kRetryDelay};
    std::chrono::milliseconds rest_timeout{std::chrono::seconds(10)};
    // Gap between the trades / books / instruments subscribe requests.
    // 0 leaves pacing to the exchange-side allowance.
    std::chrono::milliseconds subscribe_pacing{0};

    int snapshot_depth{okx::kSnapshotDepth};

    // Feed program only: 0 runs until SIGINT/SIGTERM
    std::chrono::seconds run_time{0};

    ApiCredentials credentials;
};
