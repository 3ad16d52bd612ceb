#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// (price, size); bids best-first (descending), asks best-first (ascending),
// reproduced exactly as the exchange sent them.
using PriceLevel = std::pair<double, double>;

enum class OrderBookMessageType : std::uint8_t
{
    Snapshot = 1, // REST only
    Diff = 2,     // stream only
};

struct OrderBookMessage
{
    OrderBookMessageType type{OrderBookMessageType::Diff};
    std::string trading_pair; // canonical "BTC-USDT"
    std::uint64_t update_id{0}; // from NonceSequencer, strictly increasing
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    double timestamp{0}; // seconds since epoch, fractional
};

// Numeric tags shared with the rest of the trading stack.
enum class TradeType : std::uint8_t
{
    Buy = 1,
    Sell = 2,
};

struct TradeEvent
{
    std::string trading_pair;
    std::string trade_id;
    TradeType trade_type{TradeType::Buy};
    double amount{0};
    double price{0};
    double timestamp{0}; // seconds
};

struct FundingInfo
{
    std::string trading_pair;
    double index_price{0};
    double mark_price{0};
    std::int64_t next_funding_utc_timestamp{0}; // epoch seconds
    double rate{0};
};

// Partial funding change from the stream. Unset means "unchanged",
// never zero.
struct FundingInfoUpdate
{
    std::string trading_pair;
    std::optional<double> index_price;
    std::optional<double> mark_price;
    std::optional<std::int64_t> next_funding_utc_timestamp;
    std::optional<double> rate;
};
