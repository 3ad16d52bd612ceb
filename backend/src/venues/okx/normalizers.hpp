#pragma once
#include <simdjson.h>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "md/nonce.hpp"
#include "md/perp_events.hpp"
#include "md/symbol_codec.hpp"
#include "util/event_queue.hpp"

// Each normalizer turns one classified stream payload into canonical events
// and pushes them onto its queue. A payload is parsed completely before the
// first push, so a MalformedMessageError leaves the queue untouched.

// books channel, action "update" only (snapshots come from REST).
// One Diff per message, built from the first data record.
class OkxDiffNormalizer {
public:
    OkxDiffNormalizer(const ISymbolCodec& symbols, NonceSequencer& nonce, EventQueue<OrderBookMessage>& out)
        : symbols_(symbols), nonce_(nonce), out_(out) {}

    // Returns true if a Diff was enqueued.
    bool normalize(simdjson::dom::element msg);

private:
    const ISymbolCodec& symbols_;
    NonceSequencer& nonce_;
    EventQueue<OrderBookMessage>& out_;
};

// trades channel: one TradeEvent per entry of "data", in order.
class OkxTradeNormalizer {
public:
    OkxTradeNormalizer(const ISymbolCodec& symbols, EventQueue<TradeEvent>& out)
        : symbols_(symbols), out_(out) {}

    // Returns the number of trades enqueued.
    std::size_t normalize(simdjson::dom::element msg);

private:
    const ISymbolCodec& symbols_;
    EventQueue<TradeEvent>& out_;
};

// instruments channel, type "delta" only: one sparse FundingInfoUpdate per
// entry of data.update, with just the fields that entry carries.
class OkxFundingNormalizer {
public:
    OkxFundingNormalizer(const ISymbolCodec& symbols, EventQueue<FundingInfoUpdate>& out)
        : symbols_(symbols), out_(out) {}

    // Returns the number of updates enqueued.
    std::size_t normalize(simdjson::dom::element msg);

private:
    const ISymbolCodec& symbols_;
    EventQueue<FundingInfoUpdate>& out_;
};

// "2024-03-01T08:00:00Z", "2024-03-01 08:00:00.000+00:00" or epoch digits
// (seconds, or milliseconds when >= 1e11) -> UTC epoch seconds.
// Throws MalformedMessageError.
std::int64_t parse_utc_timestamp(std::string_view text);
