#pragma once
#include <simdjson.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/feed_config.hpp"
#include "md/nonce.hpp"
#include "md/perp_events.hpp"
#include "md/symbol_codec.hpp"
#include "pipeline/stream_lifecycle.hpp"
#include "rest/rest.hpp"
#include "util/cancellation.hpp"
#include "util/event_queue.hpp"
#include "venues/okx/classifier.hpp"
#include "venues/okx/normalizers.hpp"
#include "venues/okx/snapshot_fetcher.hpp"
#include "ws/ws.hpp"

// Public market data for OKX linear perpetuals: one websocket carrying
// trades, book diffs and funding deltas for every configured pair, plus the
// REST queries that seed a consumer (book snapshot, funding info, last price).
//
// Events land on three MPSC queues; each queue has exactly one consumer.
class OkxPerpetualDataSource {
public:
    OkxPerpetualDataSource(FeedConfig cfg,
                           IWsConnectionFactory& ws_factory,
                           IRestClient& rest,
                           const ISymbolCodec& symbols,
                           IScheduler& scheduler);
    ~OkxPerpetualDataSource();

    OkxPerpetualDataSource(const OkxPerpetualDataSource&) = delete;
    OkxPerpetualDataSource& operator=(const OkxPerpetualDataSource&) = delete;

    // Blocking. Returns (via OperationCancelled) only after stop() or an
    // external cancel of token().
    void listen_for_subscriptions();

    // Run listen_for_subscriptions() on an owned thread.
    void start();
    // Cancel, unblock the live connection and join. Idempotent.
    void stop();

    // classify -> normalize -> enqueue. Malformed payloads are logged and
    // dropped; never throws for message content.
    void process_message(const std::string& raw);

    OrderBookMessage fetch_order_book_snapshot(const std::string& trading_pair);
    FundingInfo fetch_funding_info(const std::string& trading_pair);
    std::unordered_map<std::string, double> fetch_last_traded_prices(const std::vector<std::string>& trading_pairs);

    const std::vector<std::string>& trading_pairs() const noexcept { return cfg_.trading_pairs; }

    EventQueue<TradeEvent>& trade_events() noexcept { return trades_; }
    EventQueue<OrderBookMessage>& diff_events() noexcept { return diffs_; }
    EventQueue<FundingInfoUpdate>& funding_events() noexcept { return funding_; }

    StreamState stream_state() const noexcept { return lifecycle_.state(); }
    CancellationToken& token() noexcept { return token_; }

private:
    void subscribe(IWsConnection& ws);

    FeedConfig cfg_;
    const ISymbolCodec& symbols_;
    IScheduler& scheduler_;

    NonceSequencer nonce_;
    EventQueue<TradeEvent> trades_;
    EventQueue<OrderBookMessage> diffs_;
    EventQueue<FundingInfoUpdate> funding_;

    OkxSnapshotFetcher fetcher_;
    OkxChannelClassifier classifier_;
    OkxDiffNormalizer diff_normalizer_;
    OkxTradeNormalizer trade_normalizer_;
    OkxFundingNormalizer funding_normalizer_;

    // Only the stream thread (or a test calling process_message) parses.
    simdjson::dom::parser parser_;

    CancellationToken token_;
    StreamLifecycle lifecycle_;

    std::mutex thread_m_; // protects worker_
    std::thread worker_;
};
