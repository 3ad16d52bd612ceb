#include "data_source.hpp"
#include "md/errors.hpp"
#include "venues/okx/subscriptions.hpp"

#include <iostream>

OkxPerpetualDataSource::OkxPerpetualDataSource(FeedConfig cfg,
                                               IWsConnectionFactory& ws_factory,
                                               IRestClient& rest,
                                               const ISymbolCodec& symbols,
                                               IScheduler& scheduler)
    : cfg_(std::move(cfg)),
      symbols_(symbols),
      scheduler_(scheduler),
      fetcher_(rest, symbols, nonce_, cfg_.rest_base_url, cfg_.snapshot_depth),
      diff_normalizer_(symbols, nonce_, diffs_),
      trade_normalizer_(symbols, trades_),
      funding_normalizer_(symbols, funding_),
      lifecycle_(StreamLifecycle::Options{cfg_.ws_url,
                                          cfg_.connect_timeout,
                                          cfg_.message_timeout,
                                          cfg_.retry_delay,
                                          okx::kPingPayload},
                 ws_factory,
                 scheduler,
                 token_,
                 [this](IWsConnection& ws) { subscribe(ws); },
                 [this](const std::string& raw) { process_message(raw); }) {}

OkxPerpetualDataSource::~OkxPerpetualDataSource() {
    stop();
}

void OkxPerpetualDataSource::subscribe(IWsConnection& ws) {
    std::vector<std::string> native;
    native.reserve(cfg_.trading_pairs.size());
    for (const auto& pair : cfg_.trading_pairs)
        native.push_back(symbols_.to_native(pair));

    send_subscribe_batch(ws, build_subscribe_batch(native, classifier_.names()),
                         scheduler_, token_, cfg_.subscribe_pacing);
}

void OkxPerpetualDataSource::listen_for_subscriptions() {
    if (cfg_.subscribe_pacing.count() == 0) {
        std::cout << "[okx-stream] subscribe requests are sent back to back (no pacing)\n";
    }
    lifecycle_.run();
}

void OkxPerpetualDataSource::start() {
    std::lock_guard<std::mutex> lk(thread_m_);
    if (worker_.joinable()) return;
    worker_ = std::thread([this] {
        try {
            listen_for_subscriptions();
        } catch (const OperationCancelled&) {
            std::cout << "[okx-stream] stream stopped\n";
        }
    });
}

void OkxPerpetualDataSource::stop() {
    token_.cancel();
    lifecycle_.interrupt();
    std::lock_guard<std::mutex> lk(thread_m_);
    if (worker_.joinable()) worker_.join();
}

void OkxPerpetualDataSource::process_message(const std::string& raw) {
    if (raw == okx::kPongPayload) return;

    simdjson::dom::element doc;
    if (auto err = parser_.parse(raw).get(doc)) {
        std::cerr << "[okx-router] dropping non-JSON message (" << simdjson::error_message(err)
                  << "): " << raw.substr(0, 200) << "\n";
        return;
    }

    std::string_view event;
    if (!doc["event"].get(event) && event == "error") {
        std::cerr << "[okx-router] exchange reported an error: " << raw.substr(0, 200) << "\n";
        return;
    }

    const ChannelKind kind = classifier_.classify(doc);
    try {
        switch (kind) {
            case ChannelKind::Trade:   trade_normalizer_.normalize(doc); break;
            case ChannelKind::Diff:    diff_normalizer_.normalize(doc); break;
            case ChannelKind::Funding: funding_normalizer_.normalize(doc); break;
            case ChannelKind::Unrouted: break;
        }
    } catch (const MalformedMessageError& e) {
        std::cerr << "[okx-router] dropping malformed " << to_string(kind) << " message: "
                  << e.what() << "\n";
    }
}

OrderBookMessage OkxPerpetualDataSource::fetch_order_book_snapshot(const std::string& trading_pair) {
    return fetcher_.fetch_order_book_snapshot(trading_pair);
}

FundingInfo OkxPerpetualDataSource::fetch_funding_info(const std::string& trading_pair) {
    return fetcher_.fetch_funding_info(trading_pair);
}

std::unordered_map<std::string, double> OkxPerpetualDataSource::fetch_last_traded_prices(
    const std::vector<std::string>& trading_pairs) {
    return fetcher_.fetch_last_traded_prices(trading_pairs);
}
