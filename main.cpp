#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

#include "config/env.hpp"
#include "config/feed_config.hpp"
#include "md/book.hpp"
#include "md/funding_state.hpp"
#include "md/symbol_codec.hpp"
#include "rest/rest.hpp"
#include "util/cancellation.hpp"
#include "venues/okx/data_source.hpp"
#include "ws/ws.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

int main() {
    load_env_file();

    FeedConfig cfg;
    try {
        cfg = load_feed_config();
    } catch (const std::exception& e) {
        std::cerr << "[setup] bad configuration: " << e.what() << std::endl;
        return 2;
    }
    if (cfg.trading_pairs.empty()) {
        std::cerr << "[setup] OKX_PAIRS names no trading pairs" << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    OkxSymbolCodec symbols(cfg.trading_pairs);
    CurlRestClient rest(cfg.credentials, cfg.rest_timeout);
    BeastWsConnectionFactory ws_factory;
    SteadyScheduler scheduler;

    OkxPerpetualDataSource source(cfg, ws_factory, rest, symbols, scheduler);

    std::unordered_map<std::string, std::unique_ptr<Book>> books;
    std::unordered_map<std::string, std::unique_ptr<FundingState>> funding;
    for (const auto& pair : cfg.trading_pairs) {
        books.emplace(pair, std::make_unique<Book>(pair));
        funding.emplace(pair, std::make_unique<FundingState>(pair));
    }

    // Start streaming first so diffs published while the snapshots are in
    // flight are already queued; the book skips the ones the snapshot covers.
    source.start();

    for (const auto& pair : cfg.trading_pairs) {
        try {
            books[pair]->apply(source.fetch_order_book_snapshot(pair));
            funding[pair]->apply(source.fetch_funding_info(pair));
        } catch (const std::exception& e) {
            std::cerr << "[setup] " << pair << " seeding failed: " << e.what() << std::endl;
        }
    }
    try {
        for (const auto& [pair, px] : source.fetch_last_traded_prices(cfg.trading_pairs)) {
            std::cout << "[setup] " << pair << " last traded " << px << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[setup] last traded prices unavailable: " << e.what() << std::endl;
    }

    const auto started = std::chrono::steady_clock::now();
    auto next_print = started;
    std::unordered_map<std::string, std::size_t> trade_counts;

    while (!g_stop.load(std::memory_order_relaxed)) {
        if (cfg.run_time.count() > 0 && std::chrono::steady_clock::now() - started >= cfg.run_time) break;

        bool idle = true;
        OrderBookMessage diff;
        while (source.diff_events().try_pop(diff)) {
            idle = false;
            auto it = books.find(diff.trading_pair);
            if (it != books.end()) it->second->apply(diff);
        }
        TradeEvent trade;
        while (source.trade_events().try_pop(trade)) {
            idle = false;
            ++trade_counts[trade.trading_pair];
        }
        FundingInfoUpdate upd;
        while (source.funding_events().try_pop(upd)) {
            idle = false;
            auto it = funding.find(upd.trading_pair);
            if (it != funding.end()) it->second->apply(upd);
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= next_print) {
            next_print = now + std::chrono::seconds(1);
            for (const auto& pair : cfg.trading_pairs) {
                const auto bb = books[pair]->best_bid();
                const auto ba = books[pair]->best_ask();
                const FundingInfo f = funding[pair]->current();
                std::printf("[feed] %-10s %-13s bid %.8g x %.6g | ask %.8g x %.6g | mark %.8g idx %.8g rate %.6g | trades %zu\n",
                            pair.c_str(), to_string(source.stream_state()),
                            bb ? bb->first : 0.0, bb ? bb->second : 0.0,
                            ba ? ba->first : 0.0, ba ? ba->second : 0.0,
                            f.mark_price, f.index_price, f.rate, trade_counts[pair]);
            }
            std::fflush(stdout);
        }

        if (idle) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::cout << "[feed] shutting down" << std::endl;
    source.stop();
    return 0;
}
