#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "perp_events.hpp"

// Full-depth book for one trading pair, built from a REST snapshot plus
// stream diffs.
// - Snapshot replaces both sides and sets the update-id watermark.
// - Diff sizes are absolute at their price (0 => erase).
// - Diffs at or below the watermark, or before any snapshot, are stale.
// - Uses shared_mutex for concurrent reads.
class Book {
public:
    explicit Book(std::string trading_pair) : trading_pair_(std::move(trading_pair)) {}

    // Returns false if the message was for another pair or was stale.
    bool apply(const OrderBookMessage& msg) {
        if (msg.trading_pair != trading_pair_) return false;
        std::unique_lock lk(m_);
        if (msg.type == OrderBookMessageType::Snapshot) {
            bids_.clear();
            asks_.clear();
            apply_levels(bids_, msg.bids);
            apply_levels(asks_, msg.asks);
            last_update_id_ = msg.update_id;
            has_snapshot_ = true;
            return true;
        }
        if (!has_snapshot_ || msg.update_id <= last_update_id_) return false;
        apply_levels(bids_, msg.bids);
        apply_levels(asks_, msg.asks);
        last_update_id_ = msg.update_id;
        return true;
    }

    // Read API
    std::vector<PriceLevel> top_bids(std::size_t n) const {
        std::shared_lock lk(m_);
        return take_first_n(bids_, n);
    }
    std::vector<PriceLevel> top_asks(std::size_t n) const {
        std::shared_lock lk(m_);
        return take_first_n(asks_, n);
    }
    std::optional<PriceLevel> best_bid() const {
        std::shared_lock lk(m_);
        if (bids_.empty()) return std::nullopt;
        return PriceLevel{bids_.begin()->first, bids_.begin()->second};
    }
    std::optional<PriceLevel> best_ask() const {
        std::shared_lock lk(m_);
        if (asks_.empty()) return std::nullopt;
        return PriceLevel{asks_.begin()->first, asks_.begin()->second};
    }

    std::size_t bid_levels() const { std::shared_lock lk(m_); return bids_.size(); }
    std::size_t ask_levels() const { std::shared_lock lk(m_); return asks_.size(); }
    std::uint64_t last_update_id() const { std::shared_lock lk(m_); return last_update_id_; }
    bool ready() const { std::shared_lock lk(m_); return has_snapshot_; }

    const std::string& trading_pair() const noexcept { return trading_pair_; }

private:
    using BidMap = std::map<double, double, std::greater<double>>; // best-first
    using AskMap = std::map<double, double, std::less<double>>;    // best-first

    template <class OrderedMap>
    static void apply_levels(OrderedMap& side, const std::vector<PriceLevel>& levels) {
        for (const auto& [px, sz] : levels) {
            if (sz == 0.0) side.erase(px);
            else           side[px] = sz;
        }
    }

    template <class OrderedMap>
    static std::vector<PriceLevel> take_first_n(const OrderedMap& m, std::size_t n) {
        std::vector<PriceLevel> out;
        out.reserve(std::min(n, m.size()));
        for (const auto& [px, sz] : m) {
            if (out.size() >= n) break;
            out.emplace_back(px, sz);
        }
        return out;
    }

    std::string trading_pair_;

    mutable std::shared_mutex m_;
    BidMap bids_;
    AskMap asks_;
    std::uint64_t last_update_id_{0};
    bool has_snapshot_{false};
};
