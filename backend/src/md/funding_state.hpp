#pragma once
#include <mutex>
#include <optional>
#include <string>

#include "perp_events.hpp"

// Latest funding picture for one pair: seeded from a full REST FundingInfo,
// then patched by sparse stream updates (unset fields keep their value).
class FundingState {
public:
    explicit FundingState(std::string trading_pair) : info_{std::move(trading_pair)} {}

    void apply(const FundingInfo& full) {
        std::lock_guard<std::mutex> lk(m_);
        if (full.trading_pair != info_.trading_pair) return;
        info_ = full;
        seeded_ = true;
    }

    void apply(const FundingInfoUpdate& u) {
        std::lock_guard<std::mutex> lk(m_);
        if (u.trading_pair != info_.trading_pair) return;
        if (u.index_price) info_.index_price = *u.index_price;
        if (u.mark_price) info_.mark_price = *u.mark_price;
        if (u.next_funding_utc_timestamp) info_.next_funding_utc_timestamp = *u.next_funding_utc_timestamp;
        if (u.rate) info_.rate = *u.rate;
    }

    FundingInfo current() const {
        std::lock_guard<std::mutex> lk(m_);
        return info_;
    }
    bool seeded() const {
        std::lock_guard<std::mutex> lk(m_);
        return seeded_;
    }

private:
    mutable std::mutex m_;
    FundingInfo info_;
    bool seeded_{false};
};
