#include <gtest/gtest.h>

#include "md/funding_state.hpp"

TEST(FundingState, SparseUpdatesKeepUnsetFields) {
    FundingState s("BTC-USDT");
    EXPECT_FALSE(s.seeded());
    s.apply(FundingInfo{"BTC-USDT", 100.0, 101.0, 2000, 0.0001});
    EXPECT_TRUE(s.seeded());

    FundingInfoUpdate u;
    u.trading_pair = "BTC-USDT";
    u.mark_price = 102.5;
    s.apply(u);

    const FundingInfo f = s.current();
    EXPECT_DOUBLE_EQ(f.index_price, 100.0);
    EXPECT_DOUBLE_EQ(f.mark_price, 102.5);
    EXPECT_EQ(f.next_funding_utc_timestamp, 2000);
    EXPECT_DOUBLE_EQ(f.rate, 0.0001);
}

TEST(FundingState, ZeroIsAValueNotAbsence) {
    FundingState s("BTC-USDT");
    s.apply(FundingInfo{"BTC-USDT", 100.0, 101.0, 2000, 0.0001});
    FundingInfoUpdate u;
    u.trading_pair = "BTC-USDT";
    u.rate = 0.0;
    s.apply(u);
    EXPECT_DOUBLE_EQ(s.current().rate, 0.0);
    EXPECT_DOUBLE_EQ(s.current().mark_price, 101.0);
}

TEST(FundingState, OtherPairIgnored) {
    FundingState s("BTC-USDT");
    FundingInfoUpdate u;
    u.trading_pair = "ETH-USDT";
    u.index_price = 5.0;
    s.apply(u);
    s.apply(FundingInfo{"ETH-USDT", 1, 1, 1, 1});
    EXPECT_FALSE(s.seeded());
    EXPECT_DOUBLE_EQ(s.current().index_price, 0.0);
}
