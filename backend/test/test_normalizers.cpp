#include <gtest/gtest.h>
#include <simdjson.h>

#include <vector>

#include "md/errors.hpp"
#include "md/symbol_codec.hpp"
#include "venues/okx/normalizers.hpp"

namespace {

class NormalizerTest : public ::testing::Test {
protected:
    simdjson::dom::element parse(const std::string& json) {
        simdjson::dom::element doc;
        auto err = parser_.parse(json).get(doc);
        EXPECT_FALSE(err) << simdjson::error_message(err);
        return doc;
    }

    template <class T>
    static std::vector<T> drain(EventQueue<T>& q) {
        std::vector<T> out;
        T v;
        while (q.try_pop(v)) out.push_back(std::move(v));
        return out;
    }

    OkxSymbolCodec symbols_{{"BTC-USDT", "ETH-USDT"}};
    NonceSequencer nonce_;
    EventQueue<OrderBookMessage> diffs_;
    EventQueue<TradeEvent> trades_;
    EventQueue<FundingInfoUpdate> funding_;

private:
    simdjson::dom::parser parser_;
};

} // namespace

// ---------- diffs ----------

TEST_F(NormalizerTest, DiffUpdateBecomesOneDiff) {
    OkxDiffNormalizer n(symbols_, nonce_, diffs_);
    EXPECT_TRUE(n.normalize(parse(R"({
        "arg":{"channel":"books","instId":"BTC-USDT-SWAP"},
        "action":"update",
        "data":[{"ts":"1700000000123",
                 "bids":[["42000.5","1.5","0","3"],["42000","0"]],
                 "asks":[["42001","2","0","1"]]}]})")));

    auto out = drain(diffs_);
    ASSERT_EQ(out.size(), 1u);
    const auto& d = out[0];
    EXPECT_EQ(d.type, OrderBookMessageType::Diff);
    EXPECT_EQ(d.trading_pair, "BTC-USDT");
    ASSERT_EQ(d.bids.size(), 2u);
    EXPECT_DOUBLE_EQ(d.bids[0].first, 42000.5);
    EXPECT_DOUBLE_EQ(d.bids[0].second, 1.5);
    EXPECT_DOUBLE_EQ(d.bids[1].second, 0.0);
    ASSERT_EQ(d.asks.size(), 1u);
    EXPECT_DOUBLE_EQ(d.asks[0].first, 42001.0);
    EXPECT_DOUBLE_EQ(d.timestamp, 1700000000.123);
    EXPECT_EQ(d.update_id, 1700000000123000u);
}

TEST_F(NormalizerTest, DiffIgnoresNonUpdateActions) {
    OkxDiffNormalizer n(symbols_, nonce_, diffs_);
    EXPECT_FALSE(n.normalize(parse(R"({"arg":{"instId":"BTC-USDT-SWAP"},"action":"snapshot",
        "data":[{"ts":"1","bids":[],"asks":[]}]})")));
    EXPECT_FALSE(n.normalize(parse(R"({"arg":{"instId":"BTC-USDT-SWAP"},
        "data":[{"ts":"1","bids":[],"asks":[]}]})")));
    EXPECT_TRUE(diffs_.empty());
}

TEST_F(NormalizerTest, DiffUsesOnlyFirstRecord) {
    OkxDiffNormalizer n(symbols_, nonce_, diffs_);
    n.normalize(parse(R"({"arg":{"instId":"ETH-USDT-SWAP"},"action":"update","data":[
        {"ts":"2000","bids":[["1","1"]],"asks":[]},
        {"ts":"3000","bids":[["2","2"]],"asks":[]}]})"));
    auto out = drain(diffs_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].trading_pair, "ETH-USDT");
    EXPECT_DOUBLE_EQ(out[0].bids[0].first, 1.0);
    EXPECT_DOUBLE_EQ(out[0].timestamp, 2.0);
}

TEST_F(NormalizerTest, DiffIdsIncreaseWithinSameMillisecond) {
    OkxDiffNormalizer n(symbols_, nonce_, diffs_);
    const std::string msg = R"({"arg":{"instId":"BTC-USDT-SWAP"},"action":"update",
        "data":[{"ts":"5000","bids":[],"asks":[]}]})";
    n.normalize(parse(msg));
    n.normalize(parse(msg));
    auto out = drain(diffs_);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_LT(out[0].update_id, out[1].update_id);
}

TEST_F(NormalizerTest, DiffMalformedLeavesQueueUntouched) {
    OkxDiffNormalizer n(symbols_, nonce_, diffs_);
    EXPECT_THROW(n.normalize(parse(R"({"arg":{"instId":"BTC-USDT-SWAP"},"action":"update",
        "data":[{"ts":"1","bids":[["x","1"]],"asks":[]}]})")), MalformedMessageError);
    EXPECT_THROW(n.normalize(parse(R"({"arg":{"instId":"BTC-USDT-SWAP"},"action":"update","data":[]})")),
                 MalformedMessageError);
    EXPECT_THROW(n.normalize(parse(R"({"action":"update","data":[{"ts":"1","bids":[],"asks":[]}]})")),
                 MalformedMessageError);
    EXPECT_THROW(n.normalize(parse(R"({"arg":{"instId":"BTC-USDT"},"action":"update",
        "data":[{"ts":"1","bids":[],"asks":[]}]})")), UnknownSymbolError);
    EXPECT_TRUE(diffs_.empty());
}

// ---------- trades ----------

TEST_F(NormalizerTest, TradesOneEventPerEntryInOrder) {
    OkxTradeNormalizer n(symbols_, trades_);
    EXPECT_EQ(n.normalize(parse(R"({"arg":{"channel":"trades","instId":"BTC-USDT-SWAP"},"data":[
        {"instId":"BTC-USDT-SWAP","tradeId":"11","px":"42000.1","sz":"0.5","side":"buy","ts":"1700000000001"},
        {"instId":"BTC-USDT-SWAP","tradeId":"12","px":"42000.2","sz":"1","side":"sell","ts":"1700000000002"},
        {"instId":"ETH-USDT-SWAP","tradeId":13,"px":2200,"sz":3,"side":"buy","ts":1700000000003}]})")),
              3u);

    auto out = drain(trades_);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].trade_id, "11");
    EXPECT_EQ(out[0].trade_type, TradeType::Buy);
    EXPECT_DOUBLE_EQ(out[0].amount, 0.5);
    EXPECT_DOUBLE_EQ(out[0].price, 42000.1);
    EXPECT_DOUBLE_EQ(out[0].timestamp, 1700000000.001);
    EXPECT_EQ(out[1].trade_id, "12");
    EXPECT_EQ(out[1].trade_type, TradeType::Sell);
    EXPECT_EQ(out[2].trade_id, "13");
    EXPECT_EQ(out[2].trading_pair, "ETH-USDT");
    EXPECT_DOUBLE_EQ(out[2].price, 2200.0);
}

TEST_F(NormalizerTest, TradeTypeTagsMatchSideEnum) {
    EXPECT_EQ(static_cast<int>(TradeType::Buy), 1);
    EXPECT_EQ(static_cast<int>(TradeType::Sell), 2);
}

TEST_F(NormalizerTest, TradesEmptyBatchEnqueuesNothing) {
    OkxTradeNormalizer n(symbols_, trades_);
    EXPECT_EQ(n.normalize(parse(R"({"data":[]})")), 0u);
    EXPECT_TRUE(trades_.empty());
}

TEST_F(NormalizerTest, TradesBadEntryDropsWholeMessage) {
    OkxTradeNormalizer n(symbols_, trades_);
    EXPECT_THROW(n.normalize(parse(R"({"data":[
        {"instId":"BTC-USDT-SWAP","tradeId":"1","px":"1","sz":"1","side":"buy","ts":"1"},
        {"instId":"BTC-USDT-SWAP","tradeId":"2","px":"1","sz":"1","side":"hold","ts":"1"}]})")),
                 MalformedMessageError);
    EXPECT_THROW(n.normalize(parse(R"({"data":[{"instId":"BTC-USDT-SWAP","tradeId":"1","sz":"1","side":"buy","ts":"1"}]})")),
                 MalformedMessageError);
    EXPECT_THROW(n.normalize(parse(R"({"data":{}})")), MalformedMessageError);
    EXPECT_TRUE(trades_.empty());
}

TEST_F(NormalizerTest, OutOfRangeTimestampsAreMalformed) {
    OkxTradeNormalizer trades(symbols_, trades_);
    EXPECT_THROW(trades.normalize(parse(R"({"data":[
        {"instId":"BTC-USDT-SWAP","tradeId":"1","px":"1","sz":"1","side":"buy","ts":1e20}]})")),
                 MalformedMessageError);
    EXPECT_THROW(trades.normalize(parse(R"({"data":[
        {"instId":"BTC-USDT-SWAP","tradeId":"1","px":"1","sz":"1","side":"buy","ts":"99999999999999999999999"}]})")),
                 MalformedMessageError);
    EXPECT_THROW(trades.normalize(parse(R"({"data":[
        {"instId":"BTC-USDT-SWAP","tradeId":"1","px":"1","sz":"1","side":"buy","ts":"-5"}]})")),
                 MalformedMessageError);
    EXPECT_TRUE(trades_.empty());

    OkxDiffNormalizer diffs(symbols_, nonce_, diffs_);
    EXPECT_THROW(diffs.normalize(parse(R"({"arg":{"instId":"BTC-USDT-SWAP"},"action":"update",
        "data":[{"ts":"9000000000000000","bids":[],"asks":[]}]})")), MalformedMessageError);
    EXPECT_THROW(diffs.normalize(parse(R"({"arg":{"instId":"BTC-USDT-SWAP"},"action":"update",
        "data":[{"ts":-1e30,"bids":[],"asks":[]}]})")), MalformedMessageError);
    EXPECT_TRUE(diffs_.empty());
    EXPECT_EQ(nonce_.last(), 0u);
}

// ---------- funding ----------

TEST_F(NormalizerTest, FundingOnlyMarkPriceStaysSparse) {
    OkxFundingNormalizer n(symbols_, funding_);
    EXPECT_EQ(n.normalize(parse(R"({"type":"delta","topic":"instruments.BTC-USDT-SWAP",
        "data":{"update":[{"mark_price":"42001.5"}]}})")), 1u);
    auto out = drain(funding_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].trading_pair, "BTC-USDT");
    ASSERT_TRUE(out[0].mark_price.has_value());
    EXPECT_DOUBLE_EQ(*out[0].mark_price, 42001.5);
    EXPECT_FALSE(out[0].index_price.has_value());
    EXPECT_FALSE(out[0].next_funding_utc_timestamp.has_value());
    EXPECT_FALSE(out[0].rate.has_value());
}

TEST_F(NormalizerTest, FundingAllFieldsAndMultipleEntries) {
    OkxFundingNormalizer n(symbols_, funding_);
    EXPECT_EQ(n.normalize(parse(R"({"type":"delta","topic":"instruments/ETH-USDT-SWAP",
        "data":{"update":[
            {"index_price":"2200.5","mark_price":2201,"next_funding_time":"2024-03-01T08:00:00Z",
             "predicted_funding_rate_e6":125},
            {"predicted_funding_rate_e6":"-40"}]}})")), 2u);
    auto out = drain(funding_);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].trading_pair, "ETH-USDT");
    EXPECT_DOUBLE_EQ(*out[0].index_price, 2200.5);
    EXPECT_DOUBLE_EQ(*out[0].mark_price, 2201.0);
    EXPECT_EQ(*out[0].next_funding_utc_timestamp, 1709280000);
    EXPECT_DOUBLE_EQ(*out[0].rate, 0.000125);
    EXPECT_FALSE(out[1].mark_price.has_value());
    EXPECT_DOUBLE_EQ(*out[1].rate, -0.00004);
}

TEST_F(NormalizerTest, FundingIgnoresNonDelta) {
    OkxFundingNormalizer n(symbols_, funding_);
    EXPECT_EQ(n.normalize(parse(R"({"type":"snapshot","topic":"instruments.BTC-USDT-SWAP",
        "data":{"update":[{"mark_price":"1"}]}})")), 0u);
    EXPECT_EQ(n.normalize(parse(R"({"topic":"instruments.BTC-USDT-SWAP","data":{"update":[{"mark_price":"1"}]}})")), 0u);
    EXPECT_TRUE(funding_.empty());
}

TEST_F(NormalizerTest, FundingFallsBackToArgInstId) {
    OkxFundingNormalizer n(symbols_, funding_);
    EXPECT_EQ(n.normalize(parse(R"({"type":"delta","arg":{"channel":"instruments","instId":"BTC-USDT-SWAP"},
        "data":{"update":[{"index_price":"1"}]}})")), 1u);
    auto out = drain(funding_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].trading_pair, "BTC-USDT");
}

TEST_F(NormalizerTest, FundingBadEntryDropsWholeMessage) {
    OkxFundingNormalizer n(symbols_, funding_);
    EXPECT_THROW(n.normalize(parse(R"({"type":"delta","topic":"instruments.BTC-USDT-SWAP",
        "data":{"update":[{"mark_price":"1"},{"next_funding_time":"tomorrow"}]}})")), MalformedMessageError);
    EXPECT_THROW(n.normalize(parse(R"({"type":"delta","topic":"instruments.BTC-USDT-SWAP","data":{}})")),
                 MalformedMessageError);
    EXPECT_TRUE(funding_.empty());
}

TEST(ParseUtcTimestamp, AcceptedForms) {
    EXPECT_EQ(parse_utc_timestamp("2024-03-01T08:00:00Z"), 1709280000);
    EXPECT_EQ(parse_utc_timestamp("2024-03-01 08:00:00"), 1709280000);
    EXPECT_EQ(parse_utc_timestamp("2024-03-01T08:00:00.250+00:00"), 1709280000);
    EXPECT_EQ(parse_utc_timestamp("1709280000"), 1709280000);
    EXPECT_EQ(parse_utc_timestamp("1709280000000"), 1709280000);
}

TEST(ParseUtcTimestamp, Rejected) {
    EXPECT_THROW(parse_utc_timestamp(""), MalformedMessageError);
    EXPECT_THROW(parse_utc_timestamp("2024-03-01T08:00:00+02:00"), MalformedMessageError);
    EXPECT_THROW(parse_utc_timestamp("not a time"), MalformedMessageError);
    EXPECT_THROW(parse_utc_timestamp("99999999999999999999999"), MalformedMessageError);
}
