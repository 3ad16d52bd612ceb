#include "normalizers.hpp"
#include "dom_fields.hpp"

#include <vector>

std::size_t OkxTradeNormalizer::normalize(simdjson::dom::element msg)
{
    simdjson::dom::array data;
    if (require_field(msg, "data").get_array().get(data))
        throw MalformedMessageError("trades message 'data' is not an array");

    std::vector<TradeEvent> trades;
    trades.reserve(data.size());
    for (simdjson::dom::element entry : data) {
        const std::string_view side = as_string(require_field(entry, "side"), "side");

        TradeEvent t;
        t.trading_pair = symbols_.to_canonical(std::string(as_string(require_field(entry, "instId"), "instId")));
        t.trade_id = as_id(require_field(entry, "tradeId"), "tradeId");
        if (side == "buy") t.trade_type = TradeType::Buy;
        else if (side == "sell") t.trade_type = TradeType::Sell;
        else throw MalformedMessageError("unknown trade side '" + std::string(side) + "'");
        t.amount = as_double(require_field(entry, "sz"), "sz");
        t.price = as_double(require_field(entry, "px"), "px");
        t.timestamp = static_cast<double>(as_epoch_ms(require_field(entry, "ts"), "ts")) * 1e-3;
        trades.push_back(std::move(t));
    }

    for (auto& t : trades) out_.push(std::move(t));
    return trades.size();
}
