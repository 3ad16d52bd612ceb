#include "normalizers.hpp"
#include "dom_fields.hpp"

bool OkxDiffNormalizer::normalize(simdjson::dom::element msg)
{
    std::string_view action;
    if (msg["action"].get(action) || action != "update") return false;

    const std::string_view inst_id = as_string(require_field(require_field(msg, "arg"), "instId"), "arg.instId");

    simdjson::dom::array data;
    if (require_field(msg, "data").get_array().get(data) || data.size() == 0)
        throw MalformedMessageError("books update without data records");
    const simdjson::dom::element first = *data.begin();

    const std::int64_t ts_ms = as_epoch_ms(require_field(first, "ts"), "ts");

    OrderBookMessage ev;
    ev.type = OrderBookMessageType::Diff;
    ev.trading_pair = symbols_.to_canonical(std::string(inst_id));
    ev.bids = read_levels(require_field(first, "bids"), "bids");
    ev.asks = read_levels(require_field(first, "asks"), "asks");
    ev.timestamp = static_cast<double>(ts_ms) * 1e-3;
    ev.update_id = nonce_.next_us(static_cast<std::uint64_t>(ts_ms) * 1000u);

    out_.push(std::move(ev));
    return true;
}
