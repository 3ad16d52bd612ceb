#include "snapshot_fetcher.hpp"
#include "md/errors.hpp"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <future>

using json = nlohmann::json;

// {"code":"0","msg":"","data":[{...}, ...]} -> parsed body; a non-zero code is
// the exchange refusing the request.
static json parse_body(const std::string& body, const std::string& what) {
    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        throw MalformedResponseError(what + ": response is not a JSON object");

    auto code = j.find("code");
    if (code != j.end()) {
        const std::string c = code->is_string() ? code->get<std::string>() : code->dump();
        if (c != "0") {
            const std::string msg = j.value("msg", std::string());
            throw TransportError(what + ": OKX error " + c + (msg.empty() ? "" : " (" + msg + ")"));
        }
    }
    return j;
}

static const json& first_row(const json& j, const std::string& what) {
    auto data = j.find("data");
    if (data == j.end() || !data->is_array() || data->empty() || !(*data)[0].is_object())
        throw MalformedResponseError(what + ": missing data[0]");
    return (*data)[0];
}

static double to_double(const json& v, const std::string& what) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (!s.empty() && end == s.c_str() + s.size()) return d;
    }
    throw MalformedResponseError(what + " is not numeric: " + v.dump());
}

static std::int64_t to_int64(const json& v, const std::string& what) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(INT64_MAX))
            throw MalformedResponseError(what + " out of range: " + v.dump());
        return static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<std::int64_t>();
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        char* end = nullptr;
        errno = 0;
        long long n = std::strtoll(s.c_str(), &end, 10);
        if (!s.empty() && end == s.c_str() + s.size()) {
            if (errno == ERANGE) throw MalformedResponseError(what + " out of range: " + v.dump());
            return static_cast<std::int64_t>(n);
        }
    }
    throw MalformedResponseError(what + " is not an integer: " + v.dump());
}

static const json& field(const json& row, const char* key, const std::string& what) {
    auto it = row.find(key);
    if (it == row.end()) throw MalformedResponseError(what + ": missing '" + key + "'");
    return *it;
}

// asks ascending, bids descending, as sent; only the first two columns count
static std::vector<PriceLevel> levels(const json& row, const char* key, const std::string& what) {
    const json& arr = field(row, key, what);
    if (!arr.is_array()) throw MalformedResponseError(what + ": '" + key + "' is not an array");
    std::vector<PriceLevel> out;
    out.reserve(arr.size());
    for (const auto& lvl : arr) {
        if (!lvl.is_array() || lvl.size() < 2)
            throw MalformedResponseError(what + ": bad level in '" + key + "'");
        out.emplace_back(to_double(lvl[0], what + " price"), to_double(lvl[1], what + " size"));
    }
    return out;
}

OkxSnapshotFetcher::OkxSnapshotFetcher(IRestClient& rest,
                                       const ISymbolCodec& symbols,
                                       NonceSequencer& nonce,
                                       std::string rest_base_url,
                                       int depth)
    : rest_(rest), symbols_(symbols), nonce_(nonce), base_url_(std::move(rest_base_url)), depth_(depth) {}

RestRequest OkxSnapshotFetcher::get(const char* path,
                                    std::vector<std::pair<std::string, std::string>> params,
                                    std::string limit_id,
                                    bool auth) const {
    RestRequest req;
    req.url = base_url_ + path;
    req.method = RestMethod::GET;
    req.params = std::move(params);
    req.limit_id = limit_id.empty() ? std::string(path) : std::move(limit_id);
    req.is_auth_required = auth;
    return req;
}

OrderBookMessage OkxSnapshotFetcher::fetch_order_book_snapshot(const std::string& trading_pair) {
    const std::string what = std::string("order book snapshot ") + trading_pair;
    const std::string body = rest_.execute(get(okx::kOrderBookPath,
        {{"instId", symbols_.to_native(trading_pair)}, {"sz", std::to_string(depth_)}}));

    const json j = parse_body(body, what);
    const json& row = first_row(j, what);
    const std::int64_t ts_ms = to_int64(field(row, "ts", what), what + " ts");
    if (ts_ms < 0 || ts_ms > okx::kMaxEpochMs)
        throw MalformedResponseError(what + ": implausible ts " + std::to_string(ts_ms));

    OrderBookMessage snap;
    snap.type = OrderBookMessageType::Snapshot;
    snap.trading_pair = trading_pair;
    snap.bids = levels(row, "bids", what);
    snap.asks = levels(row, "asks", what);
    snap.timestamp = static_cast<double>(ts_ms) * 1e-3;
    snap.update_id = nonce_.next(snap.timestamp);
    return snap;
}

FundingInfo OkxSnapshotFetcher::fetch_funding_info(const std::string& trading_pair) {
    const std::string inst_id = symbols_.to_native(trading_pair);

    RestRequest index_req = get(okx::kIndexTickersPath, {{"instId", inst_id}});
    RestRequest mark_req = get(okx::kMarkPricePath,
                               {{"instId", inst_id}, {"instType", okx::kInstTypeSwap}},
                               std::string(okx::kMarkPricePath) + "/" + trading_pair,
                               /*auth=*/true);
    RestRequest funding_req = get(okx::kFundingRatePath, {{"instId", inst_id}});

    // All three in flight at once; get() rethrows the request's own error.
    auto run = [this](RestRequest req) { return rest_.execute(req); };
    auto index_f = std::async(std::launch::async, run, std::move(index_req));
    auto mark_f = std::async(std::launch::async, run, std::move(mark_req));
    auto funding_f = std::async(std::launch::async, run, std::move(funding_req));

    const std::string index_body = index_f.get();
    const std::string mark_body = mark_f.get();
    const std::string funding_body = funding_f.get();

    const std::string what = "funding info " + trading_pair;
    const json index_j = parse_body(index_body, what + " (index)");
    const json mark_j = parse_body(mark_body, what + " (mark)");
    const json funding_j = parse_body(funding_body, what + " (funding)");

    const json& index_row = first_row(index_j, what + " (index)");
    const json& mark_row = first_row(mark_j, what + " (mark)");
    const json& funding_row = first_row(funding_j, what + " (funding)");

    FundingInfo info;
    info.trading_pair = trading_pair;
    info.index_price = to_double(field(index_row, "idxPx", what), what + " idxPx");
    info.mark_price = to_double(field(mark_row, "markPx", what), what + " markPx");
    // epoch ms on the wire
    info.next_funding_utc_timestamp = okx::to_epoch_seconds(
        to_int64(field(funding_row, "nextFundingTime", what), what + " nextFundingTime"));
    info.rate = to_double(field(funding_row, "nextFundingRate", what), what + " nextFundingRate");
    return info;
}

double OkxSnapshotFetcher::fetch_last_traded_price(const std::string& trading_pair) {
    const std::string what = "ticker " + trading_pair;
    const std::string body = rest_.execute(get(okx::kTickerPath, {{"instId", symbols_.to_native(trading_pair)}}));
    const json j = parse_body(body, what);
    return to_double(field(first_row(j, what), "last", what), what + " last");
}

std::unordered_map<std::string, double> OkxSnapshotFetcher::fetch_last_traded_prices(
    const std::vector<std::string>& trading_pairs) {
    std::unordered_map<std::string, double> out;
    for (const auto& pair : trading_pairs) {
        out[pair] = fetch_last_traded_price(pair);
    }
    return out;
}
