#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "md/nonce.hpp"
#include "md/perp_events.hpp"
#include "md/symbol_codec.hpp"
#include "rest/rest.hpp"
#include "venues/okx/constants.hpp"

// Point-in-time REST queries: book snapshot (seeds the diff sequence),
// the full funding picture and last traded prices. No retries here; a
// TransportError or MalformedResponseError reaches the caller as is.
class OkxSnapshotFetcher {
public:
    OkxSnapshotFetcher(IRestClient& rest,
                       const ISymbolCodec& symbols,
                       NonceSequencer& nonce,
                       std::string rest_base_url = okx::kRestBaseUrl,
                       int depth = okx::kSnapshotDepth);

    OrderBookMessage fetch_order_book_snapshot(const std::string& trading_pair);

    // Index ticker, mark price (authenticated) and funding rate requested
    // concurrently; any failure fails the whole call.
    FundingInfo fetch_funding_info(const std::string& trading_pair);

    double fetch_last_traded_price(const std::string& trading_pair);
    std::unordered_map<std::string, double> fetch_last_traded_prices(const std::vector<std::string>& trading_pairs);

private:
    RestRequest get(const char* path, std::vector<std::pair<std::string, std::string>> params,
                    std::string limit_id = {}, bool auth = false) const;

    IRestClient& rest_;
    const ISymbolCodec& symbols_;
    NonceSequencer& nonce_;
    std::string base_url_;
    int depth_;
};
