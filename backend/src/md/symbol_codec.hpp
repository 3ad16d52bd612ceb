#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Translation between canonical pairs ("BTC-USDT") and exchange-native
// instrument ids ("BTC-USDT-SWAP"). Injected wherever a wire id is read or written.
struct ISymbolCodec
{
    virtual ~ISymbolCodec() = default;
    virtual std::string to_native(const std::string &canonical) const = 0;
    // Throws UnknownSymbolError for ids it cannot map.
    virtual std::string to_canonical(const std::string &native) const = 0;
};

// OKX linear perpetuals: "<BASE>-<QUOTE>-SWAP".
// Known pairs are kept in a table; anything else falls back to the suffix rule.
class OkxSymbolCodec final : public ISymbolCodec
{
public:
    OkxSymbolCodec() = default;
    explicit OkxSymbolCodec(const std::vector<std::string> &canonical_pairs);

    // Register an explicit mapping (overrides the suffix rule).
    void add(const std::string &canonical, const std::string &native);

    std::string to_native(const std::string &canonical) const override;
    std::string to_canonical(const std::string &native) const override;

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, std::string> to_native_;
    std::unordered_map<std::string, std::string> to_canonical_;
};
