#include "symbol_codec.hpp"
#include "errors.hpp"

static const std::string kSwapSuffix = "-SWAP";

static bool ends_with_swap(const std::string &s)
{
    return s.size() > kSwapSuffix.size() &&
           s.compare(s.size() - kSwapSuffix.size(), kSwapSuffix.size(), kSwapSuffix) == 0;
}

OkxSymbolCodec::OkxSymbolCodec(const std::vector<std::string> &canonical_pairs)
{
    for (const auto &pair : canonical_pairs)
        add(pair, pair + kSwapSuffix);
}

void OkxSymbolCodec::add(const std::string &canonical, const std::string &native)
{
    std::lock_guard<std::mutex> lk(m_);
    to_native_[canonical] = native;
    to_canonical_[native] = canonical;
}

std::string OkxSymbolCodec::to_native(const std::string &c) const
{
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = to_native_.find(c);
        if (it != to_native_.end())
            return it->second;
    }
    if (ends_with_swap(c))
        return c;
    return c + kSwapSuffix;
}

std::string OkxSymbolCodec::to_canonical(const std::string &v) const
{
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = to_canonical_.find(v);
        if (it != to_canonical_.end())
            return it->second;
    }
    if (!ends_with_swap(v))
        throw UnknownSymbolError("unknown instrument id '" + v + "'");
    return v.substr(0, v.size() - kSwapSuffix.size());
}
