#pragma once
#include "md/errors.hpp"
#include "md/perp_events.hpp"

#include "venues/okx/constants.hpp"

#include <simdjson.h>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

// Strict field readers over simdjson DOM elements. OKX sends most numbers as
// strings, so every numeric reader accepts both. Anything missing or
// unparsable becomes a MalformedMessageError naming the field.

inline simdjson::dom::element require_field(simdjson::dom::element parent, std::string_view key)
{
    simdjson::dom::element v;
    if (auto err = parent[key].get(v))
        throw MalformedMessageError("missing field '" + std::string(key) + "': " + simdjson::error_message(err));
    return v;
}

inline std::string_view as_string(simdjson::dom::element v, std::string_view what)
{
    std::string_view sv;
    if (v.get_string().get(sv))
        throw MalformedMessageError("field '" + std::string(what) + "' is not a string");
    return sv;
}

inline double as_double(simdjson::dom::element v, std::string_view what)
{
    if (v.is_string()) {
        std::string tmp(v.get_string().value_unsafe());
        char* end = nullptr;
        double d = std::strtod(tmp.c_str(), &end);
        if (tmp.empty() || end != tmp.c_str() + tmp.size())
            throw MalformedMessageError("field '" + std::string(what) + "' is not numeric: \"" + tmp + "\"");
        return d;
    }
    double d = 0;
    if (v.get_double().get(d))
        throw MalformedMessageError("field '" + std::string(what) + "' is not numeric");
    return d;
}

inline std::int64_t as_int64(simdjson::dom::element v, std::string_view what)
{
    if (v.is_string()) {
        std::string tmp(v.get_string().value_unsafe());
        char* end = nullptr;
        errno = 0;
        long long n = std::strtoll(tmp.c_str(), &end, 10);
        if (tmp.empty() || end != tmp.c_str() + tmp.size())
            throw MalformedMessageError("field '" + std::string(what) + "' is not an integer: \"" + tmp + "\"");
        if (errno == ERANGE)
            throw MalformedMessageError("field '" + std::string(what) + "' out of range: \"" + tmp + "\"");
        return static_cast<std::int64_t>(n);
    }
    std::int64_t n = 0;
    if (!v.get_int64().get(n)) return n;
    // [-2^63, 2^63) in doubles; anything else does not fit
    double d = 0;
    if (!v.get_double().get(d) && std::floor(d) == d) {
        if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) return static_cast<std::int64_t>(d);
        throw MalformedMessageError("field '" + std::string(what) + "' out of range");
    }
    throw MalformedMessageError("field '" + std::string(what) + "' is not an integer");
}

// Exchange event time in epoch milliseconds, within [0, year 3000].
inline std::int64_t as_epoch_ms(simdjson::dom::element v, std::string_view what)
{
    const std::int64_t ms = as_int64(v, what);
    if (ms < 0 || ms > okx::kMaxEpochMs)
        throw MalformedMessageError("field '" + std::string(what) + "' is not a plausible epoch ms: " + std::to_string(ms));
    return ms;
}

// Id fields arrive as strings, occasionally as numbers.
inline std::string as_id(simdjson::dom::element v, std::string_view what)
{
    if (v.is_string()) return std::string(v.get_string().value_unsafe());
    return std::to_string(as_int64(v, what));
}

// [[px, sz, ...], ...] -> (px, sz) pairs; extra columns are ignored.
inline std::vector<PriceLevel> read_levels(simdjson::dom::element v, std::string_view what)
{
    simdjson::dom::array rows;
    if (v.get_array().get(rows))
        throw MalformedMessageError("field '" + std::string(what) + "' is not an array");

    std::vector<PriceLevel> out;
    out.reserve(rows.size());
    for (simdjson::dom::element row : rows) {
        simdjson::dom::array cols;
        if (row.get_array().get(cols) || cols.size() < 2)
            throw MalformedMessageError("level in '" + std::string(what) + "' is not [price, size, ...]");
        auto it = cols.begin();
        const double px = as_double(*it, what);
        ++it;
        const double sz = as_double(*it, what);
        out.emplace_back(px, sz);
    }
    return out;
}
