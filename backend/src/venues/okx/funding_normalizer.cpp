#include "normalizers.hpp"
#include "dom_fields.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

static bool all_digits(std::string_view s)
{
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

std::int64_t parse_utc_timestamp(std::string_view text)
{
    if (all_digits(text)) {
        const std::string digits(text);
        errno = 0;
        const long long n = std::strtoll(digits.c_str(), nullptr, 10);
        if (errno == ERANGE) throw MalformedMessageError("timestamp out of range \"" + digits + "\"");
        return okx::to_epoch_seconds(n);
    }

    // YYYY-MM-DD[T ]HH:MM:SS[.fraction][Z|+00:00]
    const std::string s(text);
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &mon, &day, &sep, &hour, &min, &sec, &consumed) != 7 ||
        (sep != 'T' && sep != ' ')) {
        throw MalformedMessageError("unparsable UTC timestamp \"" + s + "\"");
    }
    std::string_view tail = std::string_view(s).substr(static_cast<std::size_t>(consumed));
    if (!tail.empty() && tail.front() == '.') {
        std::size_t i = 1;
        while (i < tail.size() && std::isdigit(static_cast<unsigned char>(tail[i]))) ++i;
        tail.remove_prefix(i);
    }
    if (!(tail.empty() || tail == "Z" || tail == "+00:00" || tail == "+0000"))
        throw MalformedMessageError("non-UTC timestamp \"" + s + "\"");

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return static_cast<std::int64_t>(timegm(&tm));
}

std::size_t OkxFundingNormalizer::normalize(simdjson::dom::element msg)
{
    std::string_view type;
    if (msg["type"].get(type) || type != "delta") return 0;

    std::string inst_id;
    std::string_view topic;
    if (!msg["topic"].get(topic)) {
        const auto pos = topic.find_last_of("./");
        inst_id = std::string(pos == std::string_view::npos ? topic : topic.substr(pos + 1));
    } else {
        inst_id = std::string(as_string(require_field(require_field(msg, "arg"), "instId"), "arg.instId"));
    }
    if (inst_id.empty()) throw MalformedMessageError("funding delta without instrument id");
    const std::string pair = symbols_.to_canonical(inst_id);

    simdjson::dom::array entries;
    if (require_field(require_field(msg, "data"), "update").get_array().get(entries))
        throw MalformedMessageError("funding delta 'data.update' is not an array");

    std::vector<FundingInfoUpdate> updates;
    updates.reserve(entries.size());
    for (simdjson::dom::element entry : entries) {
        FundingInfoUpdate u;
        u.trading_pair = pair;
        simdjson::dom::element v;
        if (!entry["index_price"].get(v)) u.index_price = as_double(v, "index_price");
        if (!entry["mark_price"].get(v)) u.mark_price = as_double(v, "mark_price");
        if (!entry["next_funding_time"].get(v)) {
            u.next_funding_utc_timestamp = v.is_string()
                ? parse_utc_timestamp(as_string(v, "next_funding_time"))
                : parse_utc_timestamp(std::to_string(as_int64(v, "next_funding_time")));
        }
        if (!entry["predicted_funding_rate_e6"].get(v))
            u.rate = static_cast<double>(as_int64(v, "predicted_funding_rate_e6")) * 1e-6;
        updates.push_back(std::move(u));
    }

    for (auto& u : updates) out_.push(std::move(u));
    return updates.size();
}
