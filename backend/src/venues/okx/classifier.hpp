#pragma once
#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>

#include "venues/okx/constants.hpp"

// Canonical destination of an inbound stream message.
enum class ChannelKind : std::uint8_t
{
    Unrouted = 0, // acks, pongs, errors, channels nobody subscribed to
    Trade,
    Diff,
    Funding,
};

const char* to_string(ChannelKind kind);

struct ChannelNames
{
    std::string trades{okx::kTradesChannel};
    std::string order_book{okx::kBooksChannel};
    std::string instruments{okx::kInstrumentsChannel};
};

// Routes a parsed payload by its channel. Messages carrying a top-level
// "success" key are protocol acks and never routed. The channel comes from
// "topic" ("<channel>.<instId>" or "<channel>/<instId>", instrument stripped)
// or, for OKX-native frames, from arg.channel.
class OkxChannelClassifier
{
public:
    OkxChannelClassifier() = default;
    explicit OkxChannelClassifier(ChannelNames names) : names_(std::move(names)) {}

    ChannelKind classify(simdjson::dom::element msg) const;

    // "books.BTC-USDT-SWAP" -> "books"; no delimiter -> ""
    static std::string_view strip_instrument(std::string_view topic);

    const ChannelNames& names() const noexcept { return names_; }

private:
    ChannelKind match(std::string_view channel) const;

    ChannelNames names_;
};
