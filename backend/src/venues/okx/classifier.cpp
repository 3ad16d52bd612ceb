#include "classifier.hpp"

const char* to_string(ChannelKind kind)
{
    switch (kind) {
        case ChannelKind::Trade:   return "trade";
        case ChannelKind::Diff:    return "diff";
        case ChannelKind::Funding: return "funding";
        case ChannelKind::Unrouted: break;
    }
    return "unrouted";
}

std::string_view OkxChannelClassifier::strip_instrument(std::string_view topic)
{
    const auto pos = topic.find_last_of("./");
    if (pos == std::string_view::npos) return {};
    return topic.substr(0, pos);
}

ChannelKind OkxChannelClassifier::match(std::string_view channel) const
{
    if (channel.empty()) return ChannelKind::Unrouted;
    if (channel == names_.trades) return ChannelKind::Trade;
    if (channel == names_.order_book) return ChannelKind::Diff;
    if (channel == names_.instruments) return ChannelKind::Funding;
    return ChannelKind::Unrouted;
}

ChannelKind OkxChannelClassifier::classify(simdjson::dom::element msg) const
{
    simdjson::dom::object obj;
    if (msg.get_object().get(obj)) return ChannelKind::Unrouted;

    // Subscribe acks: {"success": true, ...}
    simdjson::dom::element ignored;
    if (!obj["success"].get(ignored)) return ChannelKind::Unrouted;

    std::string_view topic;
    if (!obj["topic"].get(topic)) return match(strip_instrument(topic));

    // OKX v5 frames: {"arg":{"channel":"books","instId":"..."}, ...}
    std::string_view channel;
    if (!obj["arg"]["channel"].get(channel)) {
        // Subscribe/unsubscribe/error events echo arg without carrying data
        simdjson::dom::element event;
        if (!obj["event"].get(event)) return ChannelKind::Unrouted;
        return match(channel);
    }
    return ChannelKind::Unrouted;
}
