#include "subscriptions.hpp"

#include <iostream>

using json = nlohmann::json;

static json subscribe_request(const std::string &channel, const std::vector<std::string> &native_ids)
{
    json args = json::array();
    for (const auto &id : native_ids)
        args.push_back({{"channel", channel}, {"instId", id}});
    return {{"op", "subscribe"}, {"args", std::move(args)}};
}

SubscribeBatch build_subscribe_batch(const std::vector<std::string> &native_ids,
                                     const ChannelNames &channels)
{
    SubscribeBatch batch;
    batch.trades = subscribe_request(channels.trades, native_ids);
    batch.order_book = subscribe_request(channels.order_book, native_ids);
    batch.instruments = subscribe_request(channels.instruments, native_ids);
    return batch;
}

void send_subscribe_batch(IWsConnection &ws,
                          const SubscribeBatch &batch,
                          IScheduler &scheduler,
                          CancellationToken &token,
                          std::chrono::milliseconds pacing)
{
    try {
        const json *requests[] = {&batch.trades, &batch.order_book, &batch.instruments};
        bool first = true;
        for (const json *req : requests) {
            if (!first && pacing.count() > 0)
                scheduler.sleep_for(pacing, token);
            token.throw_if_cancelled();
            ws.send(req->dump());
            first = false;
        }
        std::cout << "[okx-stream] Subscribed to public order book, trade and funding info channels...\n";
    } catch (const std::exception &e) {
        std::cerr << "[okx-stream] Unexpected error occurred subscribing to order book trading and delta streams: "
                  << e.what() << "\n";
        throw;
    }
}
