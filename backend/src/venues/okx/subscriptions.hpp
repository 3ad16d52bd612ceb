#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "util/cancellation.hpp"
#include "venues/okx/classifier.hpp"
#include "ws/ws.hpp"

// One {"op":"subscribe","args":[{"channel":..,"instId":..}, ...]} request per
// channel kind, args in the order the instruments were given.
struct SubscribeBatch
{
    nlohmann::json trades;
    nlohmann::json order_book;
    nlohmann::json instruments;
};

SubscribeBatch build_subscribe_batch(const std::vector<std::string> &native_ids,
                                     const ChannelNames &channels = {});

// Sends trades, then order book, then instruments. `pacing` > 0 waits that
// long between requests through the scheduler. Send failures are logged and
// rethrown; cancellation passes straight through.
void send_subscribe_batch(IWsConnection &ws,
                          const SubscribeBatch &batch,
                          IScheduler &scheduler,
                          CancellationToken &token,
                          std::chrono::milliseconds pacing = std::chrono::milliseconds(0));
