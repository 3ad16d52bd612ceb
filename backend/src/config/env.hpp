#pragma once

#include <string>
#include <vector>

#include "feed_config.hpp"

// Load KEY=VALUE lines from a dotenv file into the environment. Variables
// already set win. Looks in ./ then backend/; a missing file is not an error.
void load_env_file(const std::string& filepath = ".env");

// Defaults from FeedConfig, overridden by OKX_* environment variables.
// Throws std::invalid_argument naming the variable on a bad number.
FeedConfig load_feed_config();

// "BTC-USDT, ETH-USDT" -> {"BTC-USDT", "ETH-USDT"}; empty tokens dropped
std::vector<std::string> parse_pairs(const std::string& line);
