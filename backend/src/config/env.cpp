#include "env.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
        }
    }
}

std::vector<std::string> parse_pairs(const std::string& line) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        auto pos = line.find(',', start);
        auto token = trim(line.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!token.empty()) out.push_back(token);
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

static const char* env_or_null(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

static long env_number(const char* key, long fallback) {
    const char* v = env_or_null(key);
    if (!v) return fallback;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0' || n < 0) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer, got '" + v + "'");
    }
    return n;
}

FeedConfig load_feed_config() {
    using namespace std::chrono;
    FeedConfig cfg;

    if (const char* pairs = env_or_null("OKX_PAIRS")) {
        auto parsed = parse_pairs(pairs);
        if (parsed.empty()) throw std::invalid_argument("OKX_PAIRS has no trading pairs");
        cfg.trading_pairs = std::move(parsed);
    }
    if (const char* v = env_or_null("OKX_REST_URL")) cfg.rest_base_url = v;
    if (const char* v = env_or_null("OKX_WS_URL")) cfg.ws_url = v;

    cfg.message_timeout = seconds(env_number("OKX_MESSAGE_TIMEOUT_S",
        duration_cast<seconds>(cfg.message_timeout).count()));
    cfg.retry_delay = seconds(env_number("OKX_RETRY_DELAY_S",
        duration_cast<seconds>(cfg.retry_delay).count()));
    cfg.subscribe_pacing = milliseconds(env_number("OKX_SUBSCRIBE_PACING_MS", cfg.subscribe_pacing.count()));
    cfg.run_time = seconds(env_number("OKX_RUN_SECONDS", cfg.run_time.count()));

    if (const char* v = env_or_null("OKX_API_KEY")) cfg.credentials.api_key = v;
    if (const char* v = env_or_null("OKX_API_SECRET")) cfg.credentials.api_secret = v;
    if (const char* v = env_or_null("OKX_API_PASSPHRASE")) cfg.credentials.passphrase = v;
    return cfg;
}
