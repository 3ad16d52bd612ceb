#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

enum class RestMethod
{
    GET,
    POST,
};

struct RestRequest
{
    std::string url;    // full url without query string
    RestMethod method{RestMethod::GET};
    std::vector<std::pair<std::string, std::string>> params; // query (GET) or JSON body (POST)
    std::string limit_id; // throttler bucket, e.g. "/market/books"
    bool is_auth_required{false};
};

// Opaque request/response facility. Returns the response body; throws
// TransportError when the round trip fails or the exchange reports an error.
struct IRestClient
{
    virtual ~IRestClient() = default;
    virtual std::string execute(const RestRequest &req) = 0;
};

struct ApiCredentials
{
    std::string api_key;
    std::string api_secret;
    std::string passphrase;

    bool empty() const { return api_key.empty() || api_secret.empty() || passphrase.empty(); }
};

// libcurl client with OKX request signing for authenticated calls.
// One easy handle per request, so concurrent execute() calls are fine.
class CurlRestClient final : public IRestClient
{
public:
    explicit CurlRestClient(ApiCredentials creds = {},
                            std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::string execute(const RestRequest &req) override;

    // Exposed for tests
    static std::string sign(const std::string &secret, const std::string &prehash);
    static std::string iso8601_now_ms();

private:
    ApiCredentials creds_;
    std::chrono::milliseconds timeout_;
    std::atomic<bool> warned_no_creds_{false};
};
