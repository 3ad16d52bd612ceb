#include "rest.hpp"
#include "md/errors.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

// Helper for CURL write callback
static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *s)
{
    size_t new_length = size * nmemb;
    s->append(static_cast<char *>(contents), new_length);
    return new_length;
}

static void curl_global_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string base64_encode(const unsigned char *data, size_t len)
{
    BIO *bio, *b64;
    BUF_MEM *bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(bio, data, static_cast<int>(len));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);
    return result;
}

static const char *method_name(RestMethod m)
{
    return m == RestMethod::POST ? "POST" : "GET";
}

CurlRestClient::CurlRestClient(ApiCredentials creds, std::chrono::milliseconds timeout)
    : creds_(std::move(creds)), timeout_(timeout)
{
    curl_global_once();
}

std::string CurlRestClient::sign(const std::string &secret, const std::string &prehash)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         secret.data(),
         static_cast<int>(secret.length()),
         reinterpret_cast<const unsigned char *>(prehash.data()),
         prehash.length(),
         digest,
         &digest_len);

    return base64_encode(digest, digest_len);
}

// OKX wants e.g. 2020-12-08T09:08:57.715Z
std::string CurlRestClient::iso8601_now_ms()
{
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count();
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm tm_info{};
    gmtime_r(&t, &tm_info);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_info);
    std::ostringstream os;
    os << buf << "." << std::setw(3) << std::setfill('0') << (ms % 1000) << "Z";
    return os.str();
}

std::string CurlRestClient::execute(const RestRequest &req)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl)
        throw TransportError("curl_easy_init failed");

    // Build query string (GET) or JSON body (POST)
    std::string query;
    std::string body;
    if (req.method == RestMethod::GET) {
        for (const auto &[k, v] : req.params) {
            std::unique_ptr<char, decltype(&curl_free)> ek(
                curl_easy_escape(curl.get(), k.c_str(), static_cast<int>(k.size())), &curl_free);
            std::unique_ptr<char, decltype(&curl_free)> ev(
                curl_easy_escape(curl.get(), v.c_str(), static_cast<int>(v.size())), &curl_free);
            query += query.empty() ? "?" : "&";
            query += std::string(ek.get()) + "=" + ev.get();
        }
    } else {
        json j = json::object();
        for (const auto &[k, v] : req.params) j[k] = v;
        body = j.dump();
    }
    const std::string url = req.url + query;

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "User-Agent: okx-perp-md/0.1");

    if (req.is_auth_required) {
        if (creds_.empty()) {
            if (!warned_no_creds_.exchange(true)) {
                std::cerr << "[okx-rest] " << req.limit_id
                          << " asks for authentication but no API credentials are set; sending unsigned\n";
            }
        } else {
            // Prehash string: timestamp + method + requestPath(+query) + body
            auto scheme_end = url.find("://");
            auto path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
            const std::string request_path = path_start == std::string::npos ? "/" : url.substr(path_start);
            const std::string timestamp = iso8601_now_ms();
            const std::string signature = sign(creds_.api_secret,
                                               timestamp + method_name(req.method) + request_path + body);

            headers = curl_slist_append(headers, ("OK-ACCESS-KEY: " + creds_.api_key).c_str());
            headers = curl_slist_append(headers, ("OK-ACCESS-SIGN: " + signature).c_str());
            headers = curl_slist_append(headers, ("OK-ACCESS-TIMESTAMP: " + timestamp).c_str());
            headers = curl_slist_append(headers, ("OK-ACCESS-PASSPHRASE: " + creds_.passphrase).c_str());
        }
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

    std::string response_str;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_str);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (req.method == RestMethod::POST)
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::cerr << "[okx-rest] CURL error on " << req.limit_id << ": "
                  << curl_easy_strerror(res) << "\n";
        throw TransportError(std::string("curl: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::cerr << "[okx-rest] HTTP " << status << " on " << req.limit_id << ": " << response_str << "\n";
        throw TransportError("HTTP " + std::to_string(status) + " from " + req.limit_id);
    }
    return response_str;
}
