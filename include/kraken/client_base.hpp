#pragma once

#include "kraken/http_client.hpp"
#include "kraken/util.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace kraken {

struct Credentials {
    std::string api_key;
    std::string api_secret;   // base64, as issued by the exchange
};

struct RetryPolicy {
    int max_retries = 8;
    double base_backoff_s = 0.8;
    double jitter = 0.35;
    double min_backoff_s = 0.2;
};

class KrakenApiError : public std::runtime_error {
public:
    explicit KrakenApiError(const std::string& message, std::vector<std::string> errors = {})
        : std::runtime_error(message), errors_(std::move(errors)) {}

    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

private:
    std::vector<std::string> errors_;
};

// Entries of the "error" member, which the exchange reports as a list of strings.
std::vector<std::string> response_errors(const nlohmann::json& response);

std::string join_errors(const std::vector<std::string>& errors);

bool is_rate_limit_error(const nlohmann::json& response);

// jitter_sample is expected in [-1, 1] and scales policy.jitter.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt, double jitter_sample);

std::string base64_encode(const std::vector<unsigned char>& data);

std::vector<unsigned char> base64_decode(const std::string& encoded);

// API-Sign header: base64(HMAC-SHA512(base64decode(secret), path + SHA256(nonce + body))).
std::string sign_request(const std::string& api_secret,
                         const std::string& url_path,
                         const std::string& nonce,
                         const std::string& body);

class ClientBase {
public:
    explicit ClientBase(Credentials credentials,
                        RetryPolicy retry_policy = {},
                        std::string base_url = "https://api.kraken.com");

    [[nodiscard]] bool has_credentials() const noexcept;
    [[nodiscard]] const RetryPolicy& retry_policy() const noexcept { return retry_policy_; }
    // Transfer time of the most recent HTTP round trip, 0 before the first.
    [[nodiscard]] double last_request_ms() const noexcept { return last_request_ms_.load(); }

protected:
    nlohmann::json public_request(const std::string& endpoint, const QueryParams& params = {}) const;

    nlohmann::json private_request(const std::string& endpoint, QueryParams params = {}) const;

private:
    nlohmann::json with_retry(const std::string& endpoint,
                              const std::function<HttpResponse()>& call) const;
    std::string next_nonce() const;
    double jitter_sample() const;

    Credentials credentials_;
    RetryPolicy retry_policy_;
    std::string base_url_;
    HttpClient http_client_;
    mutable std::atomic<std::int64_t> last_nonce_{0};
    mutable std::atomic<double> last_request_ms_{0.0};
    mutable std::mt19937 rng_;
    mutable std::mutex rng_mutex_;
};

} // namespace kraken
