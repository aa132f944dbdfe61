#include "kraken/client_base.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace kraken {
namespace {

std::int64_t current_timestamp_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

nlohmann::json parse_response(const std::string& endpoint, const HttpResponse& response) {
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw KrakenApiError("Malformed response from " + endpoint + ": " + ex.what());
    }
}

} // namespace

std::vector<std::string> response_errors(const nlohmann::json& response) {
    std::vector<std::string> errors;
    if (!response.is_object() || !response.contains("error")) {
        return errors;
    }
    const auto& value = response.at("error");
    if (value.is_array()) {
        for (const auto& entry : value) {
            errors.push_back(entry.is_string() ? entry.get<std::string>() : entry.dump());
        }
    } else if (value.is_string()) {
        if (!value.get<std::string>().empty()) {
            errors.push_back(value.get<std::string>());
        }
    } else if (!value.is_null()) {
        errors.push_back(value.dump());
    }
    return errors;
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += error;
    }
    return joined;
}

bool is_rate_limit_error(const nlohmann::json& response) {
    const auto message = to_lower_copy(join_errors(response_errors(response)));
    return message.find("rate limit") != std::string::npos ||
           message.find("exceeded") != std::string::npos;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt, double jitter_sample) {
    const double sample = std::clamp(jitter_sample, -1.0, 1.0);
    double seconds = policy.base_backoff_s * std::pow(2.0, attempt) * (1.0 + sample * policy.jitter);
    seconds = std::max(seconds, policy.min_backoff_s);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

std::string base64_encode(const std::vector<unsigned char>& data) {
    std::unique_ptr<BIO, BioDeleter> b64(BIO_new(BIO_f_base64()));
    if (!b64) {
        throw std::runtime_error("Failed to allocate base64 BIO");
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO* mem = BIO_new(BIO_s_mem());
    if (mem == nullptr) {
        throw std::runtime_error("Failed to allocate memory BIO");
    }
    BIO_push(b64.get(), mem);

    if (!data.empty() && BIO_write(b64.get(), data.data(), static_cast<int>(data.size())) <= 0) {
        throw std::runtime_error("Failed to base64 encode");
    }
    (void)BIO_flush(b64.get());

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(b64.get(), &buffer);
    return std::string(buffer->data, buffer->length);
}

std::vector<unsigned char> base64_decode(const std::string& encoded) {
    std::unique_ptr<BIO, BioDeleter> b64(BIO_new(BIO_f_base64()));
    if (!b64) {
        throw std::runtime_error("Failed to allocate base64 BIO");
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO* mem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    if (mem == nullptr) {
        throw std::runtime_error("Failed to allocate memory BIO");
    }
    BIO_push(b64.get(), mem);

    std::vector<unsigned char> decoded(encoded.size());
    const int length = BIO_read(b64.get(), decoded.data(), static_cast<int>(decoded.size()));
    if (length < 0 || (length == 0 && !encoded.empty())) {
        throw std::invalid_argument("API secret is not valid base64");
    }
    decoded.resize(static_cast<std::size_t>(length));
    return decoded;
}

std::string sign_request(const std::string& api_secret,
                         const std::string& url_path,
                         const std::string& nonce,
                         const std::string& body) {
    const std::string nonce_body = nonce + body;
    unsigned char sha[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(nonce_body.data()), nonce_body.size(), sha);

    std::vector<unsigned char> message(url_path.begin(), url_path.end());
    message.insert(message.end(), sha, sha + SHA256_DIGEST_LENGTH);

    const auto key = base64_decode(api_secret);
    unsigned int len = 0;
    unsigned char digest[EVP_MAX_MD_SIZE];
    const unsigned char* result = HMAC(
        EVP_sha512(),
        key.data(), static_cast<int>(key.size()),
        message.data(), message.size(),
        digest,
        &len);

    if (result == nullptr) {
        throw std::runtime_error("Failed to create HMAC signature");
    }

    return base64_encode(std::vector<unsigned char>(digest, digest + len));
}

ClientBase::ClientBase(Credentials credentials, RetryPolicy retry_policy, std::string base_url)
    : credentials_(std::move(credentials)),
      retry_policy_(retry_policy),
      base_url_(std::move(base_url)),
      http_client_(),
      rng_(std::random_device{}()) {}

bool ClientBase::has_credentials() const noexcept {
    return !credentials_.api_key.empty() && !credentials_.api_secret.empty();
}

nlohmann::json ClientBase::public_request(const std::string& endpoint, const QueryParams& params) const {
    std::string url = base_url_ + "/0/public/" + endpoint;
    const auto query = encode_form(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    return with_retry(endpoint, [&]() {
        return http_client_.get(url);
    });
}

nlohmann::json ClientBase::private_request(const std::string& endpoint, QueryParams params) const {
    if (!has_credentials()) {
        throw std::invalid_argument("API key and secret are required for private requests");
    }

    const std::string path = "/0/private/" + endpoint;
    const std::string url = base_url_ + path;

    return with_retry(endpoint, [&]() {
        // Every attempt needs a fresh, strictly increasing nonce.
        const auto nonce = next_nonce();
        QueryParams signed_params = params;
        signed_params.emplace(signed_params.begin(), "nonce", nonce);
        const auto body = encode_form(signed_params);

        const HttpHeaders headers = {
            {"Content-Type", "application/x-www-form-urlencoded; charset=utf-8"},
            {"API-Key", credentials_.api_key},
            {"API-Sign", sign_request(credentials_.api_secret, path, nonce, body)}
        };
        return http_client_.post(url, body, headers);
    });
}

nlohmann::json ClientBase::with_retry(const std::string& endpoint,
                                      const std::function<HttpResponse()>& call) const {
    int attempt = 0;
    while (true) {
        const auto http_response = call();
        last_request_ms_.store(http_response.total_ms);
        auto response = parse_response(endpoint, http_response);
        if (!is_rate_limit_error(response)) {
            return response;
        }

        const auto delay = backoff_delay(retry_policy_, attempt, jitter_sample());
        ++attempt;
        if (attempt > retry_policy_.max_retries) {
            std::cerr << "[RateLimit] " << endpoint << " still throttled after "
                      << retry_policy_.max_retries << " retries" << std::endl;
            return response;
        }
        std::cout << "[RateLimit] " << endpoint << " throttled; backing off for "
                  << delay.count() << " ms" << std::endl;
        std::this_thread::sleep_for(delay);
    }
}

std::string ClientBase::next_nonce() const {
    std::int64_t candidate = current_timestamp_ms();
    std::int64_t previous = last_nonce_.load();
    while (true) {
        const std::int64_t next = std::max(candidate, previous + 1);
        if (last_nonce_.compare_exchange_weak(previous, next)) {
            return std::to_string(next);
        }
    }
}

double ClientBase::jitter_sample() const {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> distribution(-1.0, 1.0);
    return distribution(rng_);
}

} // namespace kraken
