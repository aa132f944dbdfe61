#include "kraken/rest_client.hpp"

#include <utility>

namespace kraken {

RestClient::RestClient(Credentials credentials, RetryPolicy retry_policy, std::string base_url)
    : ClientBase(std::move(credentials), retry_policy, std::move(base_url)) {}

nlohmann::json RestClient::server_time() const {
    return public_request("Time");
}

nlohmann::json RestClient::ticker(const std::vector<std::string>& pairs) const {
    std::string joined;
    for (const auto& pair : pairs) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += pair;
    }
    return public_request("Ticker", {{"pair", joined}});
}

nlohmann::json RestClient::trades_history(std::optional<long long> offset, QueryParams options) const {
    QueryParams params;
    if (offset) {
        params.emplace_back("ofs", std::to_string(*offset));
    }
    for (auto& option : options) {
        params.emplace_back(std::move(option));
    }
    return private_request("TradesHistory", std::move(params));
}

} // namespace kraken
