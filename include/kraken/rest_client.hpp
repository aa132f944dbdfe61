#pragma once

#include "kraken/client_base.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kraken {

// Thin endpoint wrappers. Each call returns the full response document
// ({"error": [...], "result": {...}}) so callers decide how to treat errors.
class RestClient : public ClientBase {
public:
    explicit RestClient(Credentials credentials,
                        RetryPolicy retry_policy = {},
                        std::string base_url = "https://api.kraken.com");

    nlohmann::json server_time() const;

    nlohmann::json ticker(const std::vector<std::string>& pairs) const;

    nlohmann::json trades_history(std::optional<long long> offset = std::nullopt,
                                  QueryParams options = {}) const;
};

} // namespace kraken
