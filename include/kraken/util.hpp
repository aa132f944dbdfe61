#pragma once

#include <string>
#include <utility>
#include <vector>

namespace kraken {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// application/x-www-form-urlencoded escaping: unreserved characters pass
// through, space becomes '+', everything else is %XX.
std::string form_escape(const std::string& value);

// Parameters with an empty value are omitted; order is preserved. The same
// text serves as a GET query and as the signed POST body.
std::string encode_form(const QueryParams& params);

std::string to_upper_copy(std::string value);

std::string to_lower_copy(std::string value);

std::string trim_copy(const std::string& value);

std::vector<std::string> split(const std::string& value, char delimiter);

} // namespace kraken
