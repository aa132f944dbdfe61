#include "kraken/util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kraken {
namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

template <typename CharMap>
std::string map_chars(std::string value, CharMap map) {
    for (auto& ch : value) {
        ch = static_cast<char>(map(static_cast<unsigned char>(ch)));
    }
    return value;
}

} // namespace

std::string form_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHexDigits[c >> 4];
            out += kHexDigits[c & 0x0F];
        }
    }
    return out;
}

std::string encode_form(const QueryParams& params) {
    std::string body;
    for (const auto& [key, value] : params) {
        if (value.empty()) {
            continue;
        }
        if (!body.empty()) {
            body += '&';
        }
        body += form_escape(key);
        body += '=';
        body += form_escape(value);
    }
    return body;
}

std::string to_upper_copy(std::string value) {
    return map_chars(std::move(value), [](unsigned char c) { return std::toupper(c); });
}

std::string to_lower_copy(std::string value) {
    return map_chars(std::move(value), [](unsigned char c) { return std::tolower(c); });
}

std::string trim_copy(const std::string& value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    const auto first = std::find_if(value.begin(), value.end(), not_space);
    const auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(value);
    while (std::getline(stream, current, delimiter)) {
        parts.push_back(current);
    }
    if (!value.empty() && value.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

} // namespace kraken
