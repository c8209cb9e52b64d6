#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace hexprep::core {

namespace {

constexpr int k_max_channel_value = 255;

bool parse_whole_int(const std::string& value, int& out) {
    if (value.empty()) {
        return false;
    }
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    if (!parse_whole_int(value, parsed) || parsed <= 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_int(const std::string& value, int& out) {
    int parsed = 0;
    if (!parse_whole_int(value, parsed) || parsed < 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_positive_uint(const std::string& value, unsigned int& out) {
    int parsed = 0;
    if (!parse_positive_int(value, parsed)) {
        return false;
    }
    out = static_cast<unsigned int>(parsed);
    return true;
}

bool parse_channel_value(const std::string& value, int& out) {
    int parsed = 0;
    if (!parse_non_negative_int(value, parsed) || parsed > k_max_channel_value) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_bool_value(const std::string& value, bool& out) {
    const std::string lower = to_lower_copy(trim_copy(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && (std::isspace(static_cast<unsigned char>(s[start])) != 0)) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && (std::isspace(static_cast<unsigned char>(s[end - 1])) != 0)) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::ranges::transform(value, value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace hexprep::core
