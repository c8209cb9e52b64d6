#pragma once

#include <string>

namespace hexprep::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_positive_uint(const std::string& value, unsigned int& out);

// Integer in [0, 255].
bool parse_channel_value(const std::string& value, int& out);

bool parse_bool_value(const std::string& value, bool& out);

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

} // namespace hexprep::core
