// cli_parse.h
// MIT License (c) 2026 Pedro

#pragma once

#include <array>
#include <string>
#include <string_view>

namespace mockforge::core {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_int(const std::string& token, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_bool_value(const std::string& value, bool& out);

// "WIDTHxHEIGHT", both positive.
bool parse_size(const std::string& value, int& width, int& height);
// "R,G,B" or "R,G,B,A", each channel in [0, 255].
bool parse_color(const std::string& value, std::array<unsigned char, 4>& out);

std::string to_quoted(const std::string& s);

} // namespace mockforge::core
