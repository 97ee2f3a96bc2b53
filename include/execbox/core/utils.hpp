#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace execbox::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto iequals(std::string_view a, std::string_view b) -> bool;

/// First whitespace-delimited word of `s`, or empty if `s` is blank.
auto first_token(std::string_view s) -> std::string;

/// Number of UTF-8 code points in `s`. Invalid sequences count per byte.
auto utf8_length(std::string_view s) -> std::size_t;

/// Copy of `s` with every byte that does not start a well-formed UTF-8
/// sequence replaced by U+FFFD.
auto sanitize_utf8(std::string_view s) -> std::string;

} // namespace execbox::utils
