#include "execbox/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace execbox::utils {

namespace {
    constexpr std::string_view kWhitespace = " \t\n\r\f\v";
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

auto first_token(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return "";
    auto end = s.find_first_of(kWhitespace, start);
    if (end == std::string_view::npos) return std::string(s.substr(start));
    return std::string(s.substr(start, end - start));
}

auto utf8_length(std::string_view s) -> std::size_t {
    // Count every byte that is not a continuation byte (10xxxxxx).
    return static_cast<std::size_t>(std::ranges::count_if(s, [](unsigned char c) {
        return (c & 0xC0) != 0x80;
    }));
}

auto sanitize_utf8(std::string_view s) -> std::string {
    constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(s.size());

    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;        // overlong
            else if (c == 0xED) hi = 0x9F;   // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;        // overlong
            else if (c == 0xF4) hi = 0x8F;   // above U+10FFFF
        }

        bool valid = len > 0 && i + len <= s.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            auto min = k == 1 ? lo : static_cast<unsigned char>(0x80);
            auto max = k == 1 ? hi : static_cast<unsigned char>(0xBF);
            valid = cc >= min && cc <= max;
        }

        if (valid) {
            out.append(s.substr(i, len));
            i += len;
        } else {
            out.append(kReplacement);
            ++i;
        }
    }
    return out;
}

} // namespace execbox::utils
