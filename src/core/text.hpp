#pragma once

/// @file src/core/text.hpp
/// @brief Internal ASCII text helpers shared by the categoriser, the debtor
///        analyzer and the CSV loader. Not part of the public API.

#include <algorithm>
#include <cctype>
#include <string_view>

namespace finagg::detail {

/// Strip leading/trailing spaces, tabs, CR and LF.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Case-insensitive ASCII search. `needle` must already be lower-case.
[[nodiscard]] inline bool icontains(std::string_view haystack,
                                    std::string_view needle) noexcept {
    const auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    return it != haystack.end() || needle.empty();
}

/// Case-insensitive ASCII equality after trimming `s`. `word` must be lower-case.
[[nodiscard]] inline bool iequals(std::string_view s, std::string_view word) noexcept {
    const auto t = trim(s);
    return std::equal(t.begin(), t.end(), word.begin(), word.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) == b;
                      });
}

}  // namespace finagg::detail
