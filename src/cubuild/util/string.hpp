#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cubuild {

inline namespace string_utils {

inline constexpr std::string_view whitespace_chars = " \t\r\n\f\v";

inline std::string_view trim_view(std::string_view s) noexcept {
    auto first = s.find_first_not_of(whitespace_chars);
    if (first == s.npos) {
        return s.substr(s.size());
    }
    auto last = s.find_last_not_of(whitespace_chars);
    return s.substr(first, last - first + 1);
}

inline bool contains(std::string_view s, std::string_view key) noexcept {
    return s.find(key) != s.npos;
}

/**
 * @brief Split the given string at every occurrence of `sep`. Empty items are kept, so the result
 * always has one more item than there are separators.
 */
inline std::vector<std::string> split(std::string_view str, char sep) {
    std::vector<std::string> ret;
    while (true) {
        auto pos = str.find(sep);
        ret.emplace_back(str.substr(0, pos));
        if (pos == str.npos) {
            return ret;
        }
        str.remove_prefix(pos + 1);
    }
}

/**
 * @brief Split the given string on any of the characters in `seps`, dropping empty items and
 * trimming whitespace from each item.
 */
inline std::vector<std::string> split_any(std::string_view str, std::string_view seps) {
    std::vector<std::string> ret;
    while (!str.empty()) {
        auto pos  = str.find_first_of(seps);
        auto item = trim_view(str.substr(0, pos));
        if (!item.empty()) {
            ret.emplace_back(item);
        }
        if (pos == str.npos) {
            break;
        }
        str.remove_prefix(pos + 1);
    }
    return ret;
}

/// Split tool output into lines, accepting both '\n' and '\r\n' line endings
inline std::vector<std::string> split_lines(std::string_view str) {
    auto lines = split(str, '\n');
    for (auto& l : lines) {
        if (l.ends_with('\r')) {
            l.pop_back();
        }
    }
    return lines;
}

}  // namespace string_utils

}  // namespace cubuild
