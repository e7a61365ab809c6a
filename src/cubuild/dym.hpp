#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace cubuild {

std::size_t lev_edit_distance(std::string_view a, std::string_view b) noexcept;

/// The largest edit distance at which a candidate is still a plausible misspelling of `given`
std::size_t max_typo_distance(std::string_view given) noexcept;

/**
 * @brief Find the candidate that the user most likely meant when they typed `given`.
 *
 * Returns nothing if no candidate is within max_typo_distance() of `given`. On a tie, the earlier
 * candidate wins.
 */
template <typename Range>
std::optional<std::string> did_you_mean(std::string_view given, Range&& candidates) noexcept {
    std::optional<std::string> best;
    auto                       best_distance = max_typo_distance(given) + 1;
    for (std::string_view cand : candidates) {
        auto dist = lev_edit_distance(cand, given);
        if (dist < best_distance) {
            best_distance = dist;
            best          = std::string(cand);
        }
    }
    return best;
}

inline std::optional<std::string>
did_you_mean(std::string_view given, std::initializer_list<std::string_view> candidates) noexcept {
    return did_you_mean<std::initializer_list<std::string_view>&>(given, candidates);
}

}  // namespace cubuild
