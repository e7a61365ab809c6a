#include "./dym.hpp"

#include <range/v3/algorithm/min.hpp>
#include <range/v3/view/iota.hpp>

#include <algorithm>
#include <utility>
#include <vector>

using namespace cubuild;

std::size_t cubuild::lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    // Only the previous row of the distance table is needed to compute the next one
    std::vector<std::size_t> prev(a.size() + 1);
    std::vector<std::size_t> cur(a.size() + 1);
    for (auto col : ranges::views::iota(std::size_t{0}, prev.size())) {
        prev[col] = col;
    }

    for (auto row : ranges::views::iota(std::size_t{1}, b.size() + 1)) {
        cur[0] = row;
        for (auto col : ranges::views::iota(std::size_t{1}, a.size() + 1)) {
            std::size_t cost = a[col - 1] == b[row - 1] ? 0 : 1;
            cur[col]         = ranges::min({
                prev[col] + 1,
                cur[col - 1] + 1,
                prev[col - 1] + cost,
            });
        }
        std::swap(prev, cur);
    }
    return prev.back();
}

std::size_t cubuild::max_typo_distance(std::string_view given) noexcept {
    return std::max<std::size_t>(3, given.size() / 2);
}
