#include "./arch_list.hpp"

#include <cubuild/error/errors.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/ranges.h>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace cubuild;

namespace {

bool is_lower(char c) noexcept { return c >= 'a' && c <= 'z'; }
bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[noreturn]] void throw_bad_arch(std::string_view id, std::string message) {
    BOOST_LEAF_THROW_EXCEPTION(std::invalid_argument(message),
                               errc::invalid_configuration,
                               e_human_message{std::move(message)},
                               e_invalid_cuda_arch{std::string(id)});
}

}  // namespace

bool cuda_arch_list::is_valid_identifier(std::string_view id) noexcept {
    if (id == "native" || id == "all" || id == "all-major") {
        return true;
    }
    for (std::string_view suffix : {"-real", "-virtual"}) {
        if (id.ends_with(suffix)) {
            id.remove_suffix(suffix.size());
            break;
        }
    }
    // One or more digits...
    auto it = std::ranges::find_if_not(id, is_digit);
    if (it == id.begin()) {
        return false;
    }
    // ...with an optional feature-set letter, as in '90a'
    if (it != id.end() && is_lower(*it)) {
        ++it;
    }
    return it == id.end();
}

bool cuda_arch_list::add(std::string_view id) {
    if (!is_valid_identifier(id)) {
        throw_bad_arch(id, neo::ufmt("Invalid CUDA architecture identifier '{}'", id));
    }
    if (std::ranges::find(_archs, id) != _archs.end()) {
        cubuild_log(debug, "Ignoring repeated CUDA architecture '{}'", id);
        return false;
    }
    _archs.emplace_back(id);
    return true;
}

cuda_arch_list cuda_arch_list::from_items(const std::vector<std::string>& items) {
    cuda_arch_list ret;
    for (auto& item : items) {
        ret.add(trim_view(item));
    }
    if (ret.empty()) {
        throw_bad_arch("", "The CUDA architecture list must name at least one architecture");
    }
    return ret;
}

cuda_arch_list cuda_arch_list::parse(std::string_view spec) {
    return from_items(split_any(spec, ";,"));
}

cuda_arch_list cuda_arch_list::default_archs() { return parse("70;75;80;86;89;90"); }

std::string cuda_arch_list::to_cmake_string() const noexcept {
    return fmt::format("{}", fmt::join(_archs, ";"));
}
