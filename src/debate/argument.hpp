#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>

#include <charconv>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace debate {

namespace detail {

template <typename T>
struct optional_value {
    using type = void;
};

template <typename T>
struct optional_value<std::optional<T>> {
    using type = T;
};

template <typename T>
T convert_value(std::string_view value, std::string_view spelling) {
    if constexpr (std::is_integral_v<T>) {
        T    ret{};
        auto res = std::from_chars(value.data(), value.data() + value.size(), ret);
        if (res.ec != std::errc{} || res.ptr != value.data() + value.size()) {
            throw boost::leaf::exception(invalid_arguments(
                                             "Invalid value given for integral argument"),
                                         e_arg_spelling{std::string(spelling)},
                                         e_invalid_arg_value{std::string(value)});
        }
        return ret;
    } else {
        return T(value);
    }
}

}  // namespace detail

/**
 * @brief Create an action that stores the value of an argument into `dest`.
 *
 * Integers are parsed, with anything but a plain decimal number being rejected. An optional is
 * engaged with the converted value. Other types are constructed from the string.
 */
constexpr inline auto put_into = [](auto& dest) {
    return [&dest](std::string_view value, std::string_view spelling) {
        using T     = std::remove_cvref_t<decltype(dest)>;
        using inner = typename detail::optional_value<T>::type;
        if constexpr (std::is_void_v<inner>) {
            dest = detail::convert_value<T>(value, spelling);
        } else {
            dest = detail::convert_value<inner>(value, spelling);
        }
    };
};

/// Create an action for a switch that sets `dest` when given
constexpr inline auto store_true = [](bool& dest) {
    return [&dest](std::string_view, std::string_view) { dest = true; };
};

/**
 * @brief An option of an argument_parser.
 *
 * An option is spelled as '--long' or '-s', and either is a switch or takes exactly one value.
 * Values are given as '--long=value', '--long value', '-svalue' or '-s value'.
 */
struct argument {
    /// Spellings without the leading '--'
    std::vector<std::string> long_spellings{};
    /// Single-letter spellings, without the leading '-'
    std::vector<char> short_spellings{};

    std::string help{};
    std::string valname{};

    /// If false, the option is a switch, and giving it a value is an error
    bool takes_value = true;

    /// Invoked with the value (empty for a switch) and the spelling that was used
    std::function<void(std::string_view, std::string_view)> action;

    bool        matches_long(std::string_view name) const noexcept;
    bool        matches_short(char c) const noexcept;
    std::string value_name() const noexcept;
    std::string syntax_string() const noexcept;
    std::string help_string() const noexcept;
};

}  // namespace debate
