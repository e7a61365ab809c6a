#pragma once

#include "./argument.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

/**
 * @brief A flat command-line parser: A set of '--long' and '-s' options, with no positional
 * arguments and no subcommands.
 *
 * '--help' and '-h' are always recognized and raise a help_request. An option may be given at
 * most once. Errors are thrown as leaf exceptions that carry an e_argument_parser.
 */
class argument_parser {
    std::vector<argument> _arguments;
    std::string           _description;

    void _parse(const std::vector<std::string_view>& words) const;

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    void add_argument(argument arg) noexcept { _arguments.push_back(std::move(arg)); }

    const std::vector<argument>& arguments() const noexcept { return _arguments; }

    /// A one-line (where it fits) synopsis of the accepted options
    std::string usage_string(std::string_view progname) const noexcept;

    /// The usage string, followed by the description and the help for every option
    std::string help_string(std::string_view progname) const noexcept;

    /// Every '--long' spelling known to this parser, including the leading hyphens
    std::vector<std::string> long_spellings() const noexcept;

    /// Parse the given command-line words. The program name must not be included.
    template <typename Range>
    void parse_argv(const Range& argv) const {
        std::vector<std::string_view> words;
        for (auto&& word : argv) {
            words.emplace_back(word);
        }
        _parse(words);
    }

    void parse_argv(std::initializer_list<std::string_view> argv) const {
        _parse(std::vector<std::string_view>(argv));
    }
};

}  // namespace debate
