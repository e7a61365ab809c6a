#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <optional>
#include <set>

using namespace debate;

namespace {

class parse_engine {
    const argument_parser&               _parser;
    const std::vector<std::string_view>& _words;
    std::size_t                          _pos = 0;
    std::set<const argument*>            _seen;

    const argument* _find_long(std::string_view name) const noexcept {
        for (auto& arg : _parser.arguments()) {
            if (arg.matches_long(name)) {
                return &arg;
            }
        }
        return nullptr;
    }

    const argument* _find_short(char c) const noexcept {
        for (auto& arg : _parser.arguments()) {
            if (arg.matches_short(c)) {
                return &arg;
            }
        }
        return nullptr;
    }

    /// Hand the value of an option to its action. `attached` is a value given in the same word.
    void _dispatch(const argument&                 arg,
                   std::optional<std::string_view> attached,
                   std::string_view                spelling) {
        auto _ = boost::leaf::on_error(e_argument{arg}, e_arg_spelling{std::string(spelling)});
        if (!_seen.insert(&arg).second) {
            throw boost::leaf::exception(invalid_repetition("Invalid repetition"));
        }
        if (!arg.takes_value) {
            if (attached) {
                throw boost::leaf::exception(invalid_arguments("Argument does not expect a value"),
                                             e_wrong_val_num{1});
            }
            arg.action("", spelling);
            return;
        }
        if (!attached) {
            if (_pos == _words.size()) {
                throw boost::leaf::exception(invalid_arguments("Expected a value"),
                                             e_wrong_val_num{0});
            }
            attached = _words[_pos++];
        }
        arg.action(*attached, spelling);
    }

    /// '--name' or '--name=value'
    bool _parse_long(std::string_view word) {
        auto body = word.substr(2);
        auto eq   = body.find('=');
        auto name = body.substr(0, eq);
        if (name == "help") {
            throw boost::leaf::exception(help_request());
        }
        auto arg = _find_long(name);
        if (!arg) {
            return false;
        }
        std::optional<std::string_view> attached;
        if (eq != body.npos) {
            attached = body.substr(eq + 1);
        }
        _dispatch(*arg, attached, word.substr(0, eq == body.npos ? word.size() : eq + 2));
        return true;
    }

    /// '-s', '-svalue' or '-s value'
    bool _parse_short(std::string_view word) {
        if (word == "-h") {
            throw boost::leaf::exception(help_request());
        }
        auto arg = _find_short(word[1]);
        if (!arg) {
            return false;
        }
        std::optional<std::string_view> attached;
        if (word.size() > 2) {
            attached = word.substr(2);
        }
        _dispatch(*arg, attached, word.substr(0, 2));
        return true;
    }

public:
    parse_engine(const argument_parser& p, const std::vector<std::string_view>& words) noexcept
        : _parser(p)
        , _words(words) {}

    void run() {
        auto _ = boost::leaf::on_error(e_argument_parser{_parser});
        while (_pos < _words.size()) {
            auto word = _words[_pos++];
            bool okay = false;
            // We take no positional arguments
            if (word.size() >= 2 && word[0] == '-') {
                okay = word[1] == '-' ? _parse_long(word) : _parse_short(word);
            }
            if (!okay) {
                throw boost::leaf::exception(unrecognized_argument("Unrecognized argument"),
                                             e_arg_spelling{std::string(word)});
            }
        }
    }
};

}  // namespace

void argument_parser::_parse(const std::vector<std::string_view>& words) const {
    parse_engine{*this, words}.run();
}

std::vector<std::string> argument_parser::long_spellings() const noexcept {
    std::vector<std::string> ret = {"--help"};
    for (auto& arg : _arguments) {
        for (auto& l : arg.long_spellings) {
            ret.push_back("--" + l);
        }
    }
    return ret;
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    auto ret = fmt::format("Usage: {} [--help]", progname);
    // Continuation lines line up beneath the first option
    const auto indent     = std::string(fmt::format("Usage: {}", progname).size(), ' ');
    auto       line_begin = std::size_t{0};
    for (auto& arg : _arguments) {
        auto syntax = arg.syntax_string();
        if (ret.size() - line_begin + syntax.size() + 1 > 79) {
            ret.push_back('\n');
            line_begin = ret.size();
            ret.append(indent);
        }
        ret.push_back(' ');
        ret.append(syntax);
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    auto ret = usage_string(progname);
    ret.append("\n\n");
    if (!_description.empty()) {
        ret.append(_description);
        ret.append("\n\n");
    }
    ret.append("Options:\n");
    for (auto& arg : _arguments) {
        ret.append(arg.help_string());
    }
    ret.append(fmt::format("  {}, {}\n      Print this help message and exit\n",
                           fmt::format(fmt::emphasis::bold, "--help"),
                           fmt::format(fmt::emphasis::bold, "-h")));
    return ret;
}
