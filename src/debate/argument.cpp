#include "./argument.hpp"

#include <neo/ufmt.hpp>

#include <fmt/color.h>

#include <algorithm>

using namespace debate;

bool argument::matches_long(std::string_view name) const noexcept {
    return std::ranges::find(long_spellings, name) != long_spellings.end();
}

bool argument::matches_short(char c) const noexcept {
    return std::ranges::find(short_spellings, c) != short_spellings.end();
}

std::string argument::value_name() const noexcept {
    if (!valname.empty()) {
        return valname;
    }
    return long_spellings.empty() ? "<value>" : neo::ufmt("<{}>", long_spellings.front());
}

std::string argument::syntax_string() const noexcept {
    if (!long_spellings.empty()) {
        if (!takes_value) {
            return neo::ufmt("[--{}]", long_spellings.front());
        }
        return neo::ufmt("[--{}={}]", long_spellings.front(), value_name());
    }
    if (!takes_value) {
        return neo::ufmt("[-{}]", short_spellings.front());
    }
    return neo::ufmt("[-{} {}]", short_spellings.front(), value_name());
}

std::string argument::help_string() const noexcept {
    std::vector<std::string> spellings;
    for (auto& l : long_spellings) {
        auto s = fmt::format(fmt::emphasis::bold, "--{}", l);
        if (takes_value) {
            s.append(fmt::format(fmt::emphasis::italic, "={}", value_name()));
        }
        spellings.push_back(std::move(s));
    }
    for (auto c : short_spellings) {
        auto s = fmt::format(fmt::emphasis::bold, "-{}", c);
        if (takes_value) {
            s.append(fmt::format(fmt::emphasis::italic, " {}", value_name()));
        }
        spellings.push_back(std::move(s));
    }

    std::string ret = "  ";
    for (auto& s : spellings) {
        if (&s != &spellings.front()) {
            ret.append(", ");
        }
        ret.append(s);
    }
    // The description goes beneath, further indented
    ret.append("\n      ");
    for (auto c : help) {
        ret.push_back(c);
        if (c == '\n') {
            ret.append(6, ' ');
        }
    }
    ret.push_back('\n');
    return ret;
}
