#pragma once

#include <stdexcept>
#include <string>

namespace debate {

struct argument;
class argument_parser;

/// '--help' or '-h' was given
struct help_request : std::exception {};

/// Base of every way in which a command line can be wrong
struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

/// A word that is not a known option
struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// An option that was given twice
struct invalid_repetition : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// The option that was being parsed when the error occurred
struct e_argument {
    const debate::argument& value;
};

struct e_argument_parser {
    const debate::argument_parser& value;
};

/// A value that the option could not accept
struct e_invalid_arg_value {
    std::string value;
};

/// The number of values given to an option that expects a different number (zero or one)
struct e_wrong_val_num {
    int value;
};

/// The option as it was spelled on the command line
struct e_arg_spelling {
    std::string value;
};

}  // namespace debate
