#include "./main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <cubuild/build/config.hpp>
#include <cubuild/build/pipeline.hpp>
#include <cubuild/dym.hpp>
#include <cubuild/error/result.hpp>
#include <cubuild/project/project_file.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/signal.hpp>

#include <debate/argument_parser.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/color.h>
#include <fmt/ostream.h>

#include <iostream>
#include <optional>
#include <utility>

using namespace cubuild;

namespace {

/// Find a known option that resembles the given unknown one
std::optional<std::string> suggest_option(const debate::argument_parser& parser,
                                          std::string_view               given) {
    if (!given.starts_with("--")) {
        return std::nullopt;
    }
    auto eq_pos = given.find('=');
    if (eq_pos != given.npos) {
        given = given.substr(0, eq_pos);
    }
    return did_you_mean(given, parser.long_spellings());
}

/// Report a bad command line. Every such error prints the usage first and exits with 2.
template <typename... Args>
int usage_error(const debate::argument_parser& parser,
                std::string_view               program_name,
                fmt::format_string<Args...>    message,
                Args&&... args) {
    std::cerr << parser.usage_string(program_name) << '\n';
    fmt::print(std::cerr, message, std::forward<Args>(args)...);
    std::cerr << '\n';
    return 2;
}

}  // namespace

int cli::main_fn(std::string_view                program_name,
                 const std::vector<std::string>& argv,
                 process_runner&                 runner) {
    log::init_logger();

    cli::options            opts;
    debate::argument_parser parser{
        "Configure, build, and optionally install a CMake project that requires a CUDA compiler"};
    opts.setup_parser(parser);

    auto bold_red = fmt::emphasis::bold | fmt::fg(fmt::color::red);
    auto result   = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request) {
            std::cout << parser.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument, debate::e_arg_spelling arg) {
            auto suggestion = suggest_option(parser, arg.value);
            if (!suggestion) {
                return usage_error(parser,
                                   program_name,
                                   "Unrecognized argument: \"{}\"",
                                   fmt::styled(arg.value, bold_red));
            }
            return usage_error(parser,
                               program_name,
                               "Unrecognized argument: \"{}\"\n  (Did you mean '{}'?)",
                               fmt::styled(arg.value, bold_red),
                               fmt::styled(*suggestion,
                                           fmt::fg(fmt::terminal_color::bright_yellow)));
        },
        [&](debate::invalid_arguments,
            debate::e_argument          arg,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) {
            return usage_error(parser,
                               program_name,
                               "'{}' is not a valid {} for {}",
                               val.value,
                               arg.value.value_name(),
                               spell.value);
        },
        [&](debate::invalid_arguments,
            debate::e_argument      arg,
            debate::e_arg_spelling  spell,
            debate::e_wrong_val_num) {
            if (arg.value.takes_value) {
                return usage_error(parser,
                                   program_name,
                                   "{} must be followed by a {}",
                                   spell.value,
                                   arg.value.value_name());
            }
            return usage_error(parser, program_name, "{} does not take a value", spell.value);
        },
        [&](debate::invalid_repetition, debate::e_arg_spelling spell) {
            return usage_error(parser,
                               program_name,
                               "{} was given more than once",
                               spell.value);
        },
        [&](debate::invalid_arguments const& err) {
            return usage_error(parser, program_name, "Error: {}", err.what());
        });
    if (result) {
        // Non-null result from argument parsing, return that value immediately.
        return *result;
    }
    install_signal_handlers();
    log::current_log_level = opts.log_level;
    return run_build(opts, runner);
}

int cli::run_build(const options& opts, process_runner& runner) noexcept {
    return handle_cli_errors([&]() -> result<int> {
        auto proj = project_settings::load_for(opts.absolute_source_dir(), opts.config_file);
        auto cfg  = build_config::from_options(opts, proj);

        build_pipeline pipeline{cfg, runner};
        BOOST_LEAF_CHECK(pipeline.run());
        return 0;
    });
}
