#include "./options.hpp"

#include <cubuild/util/fs/path.hpp>

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

using namespace cubuild;
using namespace debate;

namespace {

/// Accepts the name of any log::level
class log_level_putter {
    log::level& _dest;

public:
    explicit log_level_putter(log::level& dest) noexcept
        : _dest(dest) {}

    void operator()(std::string_view given, std::string_view spelling) const {
        auto lvl = magic_enum::enum_cast<log::level>(given);
        if (!lvl) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid logging level"),
                                       e_invalid_arg_value{std::string(given)},
                                       e_arg_spelling{std::string(spelling)});
        }
        _dest = *lvl;
    }
};

struct setup {
    cubuild::cli::options& opts;

    explicit setup(cubuild::cli::options& opts)
        : opts(opts) {}

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spellings = {"clean"},
            .help           = "Remove the build directory before configuring",
            .takes_value    = false,
            .action         = store_true(opts.clean),
        });
        parser.add_argument({
            .long_spellings = {"debug"},
            .help           = "Build with the Debug configuration instead of Release",
            .takes_value    = false,
            .action         = store_true(opts.debug),
        });
        parser.add_argument({
            .long_spellings  = {"jobs"},
            .short_spellings = {'j'},
            .help            = "Set the maximum number of parallel compile jobs.\n"
                               "Defaults to $CUBUILD_JOBS, or the number of processors",
            .valname         = "<job-count>",
            .action          = put_into(opts.jobs),
        });
        parser.add_argument({
            .long_spellings = {"install"},
            .help           = "Install the project after a successful build",
            .takes_value    = false,
            .action         = store_true(opts.install),
        });
        parser.add_argument({
            .long_spellings = {"prefix"},
            .help           = "The installation prefix. Default is '/usr/local'",
            .valname        = "<path>",
            .action         = put_into(opts.prefix),
        });
        parser.add_argument({
            .long_spellings = {"cuda-archs"},
            .help           = "CUDA architectures to build for, separated by ';' or ','.\n"
                              "Default is '70;75;80;86;89;90'",
            .valname        = "<archs>",
            .action         = put_into(opts.cuda_archs),
        });
        parser.add_argument({
            .long_spellings  = {"source-dir"},
            .short_spellings = {'S'},
            .help            = "The root of the project to build.\n"
                               "If not given, uses the current working directory",
            .valname         = "<dir>",
            .action          = put_into(opts.source_dir),
        });
        parser.add_argument({
            .long_spellings  = {"build-dir"},
            .short_spellings = {'B'},
            .help            = "The directory in which to build. Default is '<source-dir>/build'",
            .valname         = "<dir>",
            .action          = put_into(opts.build_dir),
        });
        parser.add_argument({
            .long_spellings = {"config"},
            .help           = "Load project settings from the given file instead of\n"
                              "'<source-dir>/cubuild.yaml'",
            .valname        = "<file>",
            .action         = put_into(opts.config_file),
        });
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {'l'},
            .help            = "Set the cubuild logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = log_level_putter{opts.log_level},
        });
    }
};

}  // namespace

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}

fs::path cli::options::absolute_source_dir() const noexcept {
    return resolve_path_weak(source_dir.value_or(fs::current_path()));
}
