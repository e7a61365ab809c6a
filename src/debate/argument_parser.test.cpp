#include "./argument_parser.hpp"

#include <boost/leaf/handle_errors.hpp>
#include <catch2/catch.hpp>

#include <optional>

namespace {

struct fixture {
    std::optional<int> jobs;
    bool               clean = false;
    bool               debug = false;
    std::string        prefix;

    debate::argument_parser parser;

    fixture() {
        parser.add_argument({
            .long_spellings  = {"jobs"},
            .short_spellings = {'j'},
            .help            = "Number of parallel jobs",
            .valname         = "<N>",
            .action          = debate::put_into(jobs),
        });
        parser.add_argument({
            .long_spellings = {"clean"},
            .help           = "Clean first",
            .takes_value    = false,
            .action         = debate::store_true(clean),
        });
        parser.add_argument({
            .long_spellings  = {"debug"},
            .short_spellings = {'g'},
            .help            = "Debug build",
            .takes_value     = false,
            .action          = debate::store_true(debug),
        });
        parser.add_argument({
            .long_spellings = {"prefix"},
            .help           = "Install prefix",
            .valname        = "<path>",
            .action         = debate::put_into(prefix),
        });
    }

    /// Parse, returning the name of the error that occurred, or an empty string for success
    template <typename... Args>
    std::string parse(Args... args) {
        return boost::leaf::try_catch(
            [&] {
                parser.parse_argv({std::string_view(args)...});
                return std::string();
            },
            [](debate::help_request) { return std::string("help"); },
            [](debate::unrecognized_argument const&, debate::e_arg_spelling spell) {
                return "unrecognized:" + spell.value;
            },
            [](debate::invalid_repetition const&) { return std::string("repeated"); },
            [](debate::invalid_arguments const&, debate::e_invalid_arg_value val) {
                return "bad-value:" + val.value;
            },
            [](debate::invalid_arguments const&, debate::e_wrong_val_num n) {
                return "wrong-count:" + std::to_string(n.value);
            },
            [] { return std::string("unknown"); });
    }
};

}  // namespace

TEST_CASE("Parse long and short options") {
    fixture f;
    CHECK(f.parse("--jobs", "8") == "");
    CHECK(f.jobs == 8);
    CHECK(f.parse("--jobs=12") == "");
    CHECK(f.jobs == 12);
    CHECK(f.parse("-j3") == "");
    CHECK(f.jobs == 3);
    CHECK(f.parse("-j", "5", "--clean", "-g") == "");
    CHECK(f.jobs == 5);
    CHECK(f.clean);
    CHECK(f.debug);
    CHECK(f.parse("--prefix", "/opt/lib") == "");
    CHECK(f.prefix == "/opt/lib");
}

TEST_CASE("Help is always a help request") {
    fixture f;
    CHECK(f.parse("--help") == "help");
    CHECK(f.parse("-h") == "help");
    CHECK(f.parse("--clean", "--help") == "help");
}

TEST_CASE("Reject bad arguments") {
    fixture f;
    CHECK(f.parse("--bogus") == "unrecognized:--bogus");
    CHECK(f.parse("-x") == "unrecognized:-x");
    CHECK(f.parse("stray") == "unrecognized:stray");
    CHECK(f.parse("--jobs", "eight") == "bad-value:eight");
    CHECK(f.parse("--jobs") == "wrong-count:0");
    CHECK(f.parse("--clean=yes") == "wrong-count:1");
    CHECK(f.parse("--clean", "--clean") == "repeated");
    CHECK(f.parse("-j", "2", "--jobs=3") == "repeated");
    CHECK(f.parse("-j") == "wrong-count:0");
    CHECK(f.parse("--") == "unrecognized:--");
    CHECK(f.parse("-") == "unrecognized:-");
}

TEST_CASE("Short switches are not grouped") {
    fixture f;
    // The remainder of the word would be a value for the switch
    CHECK(f.parse("-gj4") == "wrong-count:1");
}

TEST_CASE("Generate usage and help text") {
    fixture f;
    auto    usage = f.parser.usage_string("cubuild");
    CHECK(usage.starts_with("Usage: cubuild"));
    CHECK(usage.find("[--jobs=<N>]") != std::string::npos);
    CHECK(usage.find("[--clean]") != std::string::npos);

    auto help = f.parser.help_string("cubuild");
    CHECK(help.find("Number of parallel jobs") != std::string::npos);
    CHECK(help.find("Print this help message") != std::string::npos);

    auto spellings = f.parser.long_spellings();
    CHECK(std::ranges::find(spellings, "--prefix") != spellings.end());
    CHECK(std::ranges::find(spellings, "--help") != spellings.end());
}
