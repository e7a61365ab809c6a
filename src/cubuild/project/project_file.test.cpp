#include "./project_file.hpp"

#include <cubuild/cubuild.test.hpp>
#include <cubuild/error/errors.hpp>
#include <cubuild/error/result.hpp>
#include <cubuild/util/fs/io.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <catch2/catch.hpp>

using cubuild::project_settings;

TEST_CASE("Load an empty project file") {
    auto proj = project_settings::from_yaml_string("");
    CHECK_FALSE(proj.build_dir);
    CHECK_FALSE(proj.build_type);
    CHECK_FALSE(proj.cuda_archs);
    CHECK(proj.definitions.empty());
    CHECK(proj.summary.library_dir == "lib");
    CHECK_FALSE(proj.summary.test_binaries);
}

TEST_CASE("Load a complete project file") {
    auto proj = project_settings::from_yaml_string(R"(
build-dir: _build
build-type: Debug
install-prefix: /opt/fhe
cuda-architectures: [80, 86, "90a"]
policy-version-minimum: "3.10"
tools:
  generator: /opt/cmake/bin/cmake
  cuda-compiler: /usr/local/cuda/bin/nvcc
definitions:
  WITH_OPENMP: "ON"
  BUILD_BENCHMARKS: "OFF"
summary:
  library-dir: lib64
  tests-dir: tests
  test-binaries: [core_tests, pke_tests]
)");
    CHECK(proj.build_dir == cubuild::fs::path("_build"));
    CHECK(proj.build_type == cubuild::build_type::debug);
    CHECK(proj.install_prefix == cubuild::fs::path("/opt/fhe"));
    REQUIRE(proj.cuda_archs);
    CHECK(proj.cuda_archs->to_cmake_string() == "80;86;90a");
    CHECK(proj.policy_version_minimum == "3.10");
    CHECK(proj.generator == "/opt/cmake/bin/cmake");
    CHECK(proj.cuda_compiler == "/usr/local/cuda/bin/nvcc");
    REQUIRE(proj.definitions.size() == 2);
    CHECK(proj.definitions[0].first == "WITH_OPENMP");
    CHECK(proj.definitions[0].second == "ON");
    CHECK(proj.definitions[1].first == "BUILD_BENCHMARKS");
    CHECK(proj.summary.library_dir == "lib64");
    CHECK(proj.summary.examples_dir == "bin/examples");
    CHECK(proj.summary.tests_dir == "tests");
    CHECK(proj.summary.test_binaries == std::vector<std::string>{"core_tests", "pke_tests"});
}

TEST_CASE("Architecture lists may be given as a string") {
    auto proj = project_settings::from_yaml_string("cuda-architectures: '75,80;80'");
    REQUIRE(proj.cuda_archs);
    CHECK(proj.cuda_archs->to_cmake_string() == "75;80");
}

TEST_CASE("Reject unknown keys with a suggestion") {
    struct case_ {
        std::string_view content;
        std::string_view given;
        std::string_view nearest;
    };
    auto [content, given, nearest] = GENERATE(Catch::Generators::values<case_>({
        {"bulid-dir: foo", "bulid-dir", "build-dir"},
        {"tools: {cuda-compilr: nvcc}", "cuda-compilr", "cuda-compiler"},
        {"summary: {test-binary: [a]}", "test-binary", "test-binaries"},
    }));

    auto bad = boost::leaf::try_catch(
        [&] {
            project_settings::from_yaml_string(content);
            return cubuild::e_bad_project_key{"<no error>", std::nullopt};
        },
        [](cubuild::e_bad_project_key bad,
           cubuild::matchv<cubuild::errc::invalid_project_file>) { return bad; },
        [] { return cubuild::e_bad_project_key{"<other error>", std::nullopt}; });
    CHECK(bad.given == given);
    CHECK(bad.nearest == std::string(nearest));
}

TEST_CASE("Reject malformed project files") {
    auto content = GENERATE(as<std::string>{},
                            "build-type: Profile",
                            "cuda-architectures: [70, sm_75]",
                            "definitions: [A, B]",
                            "tools: cmake",
                            "{ not: yaml",
                            "- just\n- a\n- list");
    INFO("Content: " << content);
    auto ec = boost::leaf::try_catch(
        [&] {
            project_settings::from_yaml_string(content);
            return cubuild::errc::none;
        },
        [](cubuild::errc ec) { return ec; },
        [] { return cubuild::errc::none; });
    bool ok = ec == cubuild::errc::invalid_project_file
        || ec == cubuild::errc::invalid_configuration;
    CHECK(ok);
}

TEST_CASE("Keys that are not strings are rejected") {
    auto content = GENERATE(as<std::string>{},
                            "? [build-dir, build-type]\n: out\n",
                            "definitions:\n  ? {WITH_CUDA: ON}\n  : OFF\n");
    INFO("Content: " << content);
    auto message = boost::leaf::try_catch(
        [&] {
            project_settings::from_yaml_string(content);
            return std::string("<no error>");
        },
        [](cubuild::matchv<cubuild::errc::invalid_project_file>, cubuild::e_human_message msg) {
            return msg.value;
        },
        [] { return std::string("<other error>"); });
    CHECK_THAT(message, Catch::Matchers::Contains("must be strings"));
}

TEST_CASE("Find the default project file") {
    auto tmp = cubuild::testing::scratch_dir::create();

    // No file: empty settings
    auto proj = project_settings::load_for(tmp.path(), std::nullopt);
    CHECK_FALSE(proj.build_dir);

    cubuild::write_file(tmp.path() / "cubuild.yaml", "build-dir: out\n");
    proj = project_settings::load_for(tmp.path(), std::nullopt);
    CHECK(proj.build_dir == cubuild::fs::path("out"));

    cubuild::write_file(tmp.path() / "other.yaml", "build-dir: other\n");
    proj = project_settings::load_for(tmp.path(), tmp.path() / "other.yaml");
    CHECK(proj.build_dir == cubuild::fs::path("other"));
}

TEST_CASE("An explicit project file must exist") {
    auto tmp     = cubuild::testing::scratch_dir::create();
    auto missing = tmp.path() / "missing.yaml";
    auto bad_path = boost::leaf::try_catch(
        [&] {
            project_settings::load_for(tmp.path(), missing);
            return cubuild::fs::path();
        },
        [](cubuild::e_project_file_path fpath,
           cubuild::matchv<cubuild::errc::invalid_project_file>) { return fpath.value; },
        [] { return cubuild::fs::path("<other error>"); });
    CHECK(bad_path == missing);
}
