#include "./arch_list.hpp"

#include <cubuild/error/errors.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <catch2/catch.hpp>

using cubuild::cuda_arch_list;

TEST_CASE("Parse architecture lists") {
    auto archs = cuda_arch_list::parse("70;75;80");
    CHECK(archs.items() == std::vector<std::string>{"70", "75", "80"});
    CHECK(archs.to_cmake_string() == "70;75;80");

    archs = cuda_arch_list::parse("90a, 86-real ,80-virtual");
    CHECK(archs.to_cmake_string() == "90a;86-real;80-virtual");

    archs = cuda_arch_list::parse("native");
    CHECK(archs.to_cmake_string() == "native");
}

TEST_CASE("The default architectures") {
    CHECK(cuda_arch_list::default_archs().to_cmake_string() == "70;75;80;86;89;90");
}

TEST_CASE("Repeated architectures keep their first position") {
    auto archs = cuda_arch_list::parse("86;70;86;75;70");
    CHECK(archs.items() == std::vector<std::string>{"86", "70", "75"});
}

TEST_CASE("Validate architecture identifiers") {
    CHECK(cuda_arch_list::is_valid_identifier("52"));
    CHECK(cuda_arch_list::is_valid_identifier("90a"));
    CHECK(cuda_arch_list::is_valid_identifier("100a-real"));
    CHECK(cuda_arch_list::is_valid_identifier("all-major"));
    CHECK_FALSE(cuda_arch_list::is_valid_identifier(""));
    CHECK_FALSE(cuda_arch_list::is_valid_identifier("sm_80"));
    CHECK_FALSE(cuda_arch_list::is_valid_identifier("80AB"));
    CHECK_FALSE(cuda_arch_list::is_valid_identifier("-real"));
    CHECK_FALSE(cuda_arch_list::is_valid_identifier("80-fake"));
}

TEST_CASE("Reject malformed architecture lists") {
    auto bad_arch = [](std::string_view spec) {
        return boost::leaf::try_catch(
            [&] {
                cuda_arch_list::parse(spec);
                return std::string("<no error>");
            },
            [](cubuild::e_invalid_cuda_arch bad) { return bad.value; },
            [] { return std::string("<other error>"); });
    };
    CHECK(bad_arch("70;sm_75") == "sm_75");
    CHECK(bad_arch("") == "");
    CHECK(bad_arch(" ; ") == "");
    CHECK(bad_arch("75") == "<no error>");
}
