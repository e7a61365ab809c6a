#include "./project_file.hpp"

#include <cubuild/dym.hpp>
#include <cubuild/error/errors.hpp>
#include <cubuild/error/result.hpp>
#include <cubuild/util/fs/io.hpp>
#include <cubuild/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <stdexcept>

using namespace cubuild;

namespace {

[[noreturn]] void throw_bad_project(std::string message) {
    BOOST_LEAF_THROW_EXCEPTION(std::runtime_error(message),
                               errc::invalid_project_file,
                               e_human_message{std::move(message)});
}

std::string key_string(const YAML::Node& key, std::string_view where) {
    if (!key.IsScalar()) {
        throw_bad_project(neo::ufmt("Keys in '{}' must be strings", where));
    }
    return key.as<std::string>();
}

template <std::size_t N>
void check_keys(const YAML::Node&                        map,
                std::string_view                         where,
                const std::array<std::string_view, N>& known) {
    if (!map.IsMap()) {
        throw_bad_project(neo::ufmt("Expected a mapping for '{}'", where));
    }
    for (auto&& pair : map) {
        auto key = key_string(pair.first, where);
        if (std::ranges::find(known, key) != known.end()) {
            continue;
        }
        auto message = neo::ufmt("Unknown key '{}' in '{}'", key, where);
        BOOST_LEAF_THROW_EXCEPTION(std::runtime_error(message),
                                   errc::invalid_project_file,
                                   e_human_message{message},
                                   e_bad_project_key{key, did_you_mean(key, known)});
    }
}

std::string scalar_string(const YAML::Node& node, std::string_view key) {
    if (!node.IsScalar()) {
        throw_bad_project(neo::ufmt("Expected a string value for '{}'", key));
    }
    return node.as<std::string>();
}

std::vector<std::string> string_list(const YAML::Node& node, std::string_view key) {
    if (!node.IsSequence()) {
        throw_bad_project(neo::ufmt("Expected a list of strings for '{}'", key));
    }
    std::vector<std::string> ret;
    for (auto&& item : node) {
        ret.push_back(scalar_string(item, key));
    }
    return ret;
}

cubuild::build_type parse_build_type(std::string_view str) {
    if (str == "Release" || str == "release") {
        return build_type::release;
    } else if (str == "Debug" || str == "debug") {
        return build_type::debug;
    }
    throw_bad_project(
        neo::ufmt("Invalid build-type '{}' (Expected either 'Release' or 'Debug')", str));
}

constexpr std::array<std::string_view, 8> top_level_keys = {
    "build-dir",
    "build-type",
    "install-prefix",
    "cuda-architectures",
    "policy-version-minimum",
    "tools",
    "definitions",
    "summary",
};

constexpr std::array<std::string_view, 2> tools_keys = {"generator", "cuda-compiler"};

constexpr std::array<std::string_view, 4> summary_keys = {
    "library-dir",
    "examples-dir",
    "tests-dir",
    "test-binaries",
};

}  // namespace

project_settings project_settings::from_yaml(const YAML::Node& doc) {
    project_settings ret;
    if (doc.IsNull()) {
        // An empty file is fine
        return ret;
    }
    check_keys(doc, "<root>", top_level_keys);

    if (auto n = doc["build-dir"]) {
        ret.build_dir = scalar_string(n, "build-dir");
    }
    if (auto n = doc["build-type"]) {
        ret.build_type = parse_build_type(scalar_string(n, "build-type"));
    }
    if (auto n = doc["install-prefix"]) {
        ret.install_prefix = scalar_string(n, "install-prefix");
    }
    if (auto n = doc["cuda-architectures"]) {
        if (n.IsSequence()) {
            ret.cuda_archs = cuda_arch_list::from_items(string_list(n, "cuda-architectures"));
        } else {
            ret.cuda_archs = cuda_arch_list::parse(scalar_string(n, "cuda-architectures"));
        }
    }
    if (auto n = doc["policy-version-minimum"]) {
        ret.policy_version_minimum = scalar_string(n, "policy-version-minimum");
    }
    if (auto tools = doc["tools"]) {
        check_keys(tools, "tools", tools_keys);
        if (auto n = tools["generator"]) {
            ret.generator = scalar_string(n, "tools.generator");
        }
        if (auto n = tools["cuda-compiler"]) {
            ret.cuda_compiler = scalar_string(n, "tools.cuda-compiler");
        }
    }
    if (auto defs = doc["definitions"]) {
        if (!defs.IsMap()) {
            throw_bad_project("Expected a mapping for 'definitions'");
        }
        for (auto&& pair : defs) {
            auto key = key_string(pair.first, "definitions");
            ret.definitions.emplace_back(key, scalar_string(pair.second, "definitions." + key));
        }
    }
    if (auto summary = doc["summary"]) {
        check_keys(summary, "summary", summary_keys);
        if (auto n = summary["library-dir"]) {
            ret.summary.library_dir = scalar_string(n, "summary.library-dir");
        }
        if (auto n = summary["examples-dir"]) {
            ret.summary.examples_dir = scalar_string(n, "summary.examples-dir");
        }
        if (auto n = summary["tests-dir"]) {
            ret.summary.tests_dir = scalar_string(n, "summary.tests-dir");
        }
        if (auto n = summary["test-binaries"]) {
            ret.summary.test_binaries = string_list(n, "summary.test-binaries");
        }
    }
    return ret;
}

project_settings project_settings::from_yaml_string(std::string_view content) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(content));
    } catch (const YAML::Exception& exc) {
        BOOST_LEAF_THROW_EXCEPTION(std::runtime_error(exc.what()),
                                   errc::invalid_project_file,
                                   e_human_message{"The project settings are not valid YAML"},
                                   e_yaml_parse_error{exc.what()});
    }
    return from_yaml(doc);
}

project_settings project_settings::load_file(path_ref filepath) {
    CUBUILD_E_SCOPE(e_project_file_path{filepath});
    cubuild_log(debug, "Loading project settings from [{}]", filepath.string());
    std::string content;
    try {
        content = read_file(filepath);
    } catch (const std::system_error& exc) {
        BOOST_LEAF_THROW_EXCEPTION(std::runtime_error(exc.what()),
                                   errc::invalid_project_file,
                                   e_human_message{neo::ufmt("Failed to read the settings file: {}",
                                                             exc.code().message())});
    }
    return from_yaml_string(content);
}

project_settings project_settings::load_for(path_ref                       source_dir,
                                            const std::optional<fs::path>& explicit_file) {
    if (explicit_file) {
        return load_file(*explicit_file);
    }
    auto default_file = source_dir / default_filename;
    std::error_code ec;
    if (!fs::is_regular_file(default_file, ec)) {
        cubuild_log(trace, "No project settings file at [{}]", default_file.string());
        return {};
    }
    return load_file(default_file);
}
