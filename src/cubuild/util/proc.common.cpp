#include "./proc.hpp"

#include <cubuild/util/env.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/string.hpp>

#include <algorithm>
#include <cctype>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace cubuild;

bool cubuild::needs_quoting(std::string_view s) {
    // Punctuation that a POSIX shell passes through unchanged
    constexpr std::string_view plain_punct = "@%-+=:,./_";
    return s.empty() || std::ranges::any_of(s, [&](char c) {
               return !std::isalnum(static_cast<unsigned char>(c)) && !contains(plain_punct, {&c, 1});
           });
}

std::string cubuild::quote_argument(std::string_view s) {
    if (!needs_quoting(s)) {
        return std::string(s);
    }
    std::string ret = "\"";
    for (char c : s) {
        if (c == '\\' || c == '"') {
            ret.push_back('\\');
        }
        ret.push_back(c);
    }
    ret.push_back('"');
    return ret;
}

static bool is_executable_file(path_ref candidate) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
        return false;
    }
#ifndef _WIN32
    return ::access(candidate.c_str(), X_OK) == 0;
#else
    return true;
#endif
}

std::optional<fs::path> cubuild::find_executable(std::string_view name,
                                                 std::string_view search_path) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (contains(name, "/")) {
        cubuild_log(trace, "Checking for executable file [{}]", name);
        if (is_executable_file(fs::path(name))) {
            return fs::path(name);
        }
        return std::nullopt;
    }
    for (auto& dir : split(search_path, ':')) {
        // An empty PATH element means the working directory
        auto candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        cubuild_log(trace, "Looking for [{}] as [{}]", name, candidate.string());
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

proc_result system_process_runner::run(const proc_options& opts) { return run_proc(opts); }

std::optional<fs::path> system_process_runner::find_program(std::string_view name) {
    auto path_env = cubuild::getenv(env_vars::search_path).value_or("");
    return find_executable(name, path_env);
}
