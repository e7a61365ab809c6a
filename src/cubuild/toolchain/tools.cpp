#include "./tools.hpp"

#include <cubuild/build/config.hpp>
#include <cubuild/error/errors.hpp>
#include <cubuild/error/result.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/proc.hpp>
#include <cubuild/util/string.hpp>

#include <neo/ufmt.hpp>

#include <algorithm>

using namespace cubuild;

namespace {

result<fs::path> locate_one(std::string_view name, process_runner& runner) {
    cubuild_log(trace, "Searching for program [{}]", name);
    auto found = runner.find_program(name);
    if (!found) {
        return new_error(errc::missing_tool,
                         e_missing_tool{std::string(name)},
                         e_human_message{
                             neo::ufmt("Required program '{}' was not found on the PATH", name)});
    }
    cubuild_log(debug, "Found [{}] at [{}]", name, found->string());
    return *found;
}

std::optional<std::string> run_version(path_ref exe, process_runner& runner) {
    auto res = runner.run(proc_options{.command = {exe.string(), "--version"}});
    if (!res.okay()) {
        cubuild_log(debug,
                    "Version query [{}] failed with exit {}, signal {}:\n{}",
                    exe.string(),
                    res.retc,
                    res.signal,
                    res.output);
        return std::nullopt;
    }
    return std::move(res.output);
}

}  // namespace

result<located_tools> cubuild::locate_tools(const tool_names& names, process_runner& runner) {
    BOOST_LEAF_AUTO(generator, locate_one(names.generator, runner));
    BOOST_LEAF_AUTO(cuda_compiler, locate_one(names.cuda_compiler, runner));
    return located_tools{
        .generator     = std::move(generator),
        .cuda_compiler = std::move(cuda_compiler),
    };
}

std::optional<std::string> cubuild::query_generator_version(path_ref cmake,
                                                            process_runner& runner) {
    auto out = run_version(cmake, runner);
    if (!out) {
        return std::nullopt;
    }
    auto lines = split_lines(*out);
    auto first = std::ranges::find_if(lines, [](auto&& l) { return !trim_view(l).empty(); });
    if (first == lines.end()) {
        return std::nullopt;
    }
    return std::string(trim_view(*first));
}

std::optional<std::string> cubuild::query_cuda_version(path_ref nvcc, process_runner& runner) {
    auto out = run_version(nvcc, runner);
    if (!out) {
        return std::nullopt;
    }
    for (auto&& line : split_lines(*out)) {
        if (contains(line, "release")) {
            return std::string(trim_view(line));
        }
    }
    return std::nullopt;
}

void cubuild::log_tool_versions(const located_tools& tools, process_runner& runner) {
    try {
        if (auto v = query_generator_version(tools.generator, runner)) {
            cubuild_log(info, "Generator: {}", *v);
        } else {
            cubuild_log(warn, "Unable to determine the version of [{}]", tools.generator.string());
        }
        if (auto v = query_cuda_version(tools.cuda_compiler, runner)) {
            cubuild_log(info, "CUDA compiler: {}", *v);
        } else {
            cubuild_log(warn,
                        "Unable to determine the version of [{}]",
                        tools.cuda_compiler.string());
        }
    } catch (const std::system_error& e) {
        cubuild_log(warn, "Failed to query tool versions: {}", e.what());
    }
}
