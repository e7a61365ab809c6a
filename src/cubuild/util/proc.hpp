#pragma once

#include <cubuild/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cubuild {

bool needs_quoting(std::string_view);

std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        acc += quote_argument(arg) + " ";
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

struct proc_result {
    int         signal = 0;
    int         retc   = 0;
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0; }
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<fs::path> cwd = std::nullopt;

    /**
     * If true, the child's output is copied to our stdout as it arrives, in addition to being
     * collected in proc_result::output
     */
    bool echo_output = false;
};

proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

/**
 * @brief Search the directories of a PATH-style string for an executable file with the given name.
 *
 * If `name` contains a directory separator, it is checked directly and `search_path` is ignored.
 */
std::optional<fs::path> find_executable(std::string_view name, std::string_view search_path);

/**
 * @brief Abstract interface for spawning subprocesses and locating programs.
 *
 * The build pipeline does all of its process work through this interface.
 */
class process_runner {
public:
    virtual ~process_runner() = default;

    /// Execute a subprocess and wait for it to exit.
    virtual proc_result run(const proc_options& opts) = 0;

    /// Find the named program, as a shell's `command -v` would.
    virtual std::optional<fs::path> find_program(std::string_view name) = 0;
};

/**
 * @brief A process_runner that spawns real processes and searches the PATH environment variable.
 */
class system_process_runner : public process_runner {
public:
    proc_result             run(const proc_options& opts) override;
    std::optional<fs::path> find_program(std::string_view name) override;
};

}  // namespace cubuild
