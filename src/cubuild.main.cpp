#include <cubuild/cli/main.hpp>
#include <cubuild/util/proc.hpp>

#include <clocale>

int main(int argc, char** argv) {
    // Take the character encoding and collation from the environment, as the tools we run do
    std::setlocale(LC_ALL, "");

    cubuild::system_process_runner runner;
    return cubuild::cli::main_fn(argv[0], {argv + 1, argv + argc}, runner);
}
