#pragma once

#include <cubuild/error/result_fwd.hpp>

#include <functional>

namespace cubuild {

/**
 * @brief Invoke `fn`, and translate any error that escapes it into log output, an error marker,
 * and a process exit code.
 *
 * Errors that nobody anticipated are logged with full diagnostics and return 42.
 */
int handle_cli_errors(std::function<result<int>()> fn) noexcept;

}  // namespace cubuild
