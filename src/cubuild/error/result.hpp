#pragma once

#include "./result_fwd.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/on_error.hpp>
#include <boost/leaf/pred.hpp>
#include <boost/leaf/result.hpp>
#include <neo/pp.hpp>

namespace cubuild {

using boost::leaf::new_error;

/**
 * @brief Match an error value (usually a cubuild::errc) in a leaf handler.
 */
template <auto Val>
using matchv = boost::leaf::match<decltype(Val), Val>;

}  // namespace cubuild

/**
 * @brief Attach the given expression to any error that leaves the enclosing scope, whether by
 * exception or by a bad result<>. The expression is only evaluated if such an error occurs.
 */
#define CUBUILD_E_SCOPE(...)                                                                       \
    auto NEO_CONCAT(_cubuild_e_scope_, __LINE__)                                                   \
        = ::boost::leaf::on_error([&] { return __VA_ARGS__; })
