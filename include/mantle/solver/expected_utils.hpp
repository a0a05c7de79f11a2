#pragma once

#include "solver_errors.hpp"
#include <expected>
#include <utility>

namespace mantle::solver {

/**
 * @brief Helpers for std::expected propagation
 *
 * The macros only require the enclosing function to return a std::expected whose error
 * type is constructible from the propagated error.
 */
namespace expected_utils {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   MANTLE_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define MANTLE_TRY_ASSIGN(lhs, expr)                                                          \
    do {                                                                                      \
        auto mantle_try_tmp = (expr);                                                         \
        if (!mantle_try_tmp)                                                                  \
            return std::unexpected(mantle_try_tmp.error());                                   \
        lhs = std::move(mantle_try_tmp.value());                                              \
    } while (0)

/**
 * @brief Void-or-return helper
 *
 * Usage: MANTLE_TRY_VOID(some_void_expected_result);
 */
#define MANTLE_TRY_VOID(expr)                                                                 \
    do {                                                                                      \
        auto mantle_try_tmp_void = (expr);                                                    \
        if (!mantle_try_tmp_void)                                                             \
            return std::unexpected(mantle_try_tmp_void.error());                              \
    } while (0)

} // namespace expected_utils

} // namespace mantle::solver
