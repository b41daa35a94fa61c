#pragma once

/**
 * @file result_helpers.h
 * @brief Early-return macros for Result<T>
 *
 * Example:
 * @code
 * Result<int64_t> allocate(Database& db) {
 *     CFGSTORE_TRY_UNWRAP(stmt, db.prepare(sql));
 *     CFGSTORE_TRY(stmt.bind(1, family));
 *     CFGSTORE_TRY_UNWRAP(hasRow, stmt.step());
 *     return hasRow ? stmt.getInt64(0) : 0;
 * }
 * @endcode
 */

#include <cfgstore/core/types.h>

#include <utility>

/**
 * @def CFGSTORE_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 */
#define CFGSTORE_TRY(expr)                                                                         \
    do {                                                                                           \
        auto _cfgstore_try_result = (expr);                                                        \
        if (!_cfgstore_try_result.has_value()) {                                                   \
            return _cfgstore_try_result.error();                                                   \
        }                                                                                          \
    } while (0)

/**
 * @def CFGSTORE_TRY_UNWRAP(var, expr)
 * @brief Declare and initialize variable from Result, returning error if failed
 *
 * @note Introduces `var` in the current scope; not usable as a single-statement body.
 */
#define CFGSTORE_TRY_UNWRAP(var, expr)                                                             \
    auto _cfgstore_res_##var = (expr);                                                             \
    if (!_cfgstore_res_##var.has_value()) {                                                        \
        return _cfgstore_res_##var.error();                                                        \
    }                                                                                              \
    auto var = std::move(_cfgstore_res_##var).value()

namespace cfgstore {

/**
 * @brief Handle error case with a fallback function
 *
 * If the result contains a value, returns it unchanged; otherwise calls the
 * handler with the error to produce a value.
 */
template <typename T, typename Handler> T or_else(Result<T>&& result, Handler&& handler) {
    if (result.has_value()) {
        return std::move(result).value();
    }
    return handler(result.error());
}

/**
 * @brief Prefix the message of an error with context, keeping its code
 */
inline Error withContext(const Error& error, const std::string& context) {
    return Error{error.code, context + ": " + error.message};
}

} // namespace cfgstore
