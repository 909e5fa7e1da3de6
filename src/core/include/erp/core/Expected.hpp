/**
 * @file Expected.hpp
 * @brief Result type of every fallible ErpSync operation.
 *
 * Ingestion, extraction, scoring and publishing return Expected<T> instead
 * of throwing; the acquisition and polling threads must keep running after
 * a refused sample or an abandoned event. Callers branch on the ErrorCode:
 * kRangeUnavailable and kUncalibrated mean "not yet" and are retried by
 * the synchronizer, every other code is final for the item concerned.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_CORE_EXPECTED_HPP
    #define ERP_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace erp::core {

/** @brief A value of type @p T, or the Error that prevented it. */
template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

/**
 * @brief True when @p result holds an error with code @p code.
 *
 * @code
 *   auto epoch = extractor.extract(anchor);
 *   if (failedWith(epoch, ErrorCode::kRangeUnavailable))
 *       return; // trailing samples not buffered yet
 * @endcode
 */
template <typename T>
[[nodiscard]] constexpr bool failedWith(const Expected<T> &result, ErrorCode code) noexcept
{
    return !result.has_value() && result.error().code() == code;
}

/** @brief Conditions that may clear once more samples or clock data arrive. */
[[nodiscard]] constexpr bool isPending(ErrorCode code) noexcept
{
    return code == ErrorCode::kRangeUnavailable || code == ErrorCode::kUncalibrated;
}

} // namespace erp::core

/**
 * @brief Yields the value of an Expected expression, or returns its error
 *        from the enclosing function.
 *
 * Relies on the GNU statement-expression extension (GCC and Clang).
 */
#define ERP_TRY(expr)                                                   \
    ({                                                                   \
        auto &&_erp_tried = (expr);                                      \
        if (!_erp_tried.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_erp_tried.error()));       \
        std::move(_erp_tried.value());                                   \
    })

/** @brief ERP_TRY for ExpectedVoid expressions. */
#define ERP_TRY_VOID(expr)                                              \
    do {                                                                 \
        if (auto &&_erp_tried = (expr); !_erp_tried.has_value()) [[unlikely]] \
            return std::unexpected(std::move(_erp_tried.error()));       \
    } while (false)

#endif // ERP_CORE_EXPECTED_HPP
