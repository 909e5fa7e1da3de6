/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every ErpSync module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_CORE_TYPES_HPP
    #define ERP_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace erp::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/**
 * @brief Identifier of a timestamping clock (one per remote publisher).
 */
using SourceId = u32;

/**
 * @brief Seconds on a monotonic clock, either a source clock or the local
 *        reference clock of a pipeline.
 */
using Seconds = f64;

} // namespace erp::core

#endif // ERP_CORE_TYPES_HPP
