/**
 * @file LslResolve.hpp
 * @brief Internal helpers shared by the LSL inlets.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_LSL_RESOLVE_HPP
    #define ERP_TRANSPORT_LSL_RESOLVE_HPP

    #include "erp/core/Expected.hpp"
    #include "erp/transport/LslCommon.hpp"

    #include <lsl_cpp.h>

namespace erp::transport::detail {

/** @brief Resolves the first stream whose name matches, trying names in order. */
[[nodiscard]] core::Expected<lsl::stream_info> resolveFirst(const LslInletConfig &config);

/** @brief Queries the inlet's clock offset and turns it into a correspondence. */
[[nodiscard]] core::Expected<TimeCorrection> queryCorrection(lsl::stream_inlet &inlet, core::SourceId source,
                                                             core::f64 timeoutSec);

} // namespace erp::transport::detail

#endif // ERP_TRANSPORT_LSL_RESOLVE_HPP
