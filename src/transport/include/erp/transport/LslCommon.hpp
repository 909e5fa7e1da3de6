/**
 * @file LslCommon.hpp
 * @brief Shared types of the Lab Streaming Layer wrappers.
 *
 * @see https://labstreaminglayer.readthedocs.io/
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_LSL_COMMON_HPP
    #define ERP_TRANSPORT_LSL_COMMON_HPP

    #include "erp/core/Types.hpp"
    #include "erp/transport/TimeCorrection.hpp"

    #include <string>
    #include <vector>

namespace erp::transport {

/**
 * @brief Inlet resolution parameters. Names are tried in order.
 */
struct LslInletConfig {
    std::vector<std::string> streamNames;
    core::SourceId source = 0;           ///< clock identifier handed to the reconciler
    core::f64 resolveTimeoutSec = 5.0;
    core::f64 correctionTimeoutSec = 2.0;
};

/** @brief The LSL local clock, the pipeline's reference time in the live apps. */
[[nodiscard]] core::Seconds localClock() noexcept;

} // namespace erp::transport

#endif // ERP_TRANSPORT_LSL_COMMON_HPP
