/**
 * @file EpochGeometry.hpp
 * @brief Window layout of an epoch relative to its stimulus.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_EPOCH_EPOCH_GEOMETRY_HPP
    #define ERP_EPOCH_EPOCH_GEOMETRY_HPP

    #include "erp/core/Constants.hpp"
    #include "erp/core/Expected.hpp"

    #include <cmath>

namespace erp::epoch {

/**
 * @brief Epoch layout. Every time is relative to the stimulus, in seconds.
 *
 * The epoch spans [baselineStart, baselineStart + epochLength]. The
 * baseline and response windows must lie inside it.
 */
struct EpochGeometry {
    core::f64 sampleRate = core::kDefaultSampleRate;
    core::usize channelCount = core::kDefaultChannelCount;

    core::Seconds baselineStart = core::kDefaultBaselineStartSec;
    core::Seconds baselineEnd = core::kDefaultBaselineEndSec;
    core::Seconds epochLength = core::kDefaultEpochLengthSec;
    core::Seconds responseStart = core::kDefaultResponseStartSec;
    core::Seconds responseEnd = core::kDefaultResponseEndSec;

    [[nodiscard]] core::Seconds epochEnd() const noexcept { return baselineStart + epochLength; }

    /** @brief Number of columns of every extracted epoch. */
    [[nodiscard]] core::usize expectedSamples() const noexcept
    {
        return static_cast<core::usize>(std::lround(epochLength * sampleRate));
    }

    /**
     * @brief Checks the ordering baselineStart < baselineEnd <= 0 < responseStart
     *        < responseEnd <= epochEnd.
     */
    [[nodiscard]] core::ExpectedVoid validate() const;
};

} // namespace erp::epoch

#endif // ERP_EPOCH_EPOCH_GEOMETRY_HPP
