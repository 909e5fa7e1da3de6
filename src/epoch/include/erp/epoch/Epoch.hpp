/**
 * @file Epoch.hpp
 * @brief Fixed-shape multi-channel block anchored to one stimulus.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_EPOCH_EPOCH_HPP
    #define ERP_EPOCH_EPOCH_HPP

    #include "erp/core/Types.hpp"

    #include <Eigen/Dense>

    #include <algorithm>
    #include <cmath>

namespace erp::epoch {

/** @brief channels x samples, one contiguous row per channel. */
using EpochMatrix = Eigen::Matrix<core::f32, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief An epoch owns a copy of its samples; it never aliases the ring buffer.
 */
struct Epoch {
    core::u64 eventId = 0;
    core::Seconds anchorTime = 0.0;      ///< stimulus time, local clock
    core::Seconds firstSampleTime = 0.0; ///< timestamp of column 0, local clock
    core::Seconds startOffset = 0.0;     ///< column 0 relative to the stimulus
    core::f64 sampleRate = 0.0;

    EpochMatrix data;

    core::usize observedSamples = 0;
    core::usize expectedSamples = 0;
    bool jitterExceeded = false;

    [[nodiscard]] core::usize channelCount() const noexcept { return static_cast<core::usize>(data.rows()); }
    [[nodiscard]] core::usize sampleCount() const noexcept { return static_cast<core::usize>(data.cols()); }

    /** @brief Signed difference between observed and expected sample counts. */
    [[nodiscard]] core::isize jitter() const noexcept
    {
        return static_cast<core::isize>(observedSamples) - static_cast<core::isize>(expectedSamples);
    }

    /**
     * @brief Column index of a time relative to the stimulus, clamped to the epoch.
     */
    [[nodiscard]] core::usize columnAt(core::Seconds relative) const noexcept
    {
        const auto col = std::lround((relative - startOffset) * sampleRate);
        return static_cast<core::usize>(std::clamp<long>(col, 0, static_cast<long>(data.cols())));
    }
};

} // namespace erp::epoch

#endif // ERP_EPOCH_EPOCH_HPP
