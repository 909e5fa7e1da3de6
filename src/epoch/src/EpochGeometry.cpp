/**
 * @file EpochGeometry.cpp
 * @brief Validation of the epoch layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/epoch/EpochGeometry.hpp"

namespace erp::epoch {

core::ExpectedVoid EpochGeometry::validate() const
{
    using core::ErrorCode;
    using core::makeError;

    if (!std::isfinite(sampleRate) || sampleRate <= 0.0)
        return makeError(ErrorCode::kInvalidConfig, "sample rate must be positive");
    if (channelCount == 0)
        return makeError(ErrorCode::kInvalidConfig, "channel count must be positive");
    if (!(baselineStart < baselineEnd))
        return makeError(ErrorCode::kInvalidConfig, "baseline window is empty or reversed");
    if (baselineEnd > 0.0)
        return makeError(ErrorCode::kInvalidConfig, "baseline window must end at or before the stimulus");
    if (!(epochLength > 0.0) || !(epochEnd() > 0.0))
        return makeError(ErrorCode::kInvalidConfig, "epoch must extend past the stimulus");
    if (!(responseStart > 0.0 && responseStart < responseEnd))
        return makeError(ErrorCode::kInvalidConfig, "response window is empty, reversed or before the stimulus");
    if (responseEnd > epochEnd())
        return makeError(ErrorCode::kInvalidConfig, "response window ends after the epoch");
    if (expectedSamples() < 2)
        return makeError(ErrorCode::kInvalidConfig, "epoch holds fewer than two samples");
    return {};
}

} // namespace erp::epoch
