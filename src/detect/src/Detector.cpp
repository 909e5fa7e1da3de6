/**
 * @file Detector.cpp
 * @brief Amplitude and template scoring of preprocessed epochs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/detect/Detector.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace erp::detect {

namespace {

core::usize responseColumns(const DetectorConfig &config)
{
    const auto first = std::lround(config.responseStart * config.sampleRate);
    const auto last = std::lround(config.responseEnd * config.sampleRate);
    return last > first ? static_cast<core::usize>(last - first) : 0;
}

} // namespace

Detector::Detector(DetectorConfig config, ResponseTemplate tpl)
    : _config(std::move(config)), _template(std::move(tpl))
{
}

core::Expected<Detector> Detector::create(DetectorConfig config)
{
    if (!(config.sampleRate > 0.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "sample rate must be positive");
    if (!(config.responseStart >= 0.0) || !(config.responseEnd > config.responseStart))
        return core::makeError(core::ErrorCode::kInvalidConfig, "response window must be a non-empty post-stimulus range");
    if (!(config.amplitudeThreshold > 0.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "amplitude threshold must be positive");
    if (config.amplitudeWeight < 0.0 || config.correlationWeight < 0.0 ||
        config.amplitudeWeight + config.correlationWeight <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "score weights must be non-negative and not all zero");
    if (!(config.minConfidence >= 0.0 && config.minConfidence <= 1.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "min confidence must lie in [0, 1]");

    auto tpl = ERP_TRY(ResponseTemplate::create(config.templateLatency, config.templateWidth, config.responseStart,
                                                config.sampleRate, responseColumns(config)));
    return Detector{std::move(config), std::move(tpl)};
}

core::Expected<DetectionScore> Detector::score(const epoch::Epoch &epoch) const
{
    if (std::abs(epoch.sampleRate - _config.sampleRate) > 1e-9)
        return core::makeError(core::ErrorCode::kInvalidArgument, "epoch sample rate differs from the detector's");
    if (epoch.channelCount() == 0)
        return core::makeError(core::ErrorCode::kEmptyInput, "epoch has no channels");

    const auto &weights = _config.channelWeights;
    if (weights.size() != 0 && weights.size() != epoch.channelCount())
    {
        return core::makeError(core::ErrorCode::kChannelCountMismatch,
                               "epoch has " + std::to_string(epoch.channelCount()) + " channels, weights cover " +
                                   std::to_string(weights.size()));
    }

    const core::usize first = epoch.columnAt(_config.responseStart);
    const core::usize width = _template->size();
    if (first + width > epoch.sampleCount())
        return core::makeError(core::ErrorCode::kOutOfRange, "response window exceeds the epoch");

    DetectionScore result;
    result.channels.reserve(epoch.channelCount());

    core::f64 weightSum = 0.0;
    for (core::usize ch = 0; ch < epoch.channelCount(); ++ch)
    {
        const auto segment = epoch.data.row(static_cast<Eigen::Index>(ch))
                                 .segment(static_cast<Eigen::Index>(first), static_cast<Eigen::Index>(width));

        ChannelScore cs;
        cs.peak = static_cast<core::f64>(segment.maxCoeff());
        cs.correlation = _template->correlate(segment);
        cs.score = std::clamp(_config.amplitudeWeight * cs.peak / _config.amplitudeThreshold +
                                  _config.correlationWeight * cs.correlation,
                              0.0, 1.0);

        const core::f64 w = weights.size() == 0 ? 1.0 : weights[ch];
        result.confidence += w * cs.score;
        result.meanPeak += w * cs.peak;
        result.meanCorrelation += w * cs.correlation;
        weightSum += w;
        result.channels.push_back(cs);
    }

    if (weightSum <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "channel weights sum to zero");

    result.confidence /= weightSum;
    result.meanPeak /= weightSum;
    result.meanCorrelation /= weightSum;
    if (!std::isfinite(result.confidence))
        return core::makeError(core::ErrorCode::kInvalidArgument, "epoch contains non-finite values");
    result.detected = result.confidence >= _config.minConfidence;
    return result;
}

} // namespace erp::detect
