/**
 * @file EpochExtractor.cpp
 * @brief Copy of a buffer slice into a fixed-shape epoch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/epoch/EpochExtractor.hpp"

#include <algorithm>
#include <sstream>

namespace erp::epoch {

EpochExtractor::EpochExtractor(const buffer::SampleRingBuffer &buffer, ExtractorConfig config)
    : _buffer(buffer), _config(config)
{
}

core::Expected<Epoch> EpochExtractor::extract(core::Seconds anchorTime, core::u64 eventId) const
{
    const auto &geo = _config.geometry;
    const core::Seconds start = windowStart(anchorTime);
    const core::Seconds end = windowEnd(anchorTime);

    if (_buffer.channelCount() != geo.channelCount)
        return core::makeError(core::ErrorCode::kChannelCountMismatch,
            "buffer and epoch geometry disagree on the channel count");

    auto slice = _buffer.slice(start, end);
    if (!slice)
        return std::unexpected(slice.error().toError());

    const auto &samples = *slice;
    const core::usize expected = geo.expectedSamples();

    // The slice is inclusive at both ends; the epoch is [start, end).
    const core::Seconds halfOpenEnd = end - 1e-3 / geo.sampleRate;
    core::usize observed = 0;
    while (observed < samples.size() && samples[observed].timestamp < halfOpenEnd)
        ++observed;

    const core::usize deviation = observed > expected ? observed - expected : expected - observed;
    const bool exceeded = deviation > _config.jitterToleranceSamples;

    if (exceeded && _config.jitterPolicy == JitterPolicy::kReject)
    {
        std::ostringstream os;
        os << "epoch at " << anchorTime << " holds " << observed << " samples, expected "
           << expected << " +/- " << _config.jitterToleranceSamples;
        return core::makeError(core::ErrorCode::kJitterExceeded, os.str());
    }

    if (samples.empty())
        return core::makeError(core::ErrorCode::kEmptyInput, "covered window holds no sample");

    Epoch epoch;
    epoch.eventId = eventId;
    epoch.anchorTime = anchorTime;
    epoch.firstSampleTime = samples.front().timestamp;
    epoch.startOffset = geo.baselineStart;
    epoch.sampleRate = geo.sampleRate;
    epoch.observedSamples = observed;
    epoch.expectedSamples = expected;
    epoch.jitterExceeded = exceeded;
    epoch.data.resize(static_cast<Eigen::Index>(geo.channelCount), static_cast<Eigen::Index>(expected));

    for (core::usize col = 0; col < expected; ++col)
    {
        const auto &sample = samples[std::min(col, samples.size() - 1)];
        for (core::usize ch = 0; ch < geo.channelCount; ++ch)
            epoch.data(static_cast<Eigen::Index>(ch), static_cast<Eigen::Index>(col)) = sample.values[ch];
    }

    return epoch;
}

} // namespace erp::epoch
