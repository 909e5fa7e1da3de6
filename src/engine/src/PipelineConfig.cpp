/**
 * @file PipelineConfig.cpp
 * @brief PipelineConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/engine/PipelineConfig.hpp"

#include "erp/core/Log.hpp"

#include <cmath>

namespace erp::engine {

using Builder = PipelineConfig::Builder;

// ---- Acquisition ----

Builder &Builder::sampleRate(core::f64 hz) noexcept
{
    _sampleRate = hz;
    return *this;
}

Builder &Builder::channelCount(core::usize n) noexcept
{
    _channelCount = n;
    return *this;
}

Builder &Builder::channelNames(std::vector<std::string> names)
{
    _channelNames = std::move(names);
    return *this;
}

Builder &Builder::retention(core::Seconds seconds) noexcept
{
    _retention = seconds;
    return *this;
}

Builder &Builder::outOfOrderTolerance(core::Seconds seconds) noexcept
{
    _outOfOrder = seconds;
    return *this;
}

// ---- Epoch geometry ----

Builder &Builder::baselineWindow(core::Seconds start, core::Seconds end) noexcept
{
    _baselineStart = start;
    _baselineEnd = end;
    return *this;
}

Builder &Builder::epochLength(core::Seconds seconds) noexcept
{
    _epochLength = seconds;
    return *this;
}

Builder &Builder::responseWindow(core::Seconds start, core::Seconds end) noexcept
{
    _responseStart = start;
    _responseEnd = end;
    return *this;
}

Builder &Builder::jitterTolerance(core::usize samples) noexcept
{
    _jitterTolerance = samples;
    return *this;
}

Builder &Builder::jitterPolicy(epoch::JitterPolicy policy) noexcept
{
    _jitterPolicy = policy;
    return *this;
}

// ---- Filtering ----

Builder &Builder::passband(core::f64 lowHz, core::f64 highHz) noexcept
{
    _bandLow = lowHz;
    _bandHigh = highHz;
    return *this;
}

Builder &Builder::filterOrder(core::usize order) noexcept
{
    _filterOrder = order;
    return *this;
}

Builder &Builder::notch(core::f64 hz, core::f64 q) noexcept
{
    _notchHz = hz;
    _notchQ = q;
    return *this;
}

// ---- Detection ----

Builder &Builder::responseTemplate(core::Seconds latency, core::Seconds width) noexcept
{
    _templateLatency = latency;
    _templateWidth = width;
    return *this;
}

Builder &Builder::amplitudeThreshold(core::f64 microvolts) noexcept
{
    _amplitudeThreshold = microvolts;
    return *this;
}

Builder &Builder::scoreWeights(core::f64 amplitude, core::f64 correlation) noexcept
{
    _amplitudeWeight = amplitude;
    _correlationWeight = correlation;
    return *this;
}

Builder &Builder::minConfidence(core::f64 value) noexcept
{
    _minConfidence = value;
    return *this;
}

Builder &Builder::channelWeights(std::vector<core::f64> weights)
{
    _channelWeights = std::move(weights);
    return *this;
}

// ---- Synchronization ----

Builder &Builder::eventTimeout(core::Seconds seconds) noexcept
{
    _eventTimeout = seconds;
    return *this;
}

Builder &Builder::uncalibratedPolicy(sync::UncalibratedPolicy policy) noexcept
{
    _uncalibratedPolicy = policy;
    return *this;
}

Builder &Builder::maxDeferredEvents(core::usize n) noexcept
{
    _maxDeferredEvents = n;
    return *this;
}

Builder &Builder::maxDeferredSamples(core::usize n) noexcept
{
    _maxDeferredSamples = n;
    return *this;
}

Builder &Builder::clockWindow(core::Seconds seconds) noexcept
{
    _clockWindow = seconds;
    return *this;
}

Builder &Builder::clockCorrespondences(core::usize minimum, core::usize maximum) noexcept
{
    _clockMin = minimum;
    _clockMax = maximum;
    return *this;
}

// ---- Scheduling ----

Builder &Builder::pollTick(core::Seconds seconds) noexcept
{
    _pollTick = seconds;
    return *this;
}

Builder &Builder::statusInterval(core::Seconds seconds) noexcept
{
    _statusInterval = seconds;
    return *this;
}

// ---- Build ----

std::vector<std::string> PipelineConfig::defaultChannelNames(core::usize count)
{
    if (count == 1)
        return {"Cz"};

    std::vector<std::string> names;
    names.reserve(count);
    for (core::usize i = 0; i < count; ++i)
        names.push_back("Ch" + std::to_string(i + 1));
    return names;
}

namespace {

core::ExpectedVoid invalid(const std::string &message)
{
    core::Log::error("Pipeline", "invalid configuration: " + message);
    return core::makeError(core::ErrorCode::kInvalidConfig, message);
}

core::ExpectedVoid checked(core::ExpectedVoid status)
{
    if (!status)
        core::Log::error("Pipeline", "invalid configuration: " + status.error().message());
    return status;
}

} // namespace

core::Expected<PipelineConfig> Builder::build() const
{
    PipelineConfig cfg;

    cfg._buffer = buffer::RingBufferConfig{
        .channelCount = _channelCount,
        .sampleRate = _sampleRate,
        .retentionSec = _retention,
        .outOfOrderToleranceSec = _outOfOrder};
    ERP_TRY_VOID(checked(buffer::SampleRingBuffer::validate(cfg._buffer)));

    if (!_channelNames.empty() && _channelNames.size() != _channelCount)
        ERP_TRY_VOID(invalid("channel names count differs from the channel count"));
    cfg._channelNames = _channelNames.empty() ? defaultChannelNames(_channelCount) : _channelNames;

    // Epoch layout.
    auto &geo = cfg._extractor.geometry;
    geo.sampleRate = _sampleRate;
    geo.channelCount = _channelCount;
    geo.baselineStart = _baselineStart;
    geo.baselineEnd = _baselineEnd;
    geo.epochLength = _epochLength;
    geo.responseStart = _responseStart;
    geo.responseEnd = _responseEnd;
    ERP_TRY_VOID(checked(geo.validate()));
    cfg._extractor.jitterToleranceSamples = _jitterTolerance;
    cfg._extractor.jitterPolicy = _jitterPolicy;

    // Clock and pending events.
    cfg._clock = sync::ClockReconcilerConfig{
        .windowSec = _clockWindow,
        .maxCorrespondences = _clockMax,
        .minCorrespondences = _clockMin};
    ERP_TRY_VOID(checked(sync::ClockReconciler::validate(cfg._clock)));

    cfg._synchronizer.timeoutSec = _eventTimeout.value_or(2.0 * _epochLength);
    cfg._synchronizer.uncalibratedPolicy = _uncalibratedPolicy;
    cfg._synchronizer.maxDeferredEvents = _maxDeferredEvents;
    ERP_TRY_VOID(checked(sync::EventSynchronizer::validate(cfg._synchronizer, geo)));

    if (_retention < cfg._synchronizer.timeoutSec - _baselineStart)
        ERP_TRY_VOID(invalid("retention cannot hold an epoch until its event times out"));

    // Preprocessing.
    cfg._preprocessor = dsp::PreprocessorConfig{
        .sampleRate = _sampleRate,
        .bandLowHz = _bandLow,
        .bandHighHz = _bandHigh,
        .filterOrder = _filterOrder,
        .notchHz = _notchHz,
        .notchQ = _notchQ,
        .baselineStart = _baselineStart,
        .baselineEnd = _baselineEnd};
    {
        auto preprocessor = dsp::Preprocessor::create(cfg._preprocessor);
        if (!preprocessor)
            ERP_TRY_VOID(invalid(preprocessor.error().message()));
    }

    // Detection.
    cfg._detector.sampleRate = _sampleRate;
    cfg._detector.responseStart = _responseStart;
    cfg._detector.responseEnd = _responseEnd;
    cfg._detector.templateLatency = _templateLatency;
    cfg._detector.templateWidth = _templateWidth;
    cfg._detector.amplitudeThreshold = _amplitudeThreshold;
    cfg._detector.amplitudeWeight = _amplitudeWeight;
    cfg._detector.correlationWeight = _correlationWeight;
    cfg._detector.minConfidence = _minConfidence;
    if (_channelWeights.empty())
    {
        cfg._detector.channelWeights = detect::ChannelWeights::fromNames(cfg._channelNames);
    }
    else
    {
        if (_channelWeights.size() != _channelCount)
            ERP_TRY_VOID(invalid("channel weights count differs from the channel count"));
        auto weights = detect::ChannelWeights::fromValues(_channelWeights);
        if (!weights)
            ERP_TRY_VOID(invalid(weights.error().message()));
        cfg._detector.channelWeights = std::move(*weights);
    }
    {
        auto detector = detect::Detector::create(cfg._detector);
        if (!detector)
            ERP_TRY_VOID(invalid(detector.error().message()));
    }

    // Scheduling.
    if (!(_pollTick > 0.0) || !std::isfinite(_pollTick))
        ERP_TRY_VOID(invalid("poll tick must be positive"));
    if (!(_statusInterval >= 0.0) || !std::isfinite(_statusInterval))
        ERP_TRY_VOID(invalid("status interval must be non-negative"));
    cfg._pollTick = _pollTick;
    cfg._statusInterval = _statusInterval;

    const auto retainedSamples = static_cast<core::usize>(std::ceil(_retention * _sampleRate));
    cfg._maxDeferredSamples = _maxDeferredSamples.value_or(retainedSamples);
    if (_uncalibratedPolicy == sync::UncalibratedPolicy::kBuffer && cfg._maxDeferredSamples == 0)
        ERP_TRY_VOID(invalid("buffering uncalibrated samples needs a positive capacity"));

    return cfg;
}

} // namespace erp::engine
