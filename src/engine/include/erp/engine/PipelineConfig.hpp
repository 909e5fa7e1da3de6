/**
 * @file PipelineConfig.hpp
 * @brief Pipeline configuration (Builder pattern).
 *
 * Immutable configuration object constructed via a fluent Builder.
 * Centralises every tuneable acquisition, epoch, filter, and detection
 * parameter, and hands each stage the slice it needs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_ENGINE_PIPELINE_CONFIG_HPP
    #define ERP_ENGINE_PIPELINE_CONFIG_HPP

    #include "erp/buffer/SampleRingBuffer.hpp"
    #include "erp/core/Constants.hpp"
    #include "erp/detect/Detector.hpp"
    #include "erp/dsp/Preprocessor.hpp"
    #include "erp/epoch/EpochExtractor.hpp"
    #include "erp/sync/ClockReconciler.hpp"
    #include "erp/sync/EventSynchronizer.hpp"

    #include <optional>
    #include <string>
    #include <vector>

namespace erp::engine {

/** @brief Immutable pipeline configuration. */
class PipelineConfig {
public:
    /** @brief Fluent builder for PipelineConfig. */
    class Builder {
    public:
        Builder &sampleRate(core::f64 hz) noexcept;
        Builder &channelCount(core::usize n) noexcept;
        Builder &channelNames(std::vector<std::string> names);
        Builder &retention(core::Seconds seconds) noexcept;
        Builder &outOfOrderTolerance(core::Seconds seconds) noexcept;

        Builder &baselineWindow(core::Seconds start, core::Seconds end) noexcept;
        Builder &epochLength(core::Seconds seconds) noexcept;
        Builder &responseWindow(core::Seconds start, core::Seconds end) noexcept;
        Builder &jitterTolerance(core::usize samples) noexcept;
        Builder &jitterPolicy(epoch::JitterPolicy policy) noexcept;

        Builder &passband(core::f64 lowHz, core::f64 highHz) noexcept;
        Builder &filterOrder(core::usize order) noexcept;
        Builder &notch(core::f64 hz, core::f64 q = 30.0) noexcept;

        Builder &responseTemplate(core::Seconds latency, core::Seconds width) noexcept;
        Builder &amplitudeThreshold(core::f64 microvolts) noexcept;
        Builder &scoreWeights(core::f64 amplitude, core::f64 correlation) noexcept;
        Builder &minConfidence(core::f64 value) noexcept;
        Builder &channelWeights(std::vector<core::f64> weights);

        Builder &eventTimeout(core::Seconds seconds) noexcept;
        Builder &uncalibratedPolicy(sync::UncalibratedPolicy policy) noexcept;
        Builder &maxDeferredEvents(core::usize n) noexcept;
        Builder &maxDeferredSamples(core::usize n) noexcept;

        Builder &clockWindow(core::Seconds seconds) noexcept;
        Builder &clockCorrespondences(core::usize minimum, core::usize maximum) noexcept;

        Builder &pollTick(core::Seconds seconds) noexcept;
        Builder &statusInterval(core::Seconds seconds) noexcept;

        /**
         * @brief Validates every field and the cross-field constraints.
         * @return The configuration, or kInvalidConfig naming the first violation.
         */
        [[nodiscard]] core::Expected<PipelineConfig> build() const;

    private:
        core::f64 _sampleRate{core::kDefaultSampleRate};
        core::usize _channelCount{core::kDefaultChannelCount};
        std::vector<std::string> _channelNames;
        core::Seconds _retention{core::kDefaultRetentionSec};
        core::Seconds _outOfOrder{core::kDefaultOutOfOrderSec};

        core::Seconds _baselineStart{core::kDefaultBaselineStartSec};
        core::Seconds _baselineEnd{core::kDefaultBaselineEndSec};
        core::Seconds _epochLength{core::kDefaultEpochLengthSec};
        core::Seconds _responseStart{core::kDefaultResponseStartSec};
        core::Seconds _responseEnd{core::kDefaultResponseEndSec};
        core::usize _jitterTolerance{core::kDefaultJitterToleranceSamples};
        epoch::JitterPolicy _jitterPolicy{epoch::JitterPolicy::kFlag};

        core::f64 _bandLow{core::kDefaultBandLowHz};
        core::f64 _bandHigh{core::kDefaultBandHighHz};
        core::usize _filterOrder{core::kDefaultFilterOrder};
        core::f64 _notchHz{0.0};
        core::f64 _notchQ{30.0};

        core::Seconds _templateLatency{core::kDefaultTemplateLatencySec};
        core::Seconds _templateWidth{core::kDefaultTemplateWidthSec};
        core::f64 _amplitudeThreshold{core::kDefaultAmplitudeThresholdUv};
        core::f64 _amplitudeWeight{core::kDefaultAmplitudeWeight};
        core::f64 _correlationWeight{core::kDefaultCorrelationWeight};
        core::f64 _minConfidence{core::kDefaultMinConfidence};
        std::vector<core::f64> _channelWeights;

        std::optional<core::Seconds> _eventTimeout;
        sync::UncalibratedPolicy _uncalibratedPolicy{sync::UncalibratedPolicy::kBuffer};
        core::usize _maxDeferredEvents{core::kDefaultDeferredEvents};
        std::optional<core::usize> _maxDeferredSamples;

        core::Seconds _clockWindow{core::kDefaultClockWindowSec};
        core::usize _clockMin{core::kDefaultClockMinCorrespondences};
        core::usize _clockMax{core::kDefaultClockMaxCorrespondences};

        core::Seconds _pollTick{core::kDefaultPollTickSec};
        core::Seconds _statusInterval{core::kDefaultStatusIntervalSec};
    };

    [[nodiscard]] core::f64 sampleRate() const noexcept { return _buffer.sampleRate; }
    [[nodiscard]] core::usize channelCount() const noexcept { return _buffer.channelCount; }
    [[nodiscard]] const std::vector<std::string> &channelNames() const noexcept { return _channelNames; }
    [[nodiscard]] core::usize maxDeferredSamples() const noexcept { return _maxDeferredSamples; }
    [[nodiscard]] core::Seconds pollTick() const noexcept { return _pollTick; }
    [[nodiscard]] core::Seconds statusInterval() const noexcept { return _statusInterval; }

    [[nodiscard]] const buffer::RingBufferConfig &ringBuffer() const noexcept { return _buffer; }
    [[nodiscard]] const sync::ClockReconcilerConfig &clock() const noexcept { return _clock; }
    [[nodiscard]] const epoch::ExtractorConfig &extractor() const noexcept { return _extractor; }
    [[nodiscard]] const epoch::EpochGeometry &geometry() const noexcept { return _extractor.geometry; }
    [[nodiscard]] const sync::SynchronizerConfig &synchronizer() const noexcept { return _synchronizer; }
    [[nodiscard]] const dsp::PreprocessorConfig &preprocessor() const noexcept { return _preprocessor; }
    [[nodiscard]] const detect::DetectorConfig &detector() const noexcept { return _detector; }

    /** @brief Default names: {"Cz"} for one channel, Ch1..ChN otherwise. */
    [[nodiscard]] static std::vector<std::string> defaultChannelNames(core::usize count);

private:
    PipelineConfig() = default;

    buffer::RingBufferConfig _buffer;
    sync::ClockReconcilerConfig _clock;
    epoch::ExtractorConfig _extractor;
    sync::SynchronizerConfig _synchronizer;
    dsp::PreprocessorConfig _preprocessor;
    detect::DetectorConfig _detector;

    std::vector<std::string> _channelNames;
    core::usize _maxDeferredSamples = 0;
    core::Seconds _pollTick = core::kDefaultPollTickSec;
    core::Seconds _statusInterval = core::kDefaultStatusIntervalSec;
};

} // namespace erp::engine

#endif // ERP_ENGINE_PIPELINE_CONFIG_HPP
