/**
 * @file Pipeline.hpp
 * @brief Event-triggered epoch detection pipeline (Facade pattern).
 *
 * Owns one ring buffer, one clock reconciler, and one pending-event set,
 * and wires them to the extractor, preprocessor, detector, and publisher.
 * Instances share no state with each other.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_ENGINE_PIPELINE_HPP
    #define ERP_ENGINE_PIPELINE_HPP

    #include "erp/core/NonCopyable.hpp"
    #include "erp/engine/PipelineConfig.hpp"
    #include "erp/publish/IResultPublisher.hpp"

    #include <functional>
    #include <memory>
    #include <optional>
    #include <span>
    #include <string>

namespace erp::engine {

/** @brief Counters since construction. */
struct PipelineStats {
    core::u64 samplesIngested = 0;
    core::u64 staleSamples = 0;
    core::u64 samplesDeferred = 0;     ///< held while their clock was uncalibrated
    core::u64 samplesRejected = 0;     ///< refused or dropped while uncalibrated
    core::u64 eventsReceived = 0;
    core::u64 eventsRejected = 0;
    core::u64 epochsExtracted = 0;
    core::u64 jitterFlagged = 0;
    core::u64 jitterRejected = 0;
    core::u64 timeouts = 0;
    core::u64 eventsDropped = 0;       ///< every other abandoned event
    core::u64 detections = 0;          ///< results with detected == true
    core::u64 resultsPublished = 0;
    core::u64 publishFailures = 0;
    core::usize bufferedSamples = 0;
    core::usize pendingEvents = 0;
};

/** @brief Everything known about one scored epoch, handed to the observer. */
struct EpochRecord {
    const sync::PendingEvent &event;
    const epoch::Epoch &raw;
    const epoch::Epoch &processed;
    const detect::DetectionScore &score;
    const detect::DetectionResult &result;
};

class Pipeline final : private core::NonCopyable<Pipeline> {
public:
    /** @brief Local reference clock, in seconds. */
    using Clock = std::function<core::Seconds()>;
    using EpochObserver = std::function<void(const EpochRecord &)>;

    /** @brief Monotonic process clock used when no clock is given. */
    [[nodiscard]] static core::Seconds steadyClock() noexcept;

    /**
     * @brief Builds every stage from @p config.
     * @param publisher Receives every result; must not be null.
     * @param clock     Local reference clock; samples and events are translated onto it.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<Pipeline>> create(
        PipelineConfig config, std::unique_ptr<publish::IResultPublisher> publisher, Clock clock = {});

    ~Pipeline();

    // ---- Ingestion path ----

    /**
     * @brief Translates and appends one sample.
     *
     * Never blocks beyond the buffer's critical section. Stale samples fail
     * with kStaleSample and are counted; samples from an uncalibrated source
     * are deferred or fail with kUncalibrated, per policy.
     */
    [[nodiscard]] core::ExpectedVoid ingestSample(core::SourceId source, core::Seconds sourceTime,
                                                  std::span<const core::f32> values);

    /**
     * @brief Appends a chunk; per-sample failures are counted, not returned.
     * @return Samples accepted (buffered or deferred), or kShutdown.
     */
    [[nodiscard]] core::Expected<core::usize> ingestSamples(core::SourceId source,
                                                            std::span<const buffer::Sample> samples);

    /**
     * @brief Feeds one clock correspondence, then releases samples it calibrates.
     *
     * Released samples are appended on the calling thread; call it from the
     * thread that ingests samples.
     */
    [[nodiscard]] core::ExpectedVoid observeClock(core::SourceId source, core::Seconds sourceTime,
                                                  core::Seconds localTime);

    // ---- Event path ----

    /** @brief Queues one decoded event, stamped as received now. */
    [[nodiscard]] core::Expected<core::u64> submitEvent(core::SourceId source, const sync::StimulusEvent &event);

    // ---- Readiness poll ----

    /**
     * @brief Advances pending events against @p now (local clock) and
     *        scores, publishes, and reports each ready epoch.
     * @return Number of results produced.
     */
    core::usize pollOnce(core::Seconds now);
    core::usize pollOnce();

    /** @brief Runs the poll on a worker woken by ingestion or every poll tick. */
    [[nodiscard]] core::ExpectedVoid start();

    /**
     * @brief Cooperative shutdown.
     *
     * Refuses new events at once, keeps ingesting and polling for up to
     * @p drainTimeout so in-flight epochs can complete, abandons what is
     * still pending, then releases the buffer memory. Idempotent.
     */
    void stop(core::Seconds drainTimeout = 0.0);

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] bool isStopped() const noexcept;

    // ---- Observation ----

    /** @brief Receives every scored epoch; called on the polling thread. */
    void setEpochObserver(EpochObserver observer);

    [[nodiscard]] PipelineStats stats() const;
    [[nodiscard]] std::optional<std::string> focus() const;
    [[nodiscard]] const PipelineConfig &config() const noexcept;
    [[nodiscard]] const sync::ClockReconciler &clock() const noexcept;
    [[nodiscard]] const buffer::SampleRingBuffer &buffer() const noexcept;

    /** @brief Logs one status line at info level. */
    void logStatus() const;

private:
    struct Impl;
    explicit Pipeline(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace erp::engine

#endif // ERP_ENGINE_PIPELINE_HPP
