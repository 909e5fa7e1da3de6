/**
 * @file Pipeline.cpp
 * @brief Pipeline facade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/engine/Pipeline.hpp"

#include "erp/core/Log.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace erp::engine {

namespace {

std::string describe(const sync::PendingEvent &pending)
{
    std::ostringstream os;
    os << "event #" << pending.id << " '" << pending.event.identifier << "'";
    return os.str();
}

} // namespace

struct Pipeline::Impl {
    PipelineConfig config;
    Clock clock;
    std::unique_ptr<publish::IResultPublisher> publisher;

    buffer::SampleRingBuffer buffer;
    sync::ClockReconciler reconciler;
    epoch::EpochExtractor extractor;
    sync::EventSynchronizer synchronizer;
    dsp::Preprocessor preprocessor;
    detect::Detector detector;

    // Samples whose clock was not calibrated yet, in arrival order.
    std::mutex deferredMutex;
    std::deque<std::pair<core::SourceId, buffer::Sample>> deferred;
    std::atomic<core::usize> deferredSize{0};

    std::mutex pollMutex;
    std::mutex observerMutex;
    EpochObserver observer;

    std::mutex wakeMutex;
    std::condition_variable wake;
    bool wakePending = false;
    std::thread worker;
    std::atomic<bool> running{false};

    std::mutex stopMutex;
    std::atomic<bool> acceptingSamples{true};
    std::atomic<bool> stopped{false};
    core::Seconds lastStatus = 0.0;

    struct Counters {
        std::atomic<core::u64> samplesIngested{0};
        std::atomic<core::u64> staleSamples{0};
        std::atomic<core::u64> samplesDeferred{0};
        std::atomic<core::u64> samplesRejected{0};
        std::atomic<core::u64> eventsReceived{0};
        std::atomic<core::u64> eventsRejected{0};
        std::atomic<core::u64> epochsExtracted{0};
        std::atomic<core::u64> jitterFlagged{0};
        std::atomic<core::u64> jitterRejected{0};
        std::atomic<core::u64> timeouts{0};
        std::atomic<core::u64> eventsDropped{0};
        std::atomic<core::u64> detections{0};
        std::atomic<core::u64> resultsPublished{0};
        std::atomic<core::u64> publishFailures{0};
    } counters;

    Impl(PipelineConfig cfg, Clock clk, std::unique_ptr<publish::IResultPublisher> pub, dsp::Preprocessor pre,
         detect::Detector det)
        : config{std::move(cfg)}
        , clock{std::move(clk)}
        , publisher{std::move(pub)}
        , buffer{config.ringBuffer()}
        , reconciler{config.clock()}
        , extractor{buffer, config.extractor()}
        , synchronizer{reconciler, extractor, config.synchronizer()}
        , preprocessor{std::move(pre)}
        , detector{std::move(det)}
    {
    }

    void notify()
    {
        {
            std::lock_guard lock{wakeMutex};
            wakePending = true;
        }
        wake.notify_one();
    }

    core::ExpectedVoid append(core::Seconds localTime, std::span<const core::f32> values)
    {
        auto stored = buffer.ingest(localTime, values);
        if (stored)
        {
            counters.samplesIngested.fetch_add(1, std::memory_order_relaxed);
            return {};
        }
        if (core::failedWith(stored, core::ErrorCode::kStaleSample))
        {
            counters.staleSamples.fetch_add(1, std::memory_order_relaxed);
            core::Log::warn("Buffer", stored.error().message());
        }
        return stored;
    }

    void flushDeferred(core::SourceId source)
    {
        if (deferredSize.load(std::memory_order_acquire) == 0)
            return;

        std::lock_guard lock{deferredMutex};
        for (auto it = deferred.begin(); it != deferred.end();)
        {
            if (it->first != source)
            {
                ++it;
                continue;
            }
            auto local = reconciler.translate(source, it->second.timestamp);
            if (!local)
                break;
            [[maybe_unused]] auto stored = append(*local, it->second.values);
            it = deferred.erase(it);
        }
        deferredSize.store(deferred.size(), std::memory_order_release);
    }

    core::ExpectedVoid defer(core::SourceId source, core::Seconds sourceTime, std::span<const core::f32> values,
                             core::Error reason)
    {
        if (config.synchronizer().uncalibratedPolicy == sync::UncalibratedPolicy::kReject)
        {
            counters.samplesRejected.fetch_add(1, std::memory_order_relaxed);
            return std::unexpected(std::move(reason));
        }

        std::lock_guard lock{deferredMutex};
        if (deferred.size() >= config.maxDeferredSamples())
        {
            deferred.pop_front();
            counters.samplesRejected.fetch_add(1, std::memory_order_relaxed);
        }
        deferred.emplace_back(source, buffer::Sample{sourceTime, std::vector<core::f32>(values.begin(), values.end())});
        deferredSize.store(deferred.size(), std::memory_order_release);
        counters.samplesDeferred.fetch_add(1, std::memory_order_relaxed);
        return {};
    }

    void recordDrop(const sync::DroppedEvent &dropped)
    {
        switch (dropped.reason.code())
        {
        case core::ErrorCode::kEpochTimeout: counters.timeouts.fetch_add(1, std::memory_order_relaxed); break;
        case core::ErrorCode::kJitterExceeded: counters.jitterRejected.fetch_add(1, std::memory_order_relaxed); break;
        default: counters.eventsDropped.fetch_add(1, std::memory_order_relaxed); break;
        }
        core::Log::warn("Sync", describe(dropped.event) + " dropped: " + dropped.reason.format());
    }

    bool score(sync::ReadyEpoch &ready)
    {
        counters.epochsExtracted.fetch_add(1, std::memory_order_relaxed);
        const auto &raw = ready.epoch;
        if (raw.jitterExceeded)
        {
            counters.jitterFlagged.fetch_add(1, std::memory_order_relaxed);
            core::Log::warn("Epoch", describe(ready.event) + ": observed " + std::to_string(raw.observedSamples) +
                                         " samples, expected " + std::to_string(raw.expectedSamples));
        }

        auto processed = preprocessor.process(raw);
        if (!processed)
        {
            counters.eventsDropped.fetch_add(1, std::memory_order_relaxed);
            core::Log::warn("Dsp", describe(ready.event) + ": " + processed.error().format());
            return false;
        }

        auto scored = detector.score(*processed);
        if (!scored)
        {
            counters.eventsDropped.fetch_add(1, std::memory_order_relaxed);
            core::Log::warn("Detect", describe(ready.event) + ": " + scored.error().format());
            return false;
        }

        detect::DetectionResult result;
        result.eventId = ready.event.id;
        result.identifier = ready.event.event.identifier;
        result.timestamp = ready.event.localTime;
        result.sourceTimestamp = ready.event.event.timestamp;
        result.confidence = scored->confidence;
        result.detected = scored->detected;
        result.isTargetHypothesis = ready.event.isTarget;
        result.jitterFlagged = raw.jitterExceeded;

        char confidence[16];
        std::snprintf(confidence, sizeof(confidence), "%.3f", result.confidence);
        if (result.detected)
        {
            counters.detections.fetch_add(1, std::memory_order_relaxed);
            core::Log::info("Detect", "response after '" + result.identifier + "' (confidence " + confidence + ")");
        }
        else
        {
            core::Log::debug("Detect", "no response after '" + result.identifier + "' (confidence " + confidence + ")");
        }

        auto sent = publisher->publish(result);
        if (sent)
        {
            counters.resultsPublished.fetch_add(1, std::memory_order_relaxed);
        }
        else
        {
            counters.publishFailures.fetch_add(1, std::memory_order_relaxed);
            core::Log::warn("Publish", std::string(publisher->name()) + ": " + sent.error().format());
        }

        EpochObserver current;
        {
            std::lock_guard lock{observerMutex};
            current = observer;
        }
        if (current)
            current(EpochRecord{ready.event, raw, *processed, *scored, result});
        return true;
    }

    void workerLoop()
    {
        const auto tick = std::chrono::duration<core::f64>(config.pollTick());
        while (running.load(std::memory_order_acquire))
        {
            {
                std::unique_lock lock{wakeMutex};
                wake.wait_for(lock, tick, [this] { return wakePending || !running.load(std::memory_order_acquire); });
                wakePending = false;
            }
            if (!running.load(std::memory_order_acquire))
                break;
            pollNow(clock());
        }
    }

    core::usize pollNow(core::Seconds now)
    {
        std::lock_guard lock{pollMutex};

        auto report = synchronizer.poll(now);
        for (const auto &dropped : report.dropped)
            recordDrop(dropped);

        core::usize produced = 0;
        for (auto &ready : report.ready)
            produced += score(ready) ? 1 : 0;

        const core::Seconds interval = config.statusInterval();
        if (interval > 0.0 && now - lastStatus >= interval)
        {
            lastStatus = now;
            logStatus();
        }
        return produced;
    }

    PipelineStats snapshot() const
    {
        PipelineStats s;
        s.samplesIngested = counters.samplesIngested.load(std::memory_order_relaxed);
        s.staleSamples = counters.staleSamples.load(std::memory_order_relaxed);
        s.samplesDeferred = counters.samplesDeferred.load(std::memory_order_relaxed);
        s.samplesRejected = counters.samplesRejected.load(std::memory_order_relaxed);
        s.eventsReceived = counters.eventsReceived.load(std::memory_order_relaxed);
        s.eventsRejected = counters.eventsRejected.load(std::memory_order_relaxed);
        s.epochsExtracted = counters.epochsExtracted.load(std::memory_order_relaxed);
        s.jitterFlagged = counters.jitterFlagged.load(std::memory_order_relaxed);
        s.jitterRejected = counters.jitterRejected.load(std::memory_order_relaxed);
        s.timeouts = counters.timeouts.load(std::memory_order_relaxed);
        s.eventsDropped = counters.eventsDropped.load(std::memory_order_relaxed);
        s.detections = counters.detections.load(std::memory_order_relaxed);
        s.resultsPublished = counters.resultsPublished.load(std::memory_order_relaxed);
        s.publishFailures = counters.publishFailures.load(std::memory_order_relaxed);
        s.bufferedSamples = buffer.size();
        s.pendingEvents = synchronizer.pendingCount();
        return s;
    }

    void logStatus() const
    {
        const auto s = snapshot();
        std::ostringstream os;
        os << "buffered=" << s.bufferedSamples << " pending=" << s.pendingEvents << " epochs=" << s.epochsExtracted
           << " detections=" << s.detections << " timeouts=" << s.timeouts << " stale=" << s.staleSamples;
        core::Log::info("Pipeline", os.str());
    }
};

// ---- Construction ----

core::Seconds Pipeline::steadyClock() noexcept
{
    using namespace std::chrono;
    return duration<core::f64>(steady_clock::now().time_since_epoch()).count();
}

core::Expected<std::unique_ptr<Pipeline>> Pipeline::create(PipelineConfig config,
                                                           std::unique_ptr<publish::IResultPublisher> publisher,
                                                           Clock clock)
{
    if (!publisher)
        return core::makeError(core::ErrorCode::kInvalidArgument, "pipeline needs a result publisher");
    if (!clock)
        clock = &Pipeline::steadyClock;

    auto preprocessor = ERP_TRY(dsp::Preprocessor::create(config.preprocessor()));
    auto detector = ERP_TRY(detect::Detector::create(config.detector()));

    auto impl = std::make_unique<Impl>(std::move(config), std::move(clock), std::move(publisher),
                                       std::move(preprocessor), std::move(detector));
    impl->lastStatus = impl->clock();

    std::ostringstream os;
    os << impl->config.channelCount() << " channels at " << impl->config.sampleRate() << " Hz, epoch "
       << impl->config.geometry().expectedSamples() << " samples, publishing to " << impl->publisher->name();
    core::Log::info("Pipeline", os.str());

    return std::unique_ptr<Pipeline>(new Pipeline(std::move(impl)));
}

Pipeline::Pipeline(std::unique_ptr<Impl> impl) : _impl{std::move(impl)} {}

Pipeline::~Pipeline()
{
    if (_impl)
        stop();
}

// ---- Ingestion path ----

core::ExpectedVoid Pipeline::ingestSample(core::SourceId source, core::Seconds sourceTime,
                                          std::span<const core::f32> values)
{
    if (!_impl->acceptingSamples.load(std::memory_order_acquire))
        return core::makeError(core::ErrorCode::kShutdown, "pipeline stopped");

    auto local = _impl->reconciler.translate(source, sourceTime);
    if (!local)
        return _impl->defer(source, sourceTime, values, std::move(local.error()));

    _impl->flushDeferred(source);
    ERP_TRY_VOID(_impl->append(*local, values));
    _impl->notify();
    return {};
}

core::Expected<core::usize> Pipeline::ingestSamples(core::SourceId source, std::span<const buffer::Sample> samples)
{
    core::usize accepted = 0;
    for (const auto &sample : samples)
    {
        if (!_impl->acceptingSamples.load(std::memory_order_acquire))
            return core::makeError(core::ErrorCode::kShutdown, "pipeline stopped");

        auto local = _impl->reconciler.translate(source, sample.timestamp);
        if (!local)
        {
            if (_impl->defer(source, sample.timestamp, sample.values, std::move(local.error())))
                ++accepted;
            continue;
        }
        _impl->flushDeferred(source);
        if (_impl->append(*local, sample.values))
            ++accepted;
    }
    if (accepted > 0)
        _impl->notify();
    return accepted;
}

core::ExpectedVoid Pipeline::observeClock(core::SourceId source, core::Seconds sourceTime, core::Seconds localTime)
{
    ERP_TRY_VOID(_impl->reconciler.update(source, sourceTime, localTime));
    _impl->flushDeferred(source);
    _impl->notify();
    return {};
}

// ---- Event path ----

core::Expected<core::u64> Pipeline::submitEvent(core::SourceId source, const sync::StimulusEvent &event)
{
    auto id = _impl->synchronizer.submit(source, event, _impl->clock());
    if (!id)
    {
        _impl->counters.eventsRejected.fetch_add(1, std::memory_order_relaxed);
        core::Log::warn("Sync", "event '" + event.identifier + "' refused: " + id.error().format());
        return id;
    }

    _impl->counters.eventsReceived.fetch_add(1, std::memory_order_relaxed);
    if (event.kind == sync::StimulusKind::kFlash)
        _impl->notify();
    return id;
}

// ---- Readiness poll ----

core::usize Pipeline::pollOnce(core::Seconds now)
{
    return _impl->pollNow(now);
}

core::usize Pipeline::pollOnce()
{
    return _impl->pollNow(_impl->clock());
}

core::ExpectedVoid Pipeline::start()
{
    if (_impl->stopped.load(std::memory_order_acquire))
        return core::makeError(core::ErrorCode::kShutdown, "pipeline stopped");
    if (_impl->running.exchange(true, std::memory_order_acq_rel))
        return core::makeError(core::ErrorCode::kInvalidState, "pipeline already running");

    _impl->worker = std::thread([this] { _impl->workerLoop(); });
    core::Log::info("Pipeline", "worker started");
    return {};
}

void Pipeline::stop(core::Seconds drainTimeout)
{
    std::lock_guard stopLock{_impl->stopMutex};
    if (_impl->stopped.load(std::memory_order_acquire))
        return;

    _impl->synchronizer.close();

    if (_impl->running.exchange(false, std::memory_order_acq_rel))
    {
        _impl->notify();
        if (_impl->worker.joinable())
            _impl->worker.join();
    }

    using SteadyClock = std::chrono::steady_clock;
    const auto tick = std::chrono::duration<core::f64>(_impl->config.pollTick());
    const auto deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(
                                                   std::chrono::duration<core::f64>(drainTimeout));
    while (_impl->synchronizer.pendingCount() > 0 && SteadyClock::now() < deadline)
    {
        _impl->pollNow(_impl->clock());
        std::this_thread::sleep_for(tick);
    }

    _impl->acceptingSamples.store(false, std::memory_order_release);
    _impl->pollNow(_impl->clock());
    for (const auto &dropped : _impl->synchronizer.abandonAll("pipeline stopped"))
        _impl->recordDrop(dropped);

    {
        std::lock_guard lock{_impl->deferredMutex};
        _impl->deferred.clear();
        _impl->deferredSize.store(0, std::memory_order_release);
    }
    _impl->logStatus();
    _impl->buffer.release();
    _impl->stopped.store(true, std::memory_order_release);
    core::Log::info("Pipeline", "stopped");
}

bool Pipeline::isRunning() const noexcept
{
    return _impl->running.load(std::memory_order_acquire);
}

bool Pipeline::isStopped() const noexcept
{
    return _impl->stopped.load(std::memory_order_acquire);
}

// ---- Observation ----

void Pipeline::setEpochObserver(EpochObserver observer)
{
    std::lock_guard lock{_impl->observerMutex};
    _impl->observer = std::move(observer);
}

PipelineStats Pipeline::stats() const
{
    return _impl->snapshot();
}

std::optional<std::string> Pipeline::focus() const
{
    return _impl->synchronizer.focus();
}

const PipelineConfig &Pipeline::config() const noexcept
{
    return _impl->config;
}

const sync::ClockReconciler &Pipeline::clock() const noexcept
{
    return _impl->reconciler;
}

const buffer::SampleRingBuffer &Pipeline::buffer() const noexcept
{
    return _impl->buffer;
}

void Pipeline::logStatus() const
{
    _impl->logStatus();
}

} // namespace erp::engine
