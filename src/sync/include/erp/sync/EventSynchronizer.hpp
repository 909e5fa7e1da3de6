/**
 * @file EventSynchronizer.hpp
 * @brief Aligns stimulus events with buffered samples and schedules extraction.
 *
 * Each flash event moves through
 *   Received -> AwaitingWindow -> Ready -> Completed
 * or ends in TimedOut. Extraction happens only once the buffer covers the
 * whole epoch window, which lies partly after the event; the synchronizer
 * therefore waits for trailing data instead of assuming it exists.
 *
 * The synchronizer also owns the current focus identifier, set by
 * target_set events and used only to annotate results.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_SYNC_EVENT_SYNCHRONIZER_HPP
    #define ERP_SYNC_EVENT_SYNCHRONIZER_HPP

    #include "erp/core/NonCopyable.hpp"
    #include "erp/epoch/EpochExtractor.hpp"
    #include "erp/sync/ClockReconciler.hpp"
    #include "erp/sync/StimulusEvent.hpp"

    #include <atomic>
    #include <list>
    #include <mutex>
    #include <optional>
    #include <string>
    #include <vector>

namespace erp::sync {

enum class EventState : core::u8 {
    kReceived = 0,   ///< waiting for its source clock to be calibrated
    kAwaitingWindow, ///< local time known, window not covered yet
    kReady,
    kCompleted,
    kTimedOut
};

[[nodiscard]] constexpr std::string_view eventStateName(EventState state) noexcept
{
    switch (state) {
        case EventState::kReceived:       return "Received";
        case EventState::kAwaitingWindow: return "AwaitingWindow";
        case EventState::kReady:          return "Ready";
        case EventState::kCompleted:      return "Completed";
        case EventState::kTimedOut:       return "TimedOut";
    }
    return "Unknown";
}

/**
 * @brief What to do with an event whose source clock is not calibrated yet.
 */
enum class UncalibratedPolicy : core::u8 {
    kBuffer = 0, ///< hold it until calibration or timeout
    kReject      ///< refuse it at submission
};

struct SynchronizerConfig {
    /** Time after the event (local clock) before it is abandoned. */
    core::Seconds timeoutSec = 2.0 * core::kDefaultEpochLengthSec;
    UncalibratedPolicy uncalibratedPolicy = UncalibratedPolicy::kBuffer;
    core::usize maxDeferredEvents = core::kDefaultDeferredEvents;
};

struct PendingEvent {
    core::u64 id = 0;
    core::SourceId source = 0;
    StimulusEvent event;
    core::Seconds receivedAt = 0.0;  ///< local clock
    core::Seconds localTime = 0.0;   ///< valid once past kReceived
    core::Seconds deadline = 0.0;
    bool isTarget = false;           ///< identifier matched the focus at receipt
    EventState state = EventState::kReceived;
};

struct ReadyEpoch {
    PendingEvent event;
    epoch::Epoch epoch;
};

struct DroppedEvent {
    PendingEvent event;
    core::Error reason;
};

/**
 * @brief Outcome of one readiness pass.
 *
 * Ready epochs are listed in event order within one pass, but callers must
 * rely on PendingEvent::id and localTime for ordering.
 */
struct PollReport {
    std::vector<ReadyEpoch> ready;
    std::vector<DroppedEvent> dropped;

    [[nodiscard]] bool empty() const noexcept { return ready.empty() && dropped.empty(); }
};

/**
 * @brief Owner of the pending-event set of one pipeline.
 *
 * submit() and poll() may run on different threads. poll() reads the
 * sample buffer outside the pending-set lock, so submit() only waits for
 * the bookkeeping around an extraction.
 */
class EventSynchronizer final : private core::NonCopyable<EventSynchronizer> {
public:
    EventSynchronizer(const ClockReconciler &clock, const epoch::EpochExtractor &extractor,
                      SynchronizerConfig config);

    [[nodiscard]] static core::ExpectedVoid validate(const SynchronizerConfig &config,
                                                     const epoch::EpochGeometry &geometry);

    /**
     * @brief Accepts one decoded event.
     *
     * target_set updates the focus and completes immediately; flash events
     * join the pending set.
     *
     * @param source     Clock the event timestamp refers to.
     * @param event      Decoded event.
     * @param receivedAt Local time of receipt.
     * @return Identifier assigned to the event, or kUncalibrated (reject
     *         policy), kCapacityExceeded, kInvalidArgument, kShutdown.
     */
    [[nodiscard]] core::Expected<core::u64> submit(core::SourceId source, const StimulusEvent &event,
                                                   core::Seconds receivedAt);

    /**
     * @brief Advances every pending event.
     * @param now Current local time, used for deadlines.
     */
    [[nodiscard]] PollReport poll(core::Seconds now);

    /**
     * @brief Drops every pending event with a kShutdown reason.
     */
    [[nodiscard]] std::vector<DroppedEvent> abandonAll(std::string_view reason);

    /** @brief Stops accepting events. */
    void close() noexcept;
    [[nodiscard]] bool isClosed() const noexcept;

    void setFocus(std::string identifier);
    void clearFocus();
    [[nodiscard]] std::optional<std::string> focus() const;

    [[nodiscard]] core::usize pendingCount() const;
    [[nodiscard]] core::usize deferredCount() const;
    [[nodiscard]] const SynchronizerConfig &config() const noexcept { return _config; }

private:
    /** @return true when the event left the pending set (uncalibrated timeout). */
    bool resolveClockLocked(PendingEvent &pending, core::Seconds now, PollReport &report);
    /** @return true when the event is resolved, ready or dropped. */
    bool extractWindow(PendingEvent &pending, core::Seconds now, PollReport &report) const;

    const ClockReconciler &_clock;
    const epoch::EpochExtractor &_extractor;
    SynchronizerConfig _config;

    mutable std::mutex _mutex;
    std::mutex _pollMutex; ///< serializes poll(), never held by submit()
    std::list<PendingEvent> _pending;
    std::optional<std::string> _focus;
    core::u64 _nextId = 1;
    std::atomic<bool> _closed{false};
};

} // namespace erp::sync

#endif // ERP_SYNC_EVENT_SYNCHRONIZER_HPP
