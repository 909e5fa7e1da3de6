/**
 * @file EventSynchronizer.cpp
 * @brief Pending-event state machine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/sync/EventSynchronizer.hpp"

#include "erp/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace erp::sync {

EventSynchronizer::EventSynchronizer(const ClockReconciler &clock, const epoch::EpochExtractor &extractor,
                                     SynchronizerConfig config)
    : _clock(clock), _extractor(extractor), _config(config)
{
}

core::ExpectedVoid EventSynchronizer::validate(const SynchronizerConfig &config,
                                               const epoch::EpochGeometry &geometry)
{
    if (!std::isfinite(config.timeoutSec) || config.timeoutSec <= geometry.epochEnd())
        return core::makeError(core::ErrorCode::kInvalidConfig,
            "event timeout must exceed the epoch end");
    if (config.uncalibratedPolicy == UncalibratedPolicy::kBuffer && config.maxDeferredEvents == 0)
        return core::makeError(core::ErrorCode::kInvalidConfig,
            "buffering uncalibrated events needs a positive capacity");
    return {};
}

// ---- Event path ----

core::Expected<core::u64> EventSynchronizer::submit(core::SourceId source, const StimulusEvent &event,
                                                    core::Seconds receivedAt)
{
    if (_closed.load(std::memory_order_acquire))
        return core::makeError(core::ErrorCode::kShutdown, "synchronizer closed");
    if (event.identifier.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "event without identifier");
    if (!std::isfinite(event.timestamp) || !std::isfinite(receivedAt))
        return core::makeError(core::ErrorCode::kInvalidArgument, "event timestamp is not finite");

    std::lock_guard lock{_mutex};

    if (event.kind == StimulusKind::kTargetSet)
    {
        _focus = event.identifier;
        core::Log::info("Sync", "focus set to " + event.identifier);
        return _nextId++;
    }

    PendingEvent pending;
    pending.source = source;
    pending.event = event;
    pending.receivedAt = receivedAt;
    pending.isTarget = _focus.has_value() && *_focus == event.identifier;

    if (auto local = _clock.translate(source, event.timestamp))
    {
        pending.localTime = *local;
        pending.deadline = *local + _config.timeoutSec;
        pending.state = EventState::kAwaitingWindow;
    }
    else
    {
        if (_config.uncalibratedPolicy == UncalibratedPolicy::kReject)
            return std::unexpected(std::move(local.error()));

        const auto deferred = std::count_if(_pending.begin(), _pending.end(),
            [](const PendingEvent &p) { return p.state == EventState::kReceived; });
        if (static_cast<core::usize>(deferred) >= _config.maxDeferredEvents)
            return core::makeError(core::ErrorCode::kCapacityExceeded,
                "too many events waiting for clock calibration");

        pending.deadline = receivedAt + _config.timeoutSec;
        pending.state = EventState::kReceived;
    }

    pending.id = _nextId++;
    _pending.push_back(pending);
    return pending.id;
}

// ---- Readiness poll ----

PollReport EventSynchronizer::poll(core::Seconds now)
{
    PollReport report;
    std::lock_guard pollLock{_pollMutex};

    // Clock translation under _mutex, extraction without it.
    std::vector<PendingEvent> awaiting;
    {
        std::lock_guard lock{_mutex};
        for (auto it = _pending.begin(); it != _pending.end();)
        {
            if (resolveClockLocked(*it, now, report))
            {
                it = _pending.erase(it);
                continue;
            }
            if (it->state == EventState::kAwaitingWindow)
                awaiting.push_back(*it);
            ++it;
        }
    }

    std::vector<core::u64> finished;
    PollReport extracted;
    for (auto &pending : awaiting)
    {
        if (extractWindow(pending, now, extracted))
            finished.push_back(pending.id);
    }
    if (finished.empty())
        return report;

    std::lock_guard lock{_mutex};
    const auto stillPending = [this](core::u64 id) {
        const auto it = std::find_if(_pending.begin(), _pending.end(),
            [id](const PendingEvent &p) { return p.id == id; });
        if (it == _pending.end())
            return false;
        _pending.erase(it);
        return true;
    };
    // Events abandoned while extracting were already reported by abandonAll().
    for (auto &ready : extracted.ready)
    {
        if (stillPending(ready.event.id))
            report.ready.push_back(std::move(ready));
    }
    for (auto &dropped : extracted.dropped)
    {
        if (stillPending(dropped.event.id))
            report.dropped.push_back(std::move(dropped));
    }
    return report;
}

bool EventSynchronizer::resolveClockLocked(PendingEvent &pending, core::Seconds now, PollReport &report)
{
    if (pending.state != EventState::kReceived)
        return false;

    auto local = _clock.translate(pending.source, pending.event.timestamp);
    if (!local)
    {
        if (now < pending.deadline)
            return false;
        pending.state = EventState::kTimedOut;
        report.dropped.push_back({pending, core::Error{core::ErrorCode::kUncalibrated,
            "clock of source " + std::to_string(pending.source) + " never calibrated"}});
        return true;
    }
    pending.localTime = *local;
    pending.deadline = *local + _config.timeoutSec;
    pending.state = EventState::kAwaitingWindow;
    return false;
}

bool EventSynchronizer::extractWindow(PendingEvent &pending, core::Seconds now, PollReport &report) const
{
    auto epoch = _extractor.extract(pending.localTime, pending.id);
    if (epoch)
    {
        pending.state = EventState::kReady;
        report.ready.push_back({pending, std::move(*epoch)});
        report.ready.back().event.state = EventState::kCompleted;
        return true;
    }

    if (core::failedWith(epoch, core::ErrorCode::kRangeUnavailable))
    {
        if (now < pending.deadline)
            return false;

        std::ostringstream os;
        os << "window of '" << pending.event.identifier << "' at " << pending.localTime
           << " not covered after " << _config.timeoutSec << " s: " << epoch.error().message();
        pending.state = EventState::kTimedOut;
        report.dropped.push_back({pending, core::Error{core::ErrorCode::kEpochTimeout, os.str()}});
        return true;
    }

    pending.state = EventState::kTimedOut;
    report.dropped.push_back({pending, std::move(epoch.error())});
    return true;
}

std::vector<DroppedEvent> EventSynchronizer::abandonAll(std::string_view reason)
{
    std::vector<DroppedEvent> dropped;

    std::lock_guard lock{_mutex};
    dropped.reserve(_pending.size());
    for (auto &pending : _pending)
    {
        pending.state = EventState::kTimedOut;
        dropped.push_back({pending, core::Error{core::ErrorCode::kShutdown, std::string(reason)}});
    }
    _pending.clear();
    return dropped;
}

// ---- State ----

void EventSynchronizer::close() noexcept
{
    _closed.store(true, std::memory_order_release);
}

bool EventSynchronizer::isClosed() const noexcept
{
    return _closed.load(std::memory_order_acquire);
}

void EventSynchronizer::setFocus(std::string identifier)
{
    std::lock_guard lock{_mutex};
    _focus = std::move(identifier);
}

void EventSynchronizer::clearFocus()
{
    std::lock_guard lock{_mutex};
    _focus.reset();
}

std::optional<std::string> EventSynchronizer::focus() const
{
    std::lock_guard lock{_mutex};
    return _focus;
}

core::usize EventSynchronizer::pendingCount() const
{
    std::lock_guard lock{_mutex};
    return _pending.size();
}

core::usize EventSynchronizer::deferredCount() const
{
    std::lock_guard lock{_mutex};
    return static_cast<core::usize>(std::count_if(_pending.begin(), _pending.end(),
        [](const PendingEvent &p) { return p.state == EventState::kReceived; }));
}

} // namespace erp::sync
