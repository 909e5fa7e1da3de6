/**
 * @file ClockReconciler.cpp
 * @brief Trailing-window offset and drift fit.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/sync/ClockReconciler.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace erp::sync {

ClockReconciler::ClockReconciler(ClockReconcilerConfig config)
    : _config(config)
{
}

core::ExpectedVoid ClockReconciler::validate(const ClockReconcilerConfig &config)
{
    if (!std::isfinite(config.windowSec) || config.windowSec <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "clock window must be positive");
    if (config.minCorrespondences == 0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "clock needs at least one correspondence");
    if (config.maxCorrespondences < config.minCorrespondences)
        return core::makeError(core::ErrorCode::kInvalidConfig,
            "clock max correspondences below the calibration minimum");
    return {};
}

core::ExpectedVoid ClockReconciler::update(core::SourceId source, core::Seconds sourceTime,
                                           core::Seconds localTime)
{
    if (!std::isfinite(sourceTime) || !std::isfinite(localTime))
        return core::makeError(core::ErrorCode::kInvalidArgument, "non-finite clock correspondence");

    std::lock_guard lock{_mutex};

    auto &state = _sources[source];
    state.newestSource = state.window.empty() ? sourceTime : std::max(state.newestSource, sourceTime);
    state.window.push_back(Correspondence{sourceTime, localTime - sourceTime});

    const core::Seconds horizon = state.newestSource - _config.windowSec;
    while (state.window.size() > 1
        && (state.window.size() > _config.maxCorrespondences || state.window.front().source < horizon))
        state.window.pop_front();

    refit(state);
    return {};
}

core::Expected<core::Seconds> ClockReconciler::translate(core::SourceId source,
                                                         core::Seconds sourceTime) const
{
    std::lock_guard lock{_mutex};
    const auto est = ERP_TRY(calibratedLocked(source));
    return sourceTime + est.offsetAt(sourceTime);
}

core::Expected<core::Seconds> ClockReconciler::inverse(core::SourceId source,
                                                       core::Seconds localTime) const
{
    std::lock_guard lock{_mutex};
    const auto est = ERP_TRY(calibratedLocked(source));

    // local = s + offset + drift * (s - reference), solved for s
    return (localTime - est.offset + est.drift * est.reference) / (1.0 + est.drift);
}

core::Expected<ClockEstimate> ClockReconciler::estimate(core::SourceId source) const
{
    std::lock_guard lock{_mutex};
    return calibratedLocked(source);
}

bool ClockReconciler::isCalibrated(core::SourceId source) const
{
    std::lock_guard lock{_mutex};
    return calibratedLocked(source).has_value();
}

void ClockReconciler::reset(core::SourceId source)
{
    std::lock_guard lock{_mutex};
    _sources.erase(source);
}

void ClockReconciler::clear()
{
    std::lock_guard lock{_mutex};
    _sources.clear();
}

core::Expected<ClockEstimate> ClockReconciler::calibratedLocked(core::SourceId source) const
{
    const auto it = _sources.find(source);
    if (it == _sources.end())
        return core::makeError(core::ErrorCode::kUncalibrated,
            "no clock correspondence for source " + std::to_string(source));

    if (it->second.estimate.correspondences < _config.minCorrespondences)
        return core::makeError(core::ErrorCode::kUncalibrated,
            "source " + std::to_string(source) + " has "
            + std::to_string(it->second.estimate.correspondences) + " of "
            + std::to_string(_config.minCorrespondences) + " correspondences");

    return it->second.estimate;
}

void ClockReconciler::refit(SourceState &state)
{
    const auto n = state.window.size();
    const auto count = static_cast<core::f64>(n);

    core::f64 meanSource = 0.0;
    core::f64 meanOffset = 0.0;
    core::Seconds first = state.window.front().source;
    core::Seconds last = first;
    for (const auto &c : state.window)
    {
        meanSource += c.source;
        meanOffset += c.offset;
        first = std::min(first, c.source);
        last = std::max(last, c.source);
    }
    meanSource /= count;
    meanOffset /= count;

    core::f64 drift = 0.0;
    if (n >= 2 && last - first >= core::kMinDriftSpanSec)
    {
        core::f64 sxy = 0.0;
        core::f64 sxx = 0.0;
        for (const auto &c : state.window)
        {
            const core::f64 dx = c.source - meanSource;
            sxy += dx * (c.offset - meanOffset);
            sxx += dx * dx;
        }
        if (sxx > 0.0)
            drift = sxy / sxx;
    }

    core::f64 sse = 0.0;
    for (const auto &c : state.window)
    {
        const core::f64 r = c.offset - (meanOffset + drift * (c.source - meanSource));
        sse += r * r;
    }

    state.estimate = ClockEstimate{
        .offset = meanOffset,
        .drift = drift,
        .reference = meanSource,
        .precision = std::sqrt(sse / count),
        .correspondences = n};
}

} // namespace erp::sync
