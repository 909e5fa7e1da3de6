/**
 * @file ClockReconciler.hpp
 * @brief Per-source estimate of the mapping from a remote clock to local time.
 *
 * Every correspondence (source timestamp, local timestamp) is folded into a
 * trailing window. The offset @c local - @c source is modelled as a line in
 * source time (offset + drift), fitted by ordinary least squares over the
 * window, so that a slow drift between the two clocks does not accumulate
 * into a growing error over a long session.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_SYNC_CLOCK_RECONCILER_HPP
    #define ERP_SYNC_CLOCK_RECONCILER_HPP

    #include "erp/core/Constants.hpp"
    #include "erp/core/Expected.hpp"
    #include "erp/core/NonCopyable.hpp"

    #include <deque>
    #include <mutex>
    #include <unordered_map>

namespace erp::sync {

/**
 * @brief Parameters of the trailing-window fit.
 */
struct ClockReconcilerConfig {
    core::f64 windowSec = core::kDefaultClockWindowSec;
    core::usize maxCorrespondences = core::kDefaultClockMaxCorrespondences;
    core::usize minCorrespondences = core::kDefaultClockMinCorrespondences;
};

/**
 * @brief Current fit for one source.
 *
 * offset(s) = offset + drift * (s - reference)
 */
struct ClockEstimate {
    core::f64 offset = 0.0;
    core::f64 drift = 0.0;
    core::Seconds reference = 0.0;
    core::f64 precision = 0.0;
    core::usize correspondences = 0;

    [[nodiscard]] core::f64 offsetAt(core::Seconds sourceTime) const noexcept
    {
        return offset + drift * (sourceTime - reference);
    }
};

/**
 * @brief Thread-safe store of per-source clock estimates.
 */
class ClockReconciler final : private core::NonCopyable<ClockReconciler> {
public:
    explicit ClockReconciler(ClockReconcilerConfig config = {});

    [[nodiscard]] static core::ExpectedVoid validate(const ClockReconcilerConfig &config);

    /**
     * @brief Folds one correspondence into the estimate of @p source.
     * @param source      Source identifier.
     * @param sourceTime  Timestamp on the source clock.
     * @param localTime   Local reference time at which it was observed.
     */
    [[nodiscard]] core::ExpectedVoid update(core::SourceId source, core::Seconds sourceTime,
                                            core::Seconds localTime);

    /**
     * @brief Maps a source timestamp to local reference time.
     * @return kUncalibrated when the source has fewer correspondences than
     *         the configured minimum.
     */
    [[nodiscard]] core::Expected<core::Seconds> translate(core::SourceId source,
                                                          core::Seconds sourceTime) const;

    /**
     * @brief Maps a local timestamp back to the source clock.
     */
    [[nodiscard]] core::Expected<core::Seconds> inverse(core::SourceId source,
                                                        core::Seconds localTime) const;

    [[nodiscard]] core::Expected<ClockEstimate> estimate(core::SourceId source) const;
    [[nodiscard]] bool isCalibrated(core::SourceId source) const;

    /** @brief Forgets everything learnt about @p source. */
    void reset(core::SourceId source);
    void clear();

    [[nodiscard]] const ClockReconcilerConfig &config() const noexcept { return _config; }

private:
    struct Correspondence {
        core::Seconds source;
        core::f64 offset;
    };

    struct SourceState {
        std::deque<Correspondence> window;
        core::Seconds newestSource = 0.0;
        ClockEstimate estimate;
    };

    [[nodiscard]] core::Expected<ClockEstimate> calibratedLocked(core::SourceId source) const;
    static void refit(SourceState &state);

    ClockReconcilerConfig _config;
    mutable std::mutex _mutex;
    std::unordered_map<core::SourceId, SourceState> _sources;
};

} // namespace erp::sync

#endif // ERP_SYNC_CLOCK_RECONCILER_HPP
