/**
 * @file Preprocessor.hpp
 * @brief Band-limiting and baseline correction of raw epochs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_DSP_PREPROCESSOR_HPP
    #define ERP_DSP_PREPROCESSOR_HPP

    #include "erp/core/Constants.hpp"
    #include "erp/dsp/SosFilter.hpp"
    #include "erp/epoch/Epoch.hpp"

namespace erp::dsp {

struct PreprocessorConfig {
    core::f64 sampleRate = core::kDefaultSampleRate;
    core::f64 bandLowHz = core::kDefaultBandLowHz;
    core::f64 bandHighHz = core::kDefaultBandHighHz;
    core::usize filterOrder = core::kDefaultFilterOrder;
    core::f64 notchHz = 0.0; ///< 0 disables the notch
    core::f64 notchQ = 30.0;
    core::Seconds baselineStart = core::kDefaultBaselineStartSec;
    core::Seconds baselineEnd = core::kDefaultBaselineEndSec;
};

/**
 * @brief Pure transformation raw epoch -> preprocessed epoch.
 *
 * Per channel: zero-phase Butterworth band-pass over the full epoch (so
 * filter edge effects stay away from the response window), optional
 * zero-phase notch, then subtraction of the mean over the baseline window.
 */
class Preprocessor final {
public:
    [[nodiscard]] static core::Expected<Preprocessor> create(const PreprocessorConfig &config);

    /**
     * @brief Returns the filtered, baseline-corrected copy of @p raw.
     */
    [[nodiscard]] core::Expected<epoch::Epoch> process(const epoch::Epoch &raw) const;

    /** @brief Zero-phase filtering of every channel, in place. */
    [[nodiscard]] core::ExpectedVoid bandLimit(epoch::Epoch &epoch) const;

    /**
     * @brief Subtracts, per channel, the mean over [start, end) (relative to the stimulus).
     */
    [[nodiscard]] static core::ExpectedVoid baselineCorrect(epoch::Epoch &epoch, core::Seconds start,
                                                            core::Seconds end);

    [[nodiscard]] const SosFilter &filter() const noexcept { return _filter; }
    [[nodiscard]] const PreprocessorConfig &config() const noexcept { return _config; }

private:
    Preprocessor(PreprocessorConfig config, SosFilter filter);

    PreprocessorConfig _config;
    SosFilter _filter;
};

} // namespace erp::dsp

#endif // ERP_DSP_PREPROCESSOR_HPP
