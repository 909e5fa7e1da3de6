/**
 * @file SosFilter.hpp
 * @brief Cascaded second-order IIR sections with zero-phase application.
 *
 * Butterworth sections are designed with the bilinear transform. The
 * band-pass is a high-pass cascade followed by a low-pass cascade of the
 * same order, which keeps each section well conditioned at the very low
 * corner frequencies used for EEG (0.5 Hz at 250 Hz).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_DSP_SOS_FILTER_HPP
    #define ERP_DSP_SOS_FILTER_HPP

    #include "erp/core/Expected.hpp"

    #include <span>
    #include <vector>

namespace erp::dsp {

/**
 * @brief One normalized section: y = (b0 + b1 z^-1 + b2 z^-2) / (1 + a1 z^-1 + a2 z^-2) x.
 *
 * First-order sections leave b2 and a2 at zero.
 */
struct Biquad {
    core::f64 b0 = 1.0;
    core::f64 b1 = 0.0;
    core::f64 b2 = 0.0;
    core::f64 a1 = 0.0;
    core::f64 a2 = 0.0;

    /** @brief DC gain, (b0 + b1 + b2) / (1 + a1 + a2). */
    [[nodiscard]] core::f64 dcGain() const noexcept { return (b0 + b1 + b2) / (1.0 + a1 + a2); }

    /** @brief Magnitude of the response at @p freqHz. */
    [[nodiscard]] core::f64 magnitude(core::f64 freqHz, core::f64 sampleRate) const noexcept;

    [[nodiscard]] static Biquad lowPass(core::f64 cutoffHz, core::f64 sampleRate, core::f64 q) noexcept;
    [[nodiscard]] static Biquad highPass(core::f64 cutoffHz, core::f64 sampleRate, core::f64 q) noexcept;
    [[nodiscard]] static Biquad lowPassFirstOrder(core::f64 cutoffHz, core::f64 sampleRate) noexcept;
    [[nodiscard]] static Biquad highPassFirstOrder(core::f64 cutoffHz, core::f64 sampleRate) noexcept;
    [[nodiscard]] static Biquad notch(core::f64 centerHz, core::f64 sampleRate, core::f64 q) noexcept;
};

/**
 * @brief Ordered cascade of Biquad sections.
 */
class SosFilter final {
public:
    SosFilter() = default;
    explicit SosFilter(std::vector<Biquad> sections);

    /**
     * @brief Butterworth band-pass of the given order on each edge.
     * @return kInvalidArgument unless 0 < lowHz < highHz < Nyquist and order >= 1.
     */
    [[nodiscard]] static core::Expected<SosFilter> butterworthBandPass(
        core::f64 lowHz, core::f64 highHz, core::f64 sampleRate, core::usize order);

    [[nodiscard]] static core::Expected<SosFilter> butterworthLowPass(
        core::f64 cutoffHz, core::f64 sampleRate, core::usize order);

    [[nodiscard]] static core::Expected<SosFilter> butterworthHighPass(
        core::f64 cutoffHz, core::f64 sampleRate, core::usize order);

    /** @brief Appends the sections of @p other after this cascade. */
    void append(const SosFilter &other);

    /**
     * @brief Causal filtering in place, state initialized to the steady
     *        state of a constant input equal to the first sample.
     */
    void filter(std::span<core::f64> signal) const;

    /**
     * @brief Forward-backward filtering with odd-extension padding.
     *
     * The result has no phase shift and squared magnitude response.
     */
    [[nodiscard]] core::Expected<std::vector<core::f64>> filtfilt(std::span<const core::f64> signal) const;

    /** @brief Padding length used by filtfilt for a signal of @p length samples. */
    [[nodiscard]] core::usize padLength(core::usize length) const noexcept;

    /** @brief Cascade magnitude response at @p freqHz (single pass). */
    [[nodiscard]] core::f64 magnitude(core::f64 freqHz, core::f64 sampleRate) const noexcept;

    [[nodiscard]] const std::vector<Biquad> &sections() const noexcept { return _sections; }
    [[nodiscard]] bool empty() const noexcept { return _sections.empty(); }

private:
    std::vector<Biquad> _sections;
};

} // namespace erp::dsp

#endif // ERP_DSP_SOS_FILTER_HPP
