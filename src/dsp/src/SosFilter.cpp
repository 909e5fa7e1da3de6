/**
 * @file SosFilter.cpp
 * @brief Butterworth section design and zero-phase filtering.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/dsp/SosFilter.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>

namespace erp::dsp {

namespace {

core::f64 prewarp(core::f64 freqHz, core::f64 sampleRate) noexcept
{
    return std::tan(std::numbers::pi * freqHz / sampleRate);
}

/// Q of each second-order section of an order-N Butterworth prototype.
std::vector<core::f64> butterworthQ(core::usize order)
{
    std::vector<core::f64> qs;
    const auto n = static_cast<core::f64>(order);
    for (core::usize k = 0; k < order / 2; ++k)
    {
        const core::f64 theta = std::numbers::pi * (2.0 * static_cast<core::f64>(k) + 1.0) / (2.0 * n);
        qs.push_back(1.0 / (2.0 * std::cos(theta)));
    }
    return qs;
}

core::ExpectedVoid checkCorner(core::f64 freqHz, core::f64 sampleRate, core::usize order)
{
    if (!std::isfinite(sampleRate) || sampleRate <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "sample rate must be positive");
    if (order == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "filter order must be at least 1");
    if (!std::isfinite(freqHz) || freqHz <= 0.0 || freqHz >= sampleRate / 2.0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "corner frequency " + std::to_string(freqHz) + " Hz outside (0, Nyquist)");
    return {};
}

} // anonymous namespace

// ---- Biquad ----

core::f64 Biquad::magnitude(core::f64 freqHz, core::f64 sampleRate) const noexcept
{
    const core::f64 w = 2.0 * std::numbers::pi * freqHz / sampleRate;
    const std::complex<core::f64> z1 = std::polar(1.0, -w);
    const std::complex<core::f64> z2 = z1 * z1;
    return std::abs((b0 + b1 * z1 + b2 * z2) / (1.0 + a1 * z1 + a2 * z2));
}

Biquad Biquad::lowPass(core::f64 cutoffHz, core::f64 sampleRate, core::f64 q) noexcept
{
    const core::f64 k = prewarp(cutoffHz, sampleRate);
    const core::f64 norm = 1.0 / (1.0 + k / q + k * k);
    Biquad s;
    s.b0 = k * k * norm;
    s.b1 = 2.0 * s.b0;
    s.b2 = s.b0;
    s.a1 = 2.0 * (k * k - 1.0) * norm;
    s.a2 = (1.0 - k / q + k * k) * norm;
    return s;
}

Biquad Biquad::highPass(core::f64 cutoffHz, core::f64 sampleRate, core::f64 q) noexcept
{
    const core::f64 k = prewarp(cutoffHz, sampleRate);
    const core::f64 norm = 1.0 / (1.0 + k / q + k * k);
    Biquad s;
    s.b0 = norm;
    s.b1 = -2.0 * norm;
    s.b2 = norm;
    s.a1 = 2.0 * (k * k - 1.0) * norm;
    s.a2 = (1.0 - k / q + k * k) * norm;
    return s;
}

Biquad Biquad::lowPassFirstOrder(core::f64 cutoffHz, core::f64 sampleRate) noexcept
{
    const core::f64 k = prewarp(cutoffHz, sampleRate);
    Biquad s;
    s.b0 = k / (k + 1.0);
    s.b1 = s.b0;
    s.a1 = (k - 1.0) / (k + 1.0);
    return s;
}

Biquad Biquad::highPassFirstOrder(core::f64 cutoffHz, core::f64 sampleRate) noexcept
{
    const core::f64 k = prewarp(cutoffHz, sampleRate);
    Biquad s;
    s.b0 = 1.0 / (k + 1.0);
    s.b1 = -s.b0;
    s.a1 = (k - 1.0) / (k + 1.0);
    return s;
}

Biquad Biquad::notch(core::f64 centerHz, core::f64 sampleRate, core::f64 q) noexcept
{
    const core::f64 k = prewarp(centerHz, sampleRate);
    const core::f64 norm = 1.0 / (1.0 + k / q + k * k);
    Biquad s;
    s.b0 = (1.0 + k * k) * norm;
    s.b1 = 2.0 * (k * k - 1.0) * norm;
    s.b2 = s.b0;
    s.a1 = s.b1;
    s.a2 = (1.0 - k / q + k * k) * norm;
    return s;
}

// ---- Design ----

SosFilter::SosFilter(std::vector<Biquad> sections)
    : _sections(std::move(sections))
{
}

core::Expected<SosFilter> SosFilter::butterworthLowPass(core::f64 cutoffHz, core::f64 sampleRate,
                                                        core::usize order)
{
    ERP_TRY_VOID(checkCorner(cutoffHz, sampleRate, order));

    std::vector<Biquad> sections;
    for (const core::f64 q : butterworthQ(order))
        sections.push_back(Biquad::lowPass(cutoffHz, sampleRate, q));
    if (order % 2 != 0)
        sections.push_back(Biquad::lowPassFirstOrder(cutoffHz, sampleRate));
    return SosFilter{std::move(sections)};
}

core::Expected<SosFilter> SosFilter::butterworthHighPass(core::f64 cutoffHz, core::f64 sampleRate,
                                                         core::usize order)
{
    ERP_TRY_VOID(checkCorner(cutoffHz, sampleRate, order));

    std::vector<Biquad> sections;
    for (const core::f64 q : butterworthQ(order))
        sections.push_back(Biquad::highPass(cutoffHz, sampleRate, q));
    if (order % 2 != 0)
        sections.push_back(Biquad::highPassFirstOrder(cutoffHz, sampleRate));
    return SosFilter{std::move(sections)};
}

core::Expected<SosFilter> SosFilter::butterworthBandPass(core::f64 lowHz, core::f64 highHz,
                                                         core::f64 sampleRate, core::usize order)
{
    if (!(lowHz < highHz))
        return core::makeError(core::ErrorCode::kInvalidArgument, "band-pass edges are reversed");

    auto cascade = ERP_TRY(butterworthHighPass(lowHz, sampleRate, order));
    const auto lowPass = ERP_TRY(butterworthLowPass(highHz, sampleRate, order));
    cascade.append(lowPass);
    return cascade;
}

void SosFilter::append(const SosFilter &other)
{
    _sections.insert(_sections.end(), other._sections.begin(), other._sections.end());
}

// ---- Application ----

void SosFilter::filter(std::span<core::f64> signal) const
{
    if (signal.empty())
        return;

    for (const auto &s : _sections)
    {
        // steady state of a constant input equal to the first sample
        const core::f64 x0 = signal[0];
        const core::f64 y0 = s.dcGain() * x0;
        core::f64 z2 = s.b2 * x0 - s.a2 * y0;
        core::f64 z1 = s.b1 * x0 - s.a1 * y0 + z2;

        for (auto &x : signal)
        {
            const core::f64 in = x;
            const core::f64 out = s.b0 * in + z1;
            z1 = s.b1 * in - s.a1 * out + z2;
            z2 = s.b2 * in - s.a2 * out;
            x = out;
        }
    }
}

core::usize SosFilter::padLength(core::usize length) const noexcept
{
    if (length < 2)
        return 0;
    return std::min<core::usize>(3 * (2 * _sections.size() + 1), length - 1);
}

core::Expected<std::vector<core::f64>> SosFilter::filtfilt(std::span<const core::f64> signal) const
{
    if (signal.empty())
        return core::makeError(core::ErrorCode::kEmptyInput, "cannot filter an empty signal");

    const core::usize n = signal.size();
    if (_sections.empty() || n == 1)
        return std::vector<core::f64>(signal.begin(), signal.end());

    const core::usize pad = padLength(n);
    std::vector<core::f64> ext(n + 2 * pad);

    for (core::usize i = 0; i < pad; ++i)
        ext[i] = 2.0 * signal[0] - signal[pad - i];
    std::copy(signal.begin(), signal.end(), ext.begin() + static_cast<core::isize>(pad));
    for (core::usize i = 0; i < pad; ++i)
        ext[pad + n + i] = 2.0 * signal[n - 1] - signal[n - 2 - i];

    filter(ext);
    std::reverse(ext.begin(), ext.end());
    filter(ext);
    std::reverse(ext.begin(), ext.end());

    return std::vector<core::f64>(ext.begin() + static_cast<core::isize>(pad),
                                  ext.begin() + static_cast<core::isize>(pad + n));
}

core::f64 SosFilter::magnitude(core::f64 freqHz, core::f64 sampleRate) const noexcept
{
    core::f64 gain = 1.0;
    for (const auto &s : _sections)
        gain *= s.magnitude(freqHz, sampleRate);
    return gain;
}

} // namespace erp::dsp
