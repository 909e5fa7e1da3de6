/**
 * @file ErpSimulator.cpp
 * @brief Synthetic EEG generation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/sim/ErpSimulator.hpp"

#include "erp/detect/ChannelWeights.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <utility>

namespace erp::sim {

namespace {

constexpr core::f64 kTwoPi = 2.0 * std::numbers::pi;
constexpr core::Seconds kBlinkDuration = 0.2;
constexpr core::Seconds kMuscleDuration = 0.05;
constexpr core::f64 kShapeAlpha = 2.0;
// max of x^a e^-x, reached at x = a
const core::f64 kShapePeak = std::pow(kShapeAlpha, kShapeAlpha) * std::exp(-kShapeAlpha);

bool isFrontalSite(const std::string &name)
{
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "fp1" || lower == "fp2" || lower == "f3" || lower == "f4";
}

} // namespace

ErpSimulator::ErpSimulator(SimulatorConfig config) : _config(std::move(config)), _rng(_config.seed)
{
    const core::usize channels = _config.channelNames.size();
    const core::f64 noise = _config.noiseLevel;

    std::uniform_real_distribution<core::f64> phase{0.0, kTwoPi};
    for (auto [frequency, share] : std::array<std::pair<core::f64, core::f64>, 4>{
             {{10.0, 0.6}, {20.0, 0.3}, {6.0, 0.2}, {40.0, 0.1}}})
    {
        Rhythm rhythm{frequency, noise * share, std::vector<core::f64>(channels)};
        for (auto &p : rhythm.phases)
            p = phase(_rng);
        _rhythms.push_back(std::move(rhythm));
    }

    _responseWeights = detect::ChannelWeights::fromNames(_config.channelNames).values();
    _blinkWeights.reserve(channels);
    for (const auto &name : _config.channelNames)
        _blinkWeights.push_back(isFrontalSite(name) ? 1.0 : 0.3);
}

core::Expected<ErpSimulator> ErpSimulator::create(SimulatorConfig config)
{
    if (!(config.sampleRate > 0.0) || !std::isfinite(config.sampleRate))
        return core::makeError(core::ErrorCode::kInvalidConfig, "simulator sample rate must be positive");
    if (config.channelNames.empty())
        return core::makeError(core::ErrorCode::kInvalidConfig, "simulator needs at least one channel");
    if (!(config.noiseLevel >= 0.0) || !(config.responseAmplitude >= 0.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "amplitudes must be non-negative");
    if (!(config.responseWidth > 0.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "response width must be positive");
    if (!(config.responseProbability >= 0.0 && config.responseProbability <= 1.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "response probability must lie in [0, 1]");
    if (!(config.artifactRate >= 0.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "artifact rate must be non-negative");
    return ErpSimulator{std::move(config)};
}

core::Seconds ErpSimulator::now() const noexcept
{
    return _config.startTime + static_cast<core::f64>(_index) / _config.sampleRate;
}

core::f64 ErpSimulator::responseShape(core::Seconds sinceOnset) const noexcept
{
    const core::f64 width = _config.responseWidth;
    const core::f64 relative = sinceOnset - _config.responseLatency;
    if (std::abs(relative) >= 2.0 * width)
        return 0.0;

    // Gamma-like rise and decay; x = 0 lies half a width before the latency.
    const core::f64 x = (relative + width / 2.0) / (width / 3.0);
    if (x <= 0.0)
        return 0.0;
    return std::pow(x, kShapeAlpha) * std::exp(-x) / kShapePeak;
}

void ErpSimulator::scheduleResponse(core::Seconds onset, core::f64 scale)
{
    _responses.push_back(Response{onset, _config.responseAmplitude * scale});
}

bool ErpSimulator::onStimulus(core::Seconds onset, bool isTarget)
{
    if (!isTarget)
        return false;

    std::bernoulli_distribution evoke{_config.responseProbability};
    if (!evoke(_rng))
        return false;

    scheduleResponse(onset);
    return true;
}

buffer::Sample ErpSimulator::next()
{
    const core::usize channels = channelCount();
    const core::Seconds t = now();
    const core::f64 rate = _config.sampleRate;
    const core::f64 noise = _config.noiseLevel;

    buffer::Sample sample{t, std::vector<core::f32>(channels, 0.0f)};
    std::vector<core::f64> acc(channels, 0.0);

    // Background rhythms.
    const core::f64 drift = 1.0 + 0.1 * std::sin(kTwoPi * 0.1 * t);
    const core::f64 modulation = 1.0 + 0.2 * std::sin(kTwoPi * 0.05 * t);
    for (const auto &rhythm : _rhythms)
    {
        for (core::usize ch = 0; ch < channels; ++ch)
            acc[ch] += rhythm.amplitude * modulation * std::sin(kTwoPi * rhythm.frequency * drift * t + rhythm.phases[ch]);
    }

    // Evoked responses.
    const core::Seconds horizon = _config.responseLatency + 2.0 * _config.responseWidth;
    std::erase_if(_responses, [&](const Response &r) { return t - r.onset >= horizon; });
    for (const auto &response : _responses)
    {
        const core::f64 value = response.amplitude * responseShape(t - response.onset);
        for (core::usize ch = 0; ch < channels; ++ch)
            acc[ch] += value * _responseWeights[ch];
    }

    // Artifacts.
    if (_config.artifacts && _config.artifactRate > 0.0)
    {
        std::uniform_real_distribution<core::f64> unit{0.0, 1.0};
        if (unit(_rng) < _config.artifactRate / rate)
            _blinks.push_back(Blink{_index, std::max<core::u64>(2, static_cast<core::u64>(kBlinkDuration * rate))});
        if (unit(_rng) < 0.5 * _config.artifactRate / rate)
            _muscleUntil = _index + static_cast<core::u64>(kMuscleDuration * rate);

        std::erase_if(_blinks, [this](const Blink &b) { return _index >= b.start + b.length; });
        for (const auto &blink : _blinks)
        {
            const core::f64 progress =
                3.0 * static_cast<core::f64>(_index - blink.start) / static_cast<core::f64>(blink.length - 1);
            const core::f64 value = 5.0 * noise * std::exp(-progress);
            for (core::usize ch = 0; ch < channels; ++ch)
                acc[ch] += value * _blinkWeights[ch];
        }

        if (_index < _muscleUntil)
        {
            std::normal_distribution<core::f64> burst{0.0, 2.0 * noise};
            for (core::usize ch = 0; ch < channels; ++ch)
                acc[ch] += burst(_rng);
        }
    }

    // White noise.
    if (noise > 0.0)
    {
        std::normal_distribution<core::f64> white{0.0, 0.1 * noise};
        for (core::usize ch = 0; ch < channels; ++ch)
            acc[ch] += white(_rng);
    }

    for (core::usize ch = 0; ch < channels; ++ch)
        sample.values[ch] = static_cast<core::f32>(acc[ch]);

    ++_index;
    return sample;
}

std::vector<buffer::Sample> ErpSimulator::generate(core::usize count)
{
    std::vector<buffer::Sample> samples;
    samples.reserve(count);
    for (core::usize i = 0; i < count; ++i)
        samples.push_back(next());
    return samples;
}

} // namespace erp::sim
