/**
 * @file ErpSimulator.hpp
 * @brief Synthetic multi-channel EEG with embedded evoked responses.
 *
 * Background rhythms (theta, alpha, beta, gamma) with slow frequency drift
 * and amplitude modulation, white noise, eye blinks, muscle bursts, and
 * gamma-shaped positive responses scheduled after stimuli. All randomness
 * comes from one seeded engine, so equal seeds give equal streams.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_SIM_ERP_SIMULATOR_HPP
    #define ERP_SIM_ERP_SIMULATOR_HPP

    #include "erp/buffer/Sample.hpp"
    #include "erp/core/Expected.hpp"

    #include <array>
    #include <random>
    #include <string>
    #include <vector>

namespace erp::sim {

struct SimulatorConfig {
    core::f64 sampleRate = 250.0;
    std::vector<std::string> channelNames{"Cz"};
    core::f64 noiseLevel = 10.0;            ///< background scale, microvolts
    core::f64 responseAmplitude = 5.0;      ///< evoked peak, microvolts
    core::Seconds responseLatency = 0.3;
    core::Seconds responseWidth = 0.1;
    core::f64 responseProbability = 0.8;    ///< chance a target stimulus evokes a response
    core::f64 artifactRate = 0.1;           ///< blinks per second; muscle bursts at half the rate
    bool artifacts = true;
    core::Seconds startTime = 0.0;          ///< timestamp of the first sample
    core::u64 seed = 42;
};

class ErpSimulator final {
public:
    [[nodiscard]] static core::Expected<ErpSimulator> create(SimulatorConfig config);

    /** @brief Produces the next sample and advances the clock by one period. */
    [[nodiscard]] buffer::Sample next();

    [[nodiscard]] std::vector<buffer::Sample> generate(core::usize count);

    /**
     * @brief Embeds a response whose stimulus occurred at @p onset.
     * @param scale Multiplier on the configured amplitude.
     */
    void scheduleResponse(core::Seconds onset, core::f64 scale = 1.0);

    /**
     * @brief Reacts to a presented stimulus. Targets evoke a response with
     *        the configured probability.
     * @return true when a response was scheduled.
     */
    bool onStimulus(core::Seconds onset, bool isTarget);

    /** @brief Timestamp of the next sample. */
    [[nodiscard]] core::Seconds now() const noexcept;
    [[nodiscard]] core::u64 samplesGenerated() const noexcept { return _index; }
    [[nodiscard]] core::usize scheduledResponses() const noexcept { return _responses.size(); }
    [[nodiscard]] core::usize channelCount() const noexcept { return _config.channelNames.size(); }
    [[nodiscard]] const SimulatorConfig &config() const noexcept { return _config; }

    /** @brief Amplitude of the response waveform @p sinceOnset seconds after a stimulus, unit peak. */
    [[nodiscard]] core::f64 responseShape(core::Seconds sinceOnset) const noexcept;

private:
    explicit ErpSimulator(SimulatorConfig config);

    struct Rhythm {
        core::f64 frequency;
        core::f64 amplitude;
        std::vector<core::f64> phases;
    };

    struct Response {
        core::Seconds onset;
        core::f64 amplitude;
    };

    struct Blink {
        core::u64 start;
        core::u64 length;
    };

    SimulatorConfig _config;
    std::mt19937_64 _rng;
    std::vector<Rhythm> _rhythms;
    std::vector<core::f64> _responseWeights;
    std::vector<core::f64> _blinkWeights;
    std::vector<Response> _responses;
    std::vector<Blink> _blinks;
    core::u64 _muscleUntil = 0;
    core::u64 _index = 0;
};

} // namespace erp::sim

#endif // ERP_SIM_ERP_SIMULATOR_HPP
