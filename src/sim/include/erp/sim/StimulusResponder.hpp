/**
 * @file StimulusResponder.hpp
 * @brief Turns decoded stimulus markers into simulated responses.
 *
 * Keeps the current target and a clock estimate per marker source, so a
 * flash is placed on the simulator's local clock. Flashes from a source
 * whose clock is not calibrated yet are refused rather than guessed.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_SIM_STIMULUS_RESPONDER_HPP
    #define ERP_SIM_STIMULUS_RESPONDER_HPP

    #include "erp/core/NonCopyable.hpp"
    #include "erp/sim/ErpSimulator.hpp"
    #include "erp/sync/ClockReconciler.hpp"
    #include "erp/sync/StimulusEvent.hpp"

    #include <optional>
    #include <string>

namespace erp::sim {

class StimulusResponder final : private core::NonCopyable<StimulusResponder> {
public:
    explicit StimulusResponder(ErpSimulator &simulator, sync::ClockReconcilerConfig clock = {});

    /** @brief Feeds one marker-source/local correspondence. */
    [[nodiscard]] core::ExpectedVoid observeClock(core::SourceId source, core::Seconds sourceTime,
                                                  core::Seconds localTime);

    /**
     * @brief Applies one decoded marker.
     * @return true when a response was scheduled, or kUncalibrated for a
     *         flash whose source clock is unknown.
     */
    [[nodiscard]] core::Expected<bool> handle(core::SourceId source, const sync::StimulusEvent &event);

    [[nodiscard]] const std::optional<std::string> &target() const noexcept { return _target; }
    [[nodiscard]] core::u64 evoked() const noexcept { return _evoked; }
    [[nodiscard]] const sync::ClockReconciler &clock() const noexcept { return _clock; }

private:
    ErpSimulator &_simulator;
    sync::ClockReconciler _clock;
    std::optional<std::string> _target;
    core::u64 _evoked = 0;
};

} // namespace erp::sim

#endif // ERP_SIM_STIMULUS_RESPONDER_HPP
