/**
 * @file StimulusResponder.cpp
 * @brief Marker handling for the simulator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/sim/StimulusResponder.hpp"

#include "erp/core/Log.hpp"

#include <utility>

namespace erp::sim {

StimulusResponder::StimulusResponder(ErpSimulator &simulator, sync::ClockReconcilerConfig clock)
    : _simulator(simulator), _clock(clock)
{
}

core::ExpectedVoid StimulusResponder::observeClock(core::SourceId source, core::Seconds sourceTime,
                                                   core::Seconds localTime)
{
    return _clock.update(source, sourceTime, localTime);
}

core::Expected<bool> StimulusResponder::handle(core::SourceId source, const sync::StimulusEvent &event)
{
    if (event.kind == sync::StimulusKind::kTargetSet)
    {
        _target = event.identifier;
        core::Log::info("Sim", "target set to " + event.identifier);
        return false;
    }

    const auto onset = ERP_TRY(_clock.translate(source, event.timestamp));
    const bool isTarget = _target.has_value() && *_target == event.identifier;
    if (!_simulator.onStimulus(onset, isTarget))
        return false;

    ++_evoked;
    core::Log::debug("Sim", "response scheduled after " + event.identifier);
    return true;
}

} // namespace erp::sim
