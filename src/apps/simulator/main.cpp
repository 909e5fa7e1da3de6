/**
 * @file main.cpp
 * @brief ErpSync EEG simulator entry-point.
 *
 * Streams synthetic EEG on the SimulatedEEG outlet in 40 ms chunks and
 * embeds an evoked response after every flash of the current target.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "erp/core/Log.hpp"
#include "erp/sim/ErpSimulator.hpp"
#include "erp/sim/StimulusResponder.hpp"
#include "erp/transport/LslEegOutlet.hpp"
#include "erp/transport/LslMarkerInlet.hpp"
#include "erp/transport/MarkerCodec.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace erp;

constexpr core::Seconds kChunkDuration = 0.04;
constexpr core::Seconds kCorrectionInterval = 5.0;

std::atomic<bool> g_running{true};

void onSignal(int /*signal*/)
{
    g_running.store(false);
}

/** Refreshes the flash-producer/local correspondence at a fixed interval. */
void refreshClock(transport::LslMarkerInlet &inlet, sim::StimulusResponder &responder,
                  std::chrono::steady_clock::time_point &next)
{
    const auto now = std::chrono::steady_clock::now();
    if (now < next)
        return;
    next = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                     std::chrono::duration<core::f64>(kCorrectionInterval));

    auto correction = inlet.timeCorrection();
    if (!correction)
    {
        core::Log::warn("Lsl", correction.error().format());
        return;
    }
    auto observed = responder.observeClock(correction->source, correction->sourceTime, correction->localTime);
    if (!observed)
        core::Log::warn("Clock", observed.error().format());
}

} // namespace

int main(int /*argc*/, char * /*argv*/[])
{
    core::Log::info("=== ErpSync Simulator ===");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    sim::SimulatorConfig config;
    config.startTime = transport::localClock();
    config.seed = static_cast<core::u64>(std::chrono::system_clock::now().time_since_epoch().count());

    auto simulator = sim::ErpSimulator::create(config);
    if (!simulator)
    {
        core::Log::fatal("Sim", simulator.error().format());
        return 1;
    }

    transport::LslEegOutlet outlet;
    if (auto opened = outlet.open({.channelLabels = config.channelNames, .sampleRate = config.sampleRate}); !opened)
    {
        core::Log::fatal("Lsl", opened.error().format());
        return 1;
    }

    transport::LslMarkerInlet targets;
    transport::LslMarkerInlet flashes;
    const bool haveTargets = targets.open({.streamNames = {"ChessTarget"}, .source = 1}).has_value();
    const bool haveFlashes = flashes.open({.streamNames = {"ChessFlash"}, .source = 2}).has_value();
    if (!haveTargets || !haveFlashes)
        core::Log::warn("Sim", "stimulus streams missing, streaming background activity only");

    sim::StimulusResponder responder{*simulator};
    auto nextCorrection = std::chrono::steady_clock::now();
    const auto chunkSize = static_cast<core::usize>(std::max(1.0, config.sampleRate * kChunkDuration));
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<core::f64>(static_cast<core::f64>(chunkSize) / config.sampleRate));

    std::vector<transport::RawMarker> markers;
    auto nextChunk = std::chrono::steady_clock::now();

    while (g_running.load())
    {
        markers.clear();
        if (haveTargets)
        {
            if (auto pulled = targets.pull(markers, 16, 0.0); !pulled)
                core::Log::warn("Lsl", pulled.error().format());
        }
        if (haveFlashes)
        {
            refreshClock(flashes, responder, nextCorrection);
            if (auto pulled = flashes.pull(markers, 64, 0.0); !pulled)
                core::Log::warn("Lsl", pulled.error().format());
        }

        for (const auto &marker : markers)
        {
            auto event = transport::decodeMarker(marker.payload, marker.timestamp);
            if (!event)
            {
                core::Log::warn("Sim", "ignored marker '" + marker.payload + "'");
                continue;
            }
            auto handled = responder.handle(marker.source, *event);
            if (handled)
                continue;
            const auto message = "flash " + event->identifier + " skipped: " + handled.error().message();
            if (core::isPending(handled.error().code()))
                core::Log::debug("Sim", message);
            else
                core::Log::warn("Sim", message);
        }

        for (const auto &sample : simulator->generate(chunkSize))
        {
            if (auto pushed = outlet.pushSample(sample.values, sample.timestamp); !pushed)
                core::Log::warn("Lsl", pushed.error().format());
        }

        nextChunk += period;
        std::this_thread::sleep_until(nextChunk);
    }

    core::Log::info("Sim", std::to_string(simulator->samplesGenerated()) + " samples, " +
                               std::to_string(responder.evoked()) + " responses");
    return 0;
}
