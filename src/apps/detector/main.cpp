/**
 * @file main.cpp
 * @brief ErpSync live detector entry-point.
 *
 * Resolves the EEG and stimulus marker streams over LSL, feeds them through
 * one Pipeline and publishes every result on the P300Detection outlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "erp/core/Log.hpp"
#include "erp/engine/Pipeline.hpp"
#include "erp/transport/InboundQueue.hpp"
#include "erp/transport/LslMarkerInlet.hpp"
#include "erp/transport/LslResultPublisher.hpp"
#include "erp/transport/LslSampleInlet.hpp"
#include "erp/transport/MarkerCodec.hpp"
#include "erp/transport/TimeCorrection.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

namespace {

using namespace erp;

constexpr core::SourceId kEegSource = 1;
constexpr core::SourceId kFlashSource = 2;
constexpr core::SourceId kTargetSource = 3;
constexpr core::Seconds kCorrectionInterval = 5.0;

std::atomic<bool> g_running{true};

void onSignal(int /*signal*/)
{
    g_running.store(false);
}

using CorrectionQueue = transport::InboundQueue<transport::TimeCorrection, 16>;

/** Measures the source/local correspondence of @p inlet at a fixed interval. */
template <typename Inlet>
void measureClock(Inlet &inlet, CorrectionQueue &corrections, std::chrono::steady_clock::time_point &next)
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
    if (!corrections.push(*correction))
        core::Log::warn("Clock", "correction queue full");
}

void readSamples(transport::LslSampleInlet &inlet, transport::InboundQueue<buffer::Sample, 8192> &queue,
                 CorrectionQueue &corrections)
{
    std::vector<buffer::Sample> chunk;
    auto nextCorrection = std::chrono::steady_clock::now();
    while (g_running.load())
    {
        measureClock(inlet, corrections, nextCorrection);

        chunk.clear();
        auto pulled = inlet.pull(chunk, 64, 0.1);
        if (!pulled)
        {
            core::Log::error("Lsl", pulled.error().format());
            g_running.store(false);
            break;
        }
        for (const auto &sample : chunk)
            queue.push(sample);
    }
}

void readMarkers(transport::LslMarkerInlet &inlet, transport::InboundQueue<transport::RawMarker, 1024> &queue,
                 CorrectionQueue &corrections)
{
    std::vector<transport::RawMarker> markers;
    auto nextCorrection = std::chrono::steady_clock::now();
    while (g_running.load())
    {
        measureClock(inlet, corrections, nextCorrection);

        markers.clear();
        auto pulled = inlet.pull(markers, 32, 0.1);
        if (!pulled)
        {
            core::Log::warn("Lsl", pulled.error().format());
            continue;
        }
        for (const auto &marker : markers)
            queue.push(marker);
    }
}

void applyCorrection(engine::Pipeline &pipeline, const transport::TimeCorrection &correction)
{
    auto observed = pipeline.observeClock(correction.source, correction.sourceTime, correction.localTime);
    if (!observed)
        core::Log::warn("Clock", observed.error().format());
}

void submitMarker(engine::Pipeline &pipeline, transport::RawMarker &marker)
{
    auto event = transport::decodeMarker(marker.payload, marker.timestamp);
    if (!event)
    {
        core::Log::warn("Lsl", "ignored marker '" + marker.payload + "': " + event.error().message());
        return;
    }
    // refusals are logged and counted by the pipeline
    [[maybe_unused]] auto id = pipeline.submitEvent(marker.source, *event);
}

} // namespace

int main(int /*argc*/, char * /*argv*/[])
{
    core::Log::info("=== ErpSync Detector ===");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    transport::LslSampleInlet eeg;
    if (auto opened = eeg.open({.streamNames = {"SimulatedEEG", "ProcessedEEG"}, .source = kEegSource}); !opened)
    {
        core::Log::fatal("Lsl", opened.error().format());
        return 1;
    }

    transport::LslMarkerInlet flashes;
    if (auto opened = flashes.open({.streamNames = {"ChessFlash"}, .source = kFlashSource}); !opened)
    {
        core::Log::fatal("Lsl", opened.error().format());
        return 1;
    }

    transport::LslMarkerInlet targets;
    const bool haveTargets = targets.open({.streamNames = {"ChessTarget"}, .source = kTargetSource}).has_value();
    if (!haveTargets)
        core::Log::warn("Lsl", "no ChessTarget stream, results carry no target hypothesis");

    auto config = engine::PipelineConfig::Builder{}
        .sampleRate(eeg.sampleRate())
        .channelCount(eeg.channelCount())
        .channelNames(eeg.channelLabels())
        .notch(50.0)
        .build();
    if (!config)
        return 1;

    auto publisher = std::make_unique<transport::LslResultPublisher>();
    if (auto opened = publisher->open({}); !opened)
    {
        core::Log::fatal("Lsl", opened.error().format());
        return 1;
    }

    auto pipeline = engine::Pipeline::create(std::move(*config), std::move(publisher), &transport::localClock);
    if (!pipeline)
    {
        core::Log::fatal("Pipeline", pipeline.error().format());
        return 1;
    }
    auto &detector = **pipeline;

    if (auto started = detector.start(); !started)
    {
        core::Log::fatal("Pipeline", started.error().format());
        return 1;
    }

    transport::InboundQueue<buffer::Sample, 8192> sampleQueue;
    transport::InboundQueue<transport::RawMarker, 1024> flashQueue;
    transport::InboundQueue<transport::RawMarker, 1024> targetQueue;

    // one correction queue per inlet thread, all applied on this thread
    CorrectionQueue eegClock;
    CorrectionQueue flashClock;
    CorrectionQueue targetClock;

    std::thread eegThread{readSamples, std::ref(eeg), std::ref(sampleQueue), std::ref(eegClock)};
    std::thread flashThread{readMarkers, std::ref(flashes), std::ref(flashQueue), std::ref(flashClock)};
    std::thread targetThread;
    if (haveTargets)
        targetThread = std::thread{readMarkers, std::ref(targets), std::ref(targetQueue), std::ref(targetClock)};

    core::Log::info("Pipeline", "running, Ctrl+C to stop");
    while (g_running.load())
    {
        core::usize moved = 0;
        const auto correct = [&](transport::TimeCorrection &c) { applyCorrection(detector, c); };
        moved += eegClock.drain(correct);
        moved += flashClock.drain(correct);
        moved += targetClock.drain(correct);
        moved += targetQueue.drain([&](transport::RawMarker &marker) { submitMarker(detector, marker); });
        moved += flashQueue.drain([&](transport::RawMarker &marker) { submitMarker(detector, marker); });
        moved += sampleQueue.drain([&](buffer::Sample &sample) {
            // stale and refused samples are logged and counted by the pipeline
            [[maybe_unused]] auto stored = detector.ingestSample(kEegSource, sample.timestamp, sample.values);
        });
        if (moved == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    eegThread.join();
    flashThread.join();
    if (targetThread.joinable())
        targetThread.join();

    const auto dropped = sampleQueue.dropped() + flashQueue.dropped() + targetQueue.dropped();
    if (dropped > 0)
        core::Log::warn("Lsl", std::to_string(dropped) + " inbound items dropped on full queues");

    detector.stop(1.0);
    core::Log::info("Detector exited cleanly");
    return 0;
}
