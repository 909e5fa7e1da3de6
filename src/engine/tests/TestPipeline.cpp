/**
 * @file TestPipeline.cpp
 * @brief Integration tests for engine::Pipeline and engine::PipelineConfig.
 */

#include <catch2/catch.hpp>

#include "erp/engine/Pipeline.hpp"
#include "erp/core/Log.hpp"
#include "erp/publish/CallbackPublisher.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace erp::engine {

using Catch::Matchers::WithinAbs;

namespace {

constexpr core::f64 kRate = 250.0;
constexpr core::SourceId kEeg = 1;
constexpr core::SourceId kMarkers = 2;

/** Pipeline driven by a manual clock, collecting every published result. */
class Harness {
public:
    explicit Harness(const PipelineConfig::Builder &builder = PipelineConfig::Builder{}, bool failPublish = false)
    {
        auto config = builder.build();
        REQUIRE(config.has_value());

        auto publisher = std::make_unique<publish::CallbackPublisher>(
            [this, failPublish](const detect::DetectionResult &result) -> core::ExpectedVoid {
                if (failPublish)
                    return core::makeError(core::ErrorCode::kPublishFailed, "sink offline");
                std::lock_guard lock{_mutex};
                _results.push_back(result);
                return {};
            });

        auto pipeline = Pipeline::create(std::move(*config), std::move(publisher),
                                         [this] { return _now.load(); });
        REQUIRE(pipeline.has_value());
        _pipeline = std::move(*pipeline);
    }

    Pipeline &pipeline() { return *_pipeline; }
    void setNow(core::Seconds now) { _now.store(now); }

    std::vector<detect::DetectionResult> results()
    {
        std::lock_guard lock{_mutex};
        return _results;
    }

    void calibrate(core::SourceId source, core::Seconds sourceTime = 0.0, core::Seconds localTime = 0.0)
    {
        REQUIRE(_pipeline->observeClock(source, sourceTime, localTime).has_value());
    }

    /** Feeds samples [from, to) of a noisy trace with responses at the given onsets. */
    void feed(core::SourceId source, core::usize from, core::usize to, const std::vector<core::Seconds> &onsets = {},
              core::f64 noise = 0.3, core::Seconds sourceOffset = 0.0)
    {
        std::normal_distribution<core::f64> dist{0.0, noise};
        for (core::usize i = from; i < to; ++i)
        {
            const core::Seconds t = static_cast<core::f64>(i) / kRate;
            core::f64 value = noise > 0.0 ? dist(_rng) : 0.0;
            for (const auto onset : onsets)
            {
                const core::f64 d = (t - (onset + 0.3)) / (0.1 / 3.0);
                value += 5.0 * std::exp(-0.5 * d * d);
            }
            const std::vector<core::f32> values{static_cast<core::f32>(value)};
            REQUIRE(_pipeline->ingestSample(source, t + sourceOffset, values).has_value());
        }
    }

    core::u64 flash(const std::string &id, core::Seconds timestamp, core::SourceId source = kMarkers)
    {
        auto accepted = _pipeline->submitEvent(source, sync::StimulusEvent{timestamp, sync::StimulusKind::kFlash, id});
        REQUIRE(accepted.has_value());
        return *accepted;
    }

private:
    std::atomic<core::Seconds> _now{0.0};
    std::mt19937_64 _rng{1234};
    std::mutex _mutex;
    std::vector<detect::DetectionResult> _results;
    std::unique_ptr<Pipeline> _pipeline;
};

/** Collects the status lines written through core::Log while installed. */
class StatusCapture final : public core::ILogger {
public:
    StatusCapture() { core::Log::setLogger(this); }
    ~StatusCapture() override { core::Log::setLogger(nullptr); }

    void write(core::LogLevel /*level*/, std::string_view tag, std::string_view message) override
    {
        if (tag != "Pipeline" || message.find("buffered=") == std::string_view::npos)
            return;
        std::lock_guard lock{_mutex};
        _lines.emplace_back(message);
    }

    std::vector<std::string> lines()
    {
        std::lock_guard lock{_mutex};
        return _lines;
    }

private:
    std::mutex _mutex;
    std::vector<std::string> _lines;
};

/** Feeds samples [0, count) at kRate, skipping every @p skipEvery-th one. */
void feedSparse(Pipeline &pipeline, core::usize count, core::usize skipEvery)
{
    const std::vector<core::f32> values{0.0f};
    for (core::usize i = 0; i < count; ++i)
    {
        if (i % skipEvery == 0)
            continue;
        REQUIRE(pipeline.ingestSample(kEeg, static_cast<core::f64>(i) / kRate, values).has_value());
    }
}

} // namespace

// ---- Configuration ----

TEST_CASE("PipelineConfig defaults describe the standard layout", "[engine][config]")
{
    auto config = PipelineConfig::Builder{}.build();
    REQUIRE(config.has_value());

    CHECK(config->sampleRate() == 250.0);
    CHECK(config->channelCount() == 1);
    CHECK(config->channelNames() == std::vector<std::string>{"Cz"});
    CHECK(config->geometry().expectedSamples() == 200);
    CHECK_THAT(config->synchronizer().timeoutSec, WithinAbs(1.6, 1e-12));
    CHECK(config->maxDeferredSamples() == 1250);
    CHECK(config->detector().channelWeights.size() == 1);
    CHECK(PipelineConfig::defaultChannelNames(3) == std::vector<std::string>{"Ch1", "Ch2", "Ch3"});
}

TEST_CASE("PipelineConfig rejects inconsistent settings", "[engine][config]")
{
    PipelineConfig::Builder builder;

    SECTION("non-positive sample rate") { builder.sampleRate(0.0); }
    SECTION("names for the wrong channel count") { builder.channelCount(2).channelNames({"Cz"}); }
    SECTION("response window past the epoch") { builder.responseWindow(0.25, 0.9); }
    SECTION("timeout before the epoch ends") { builder.eventTimeout(0.5); }
    SECTION("retention shorter than the timeout") { builder.retention(1.0); }
    SECTION("passband above Nyquist") { builder.passband(0.5, 200.0); }
    SECTION("weights for the wrong channel count") { builder.channelWeights({1.0, 1.0}); }
    SECTION("zero poll tick") { builder.pollTick(0.0); }

    auto config = builder.build();
    REQUIRE_FALSE(config.has_value());
    CHECK(config.error().code() == core::ErrorCode::kInvalidConfig);
}

TEST_CASE("Pipeline requires a publisher", "[engine]")
{
    auto config = PipelineConfig::Builder{}.build();
    REQUIRE(config.has_value());
    auto pipeline = Pipeline::create(std::move(*config), nullptr);
    REQUIRE_FALSE(pipeline.has_value());
    CHECK(pipeline.error().code() == core::ErrorCode::kInvalidArgument);
}

// ---- Detection flow ----

TEST_CASE("A response after a flash is detected once its window is covered", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    core::usize rawColumns = 0;
    h.pipeline().setEpochObserver([&](const EpochRecord &record) { rawColumns = record.raw.sampleCount(); });

    h.feed(kEeg, 0, 250, {1.0});
    h.setNow(1.0);
    const auto id = h.flash("e4", 1.0);

    SECTION("not ready before the window ends")
    {
        h.feed(kEeg, 250, 388, {1.0});
        h.setNow(1.55);
        CHECK(h.pipeline().pollOnce() == 0);
        CHECK_FALSE(h.pipeline().buffer().covers(0.8, 1.6));

        auto slice = h.pipeline().buffer().slice(0.8, 1.6);
        REQUIRE_FALSE(slice.has_value());
        CHECK_FALSE(slice.error().permanentlyLost());
        CHECK(h.pipeline().stats().pendingEvents == 1);
        CHECK(h.results().empty());
    }

    SECTION("scored after the window ends")
    {
        h.feed(kEeg, 250, 401, {1.0});
        h.setNow(1.6);
        REQUIRE(h.pipeline().pollOnce() == 1);

        const auto results = h.results();
        REQUIRE(results.size() == 1);
        CHECK(results[0].eventId == id);
        CHECK(results[0].identifier == "e4");
        CHECK(results[0].detected);
        CHECK(results[0].confidence >= 0.6);
        CHECK_THAT(results[0].timestamp, WithinAbs(1.0, 1e-9));
        CHECK(rawColumns == 200);

        const auto stats = h.pipeline().stats();
        CHECK(stats.epochsExtracted == 1);
        CHECK(stats.detections == 1);
        CHECK(stats.resultsPublished == 1);
        CHECK(stats.pendingEvents == 0);

        // already completed
        CHECK(h.pipeline().pollOnce() == 0);
    }
}

TEST_CASE("Background noise alone is not reported as a response", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    h.feed(kEeg, 0, 250);
    h.flash("e2", 1.0);
    h.feed(kEeg, 250, 401);
    REQUIRE(h.pipeline().pollOnce(1.6) == 1);

    const auto results = h.results();
    REQUIRE(results.size() == 1);
    CHECK_FALSE(results[0].detected);
    CHECK(results[0].confidence < 0.6);
    CHECK(h.pipeline().stats().detections == 0);
}

TEST_CASE("Overlapping epochs are scored independently", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    h.feed(kEeg, 0, 250, {1.0});
    const auto first = h.flash("e1", 1.0);
    const auto second = h.flash("e2", 1.05);
    CHECK(second > first);

    h.feed(kEeg, 250, 420, {1.0});
    CHECK(h.pipeline().pollOnce(1.7) == 2);

    const auto results = h.results();
    REQUIRE(results.size() == 2);
    CHECK(results[0].eventId != results[1].eventId);
    CHECK(h.pipeline().stats().epochsExtracted == 2);
}

TEST_CASE("Timestamps are translated from the source clocks", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg, 100.0, 0.0);
    h.calibrate(kMarkers, 50.0, 0.0);

    h.feed(kEeg, 0, 401, {1.0}, 0.3, 100.0);
    h.flash("e7", 51.0);
    REQUIRE(h.pipeline().pollOnce(1.6) == 1);

    const auto results = h.results();
    REQUIRE(results.size() == 1);
    CHECK_THAT(results[0].timestamp, WithinAbs(1.0, 1e-9));
    CHECK_THAT(results[0].sourceTimestamp, WithinAbs(51.0, 1e-9));
    CHECK(results[0].detected);
}

TEST_CASE("An epoch that is never covered times out exactly once", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    h.feed(kEeg, 0, 300);
    h.flash("e3", 1.0);

    CHECK(h.pipeline().pollOnce(2.0) == 0);
    CHECK(h.pipeline().stats().pendingEvents == 1);

    CHECK(h.pipeline().pollOnce(2.7) == 0);
    CHECK(h.pipeline().pollOnce(3.0) == 0);

    const auto stats = h.pipeline().stats();
    CHECK(stats.timeouts == 1);
    CHECK(stats.pendingEvents == 0);
    CHECK(h.results().empty());
}

TEST_CASE("Stale samples are refused and counted", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg);

    h.feed(kEeg, 0, 250);
    const std::vector<core::f32> values{0.0f};
    auto stale = h.pipeline().ingestSample(kEeg, 0.5, values);
    REQUIRE_FALSE(stale.has_value());
    CHECK(stale.error().code() == core::ErrorCode::kStaleSample);
    CHECK(h.pipeline().stats().staleSamples == 1);
    CHECK(h.pipeline().stats().samplesIngested == 250);
}

TEST_CASE("Chunks are ingested sample by sample", "[engine][flow]")
{
    Harness h;
    h.calibrate(kEeg);

    std::vector<buffer::Sample> chunk;
    for (int i = 0; i < 50; ++i)
        chunk.push_back(buffer::Sample{i / kRate, {1.0f}});
    chunk.push_back(buffer::Sample{0.0, {1.0f}});

    auto accepted = h.pipeline().ingestSamples(kEeg, chunk);
    REQUIRE(accepted.has_value());
    CHECK(*accepted == 50);
    CHECK(h.pipeline().stats().staleSamples == 1);
    CHECK(h.pipeline().stats().bufferedSamples == 50);
}

TEST_CASE("Under the reject policy jittered epochs are dropped and counted", "[engine][flow][jitter]")
{
    Harness h{PipelineConfig::Builder{}.jitterPolicy(epoch::JitterPolicy::kReject)};
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    feedSparse(h.pipeline(), 402, 10);
    h.setNow(1.0);
    h.flash("e4", 1.0);

    CHECK(h.pipeline().pollOnce(1.7) == 0);
    const auto stats = h.pipeline().stats();
    CHECK(stats.jitterRejected == 1);
    CHECK(stats.jitterFlagged == 0);
    CHECK(stats.epochsExtracted == 0);
    CHECK(stats.pendingEvents == 0);
    CHECK(h.results().empty());
}

TEST_CASE("Under the flag policy jittered epochs are still scored", "[engine][flow][jitter]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    feedSparse(h.pipeline(), 402, 10);
    h.setNow(1.0);
    h.flash("e4", 1.0);

    CHECK(h.pipeline().pollOnce(1.7) == 1);
    const auto stats = h.pipeline().stats();
    CHECK(stats.jitterFlagged == 1);
    CHECK(stats.jitterRejected == 0);
    const auto results = h.results();
    REQUIRE(results.size() == 1);
    CHECK(results[0].jitterFlagged);
}

// ---- Status ----

TEST_CASE("The status line is logged once per interval", "[engine][status]")
{
    StatusCapture capture;
    Harness h{PipelineConfig::Builder{}.statusInterval(1.0)};
    h.calibrate(kEeg);
    h.feed(kEeg, 0, 250);

    h.pipeline().pollOnce(0.5);
    CHECK(capture.lines().empty());

    h.pipeline().pollOnce(1.0);
    auto lines = capture.lines();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find("buffered=250") != std::string::npos);
    CHECK(lines[0].find("pending=0") != std::string::npos);
    CHECK(lines[0].find("stale=0") != std::string::npos);

    h.pipeline().pollOnce(1.5);
    CHECK(capture.lines().size() == 1);

    h.pipeline().pollOnce(2.0);
    CHECK(capture.lines().size() == 2);
}

TEST_CASE("A zero status interval disables the status line", "[engine][status]")
{
    StatusCapture capture;
    Harness h{PipelineConfig::Builder{}.statusInterval(0.0)};
    h.calibrate(kEeg);
    h.feed(kEeg, 0, 250);

    h.pipeline().pollOnce(5.0);
    h.pipeline().pollOnce(50.0);
    CHECK(capture.lines().empty());
}

// ---- Clock calibration ----

TEST_CASE("Uncalibrated samples and events wait for the clock", "[engine][clock]")
{
    Harness h;

    h.feed(kEeg, 0, 250, {1.0});
    h.setNow(1.0);
    h.flash("e4", 1.0, kEeg);
    h.feed(kEeg, 250, 401, {1.0});

    auto stats = h.pipeline().stats();
    CHECK(stats.samplesDeferred == 401);
    CHECK(stats.bufferedSamples == 0);
    CHECK(h.pipeline().pollOnce(1.6) == 0);
    CHECK(h.pipeline().stats().pendingEvents == 1);

    h.calibrate(kEeg);
    stats = h.pipeline().stats();
    CHECK(stats.bufferedSamples == 401);
    CHECK(stats.samplesIngested == 401);

    CHECK(h.pipeline().pollOnce(1.7) == 1);
    const auto results = h.results();
    REQUIRE(results.size() == 1);
    CHECK(results[0].detected);
}

TEST_CASE("Deferred samples beyond capacity drop the oldest", "[engine][clock]")
{
    Harness h{PipelineConfig::Builder{}.maxDeferredSamples(100)};

    h.feed(kEeg, 0, 150);
    auto stats = h.pipeline().stats();
    CHECK(stats.samplesDeferred == 150);
    CHECK(stats.samplesRejected == 50);

    h.calibrate(kEeg);
    CHECK(h.pipeline().stats().bufferedSamples == 100);
    CHECK_FALSE(h.pipeline().buffer().covers(0.0, 0.1));
}

TEST_CASE("Reject policy refuses uncalibrated input", "[engine][clock]")
{
    Harness h{PipelineConfig::Builder{}.uncalibratedPolicy(sync::UncalibratedPolicy::kReject)};

    const std::vector<core::f32> values{1.0f};
    auto sample = h.pipeline().ingestSample(kEeg, 0.0, values);
    REQUIRE_FALSE(sample.has_value());
    CHECK(sample.error().code() == core::ErrorCode::kUncalibrated);

    auto event = h.pipeline().submitEvent(kMarkers, sync::StimulusEvent{1.0, sync::StimulusKind::kFlash, "e1"});
    REQUIRE_FALSE(event.has_value());
    CHECK(event.error().code() == core::ErrorCode::kUncalibrated);

    const auto stats = h.pipeline().stats();
    CHECK(stats.samplesRejected == 1);
    CHECK(stats.eventsRejected == 1);
    CHECK(stats.eventsReceived == 0);
}

// ---- Focus and publishing ----

TEST_CASE("Results carry the focus at the time of the flash", "[engine][focus]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    auto target = h.pipeline().submitEvent(kMarkers, sync::StimulusEvent{0.5, sync::StimulusKind::kTargetSet, "e4"});
    REQUIRE(target.has_value());
    CHECK(h.pipeline().focus() == std::optional<std::string>{"e4"});

    h.feed(kEeg, 0, 250);
    h.flash("e4", 1.0);
    h.flash("e5", 1.02);
    h.feed(kEeg, 250, 410);
    REQUIRE(h.pipeline().pollOnce(1.7) == 2);

    const auto results = h.results();
    REQUIRE(results.size() == 2);
    for (const auto &result : results)
        CHECK(result.isTargetHypothesis == (result.identifier == "e4"));
}

TEST_CASE("Publish failures are counted and do not stop the pipeline", "[engine][publish]")
{
    Harness h{PipelineConfig::Builder{}, true};
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    h.feed(kEeg, 0, 250);
    h.flash("e1", 1.0);
    h.feed(kEeg, 250, 401);
    CHECK(h.pipeline().pollOnce(1.6) == 1);

    const auto stats = h.pipeline().stats();
    CHECK(stats.publishFailures == 1);
    CHECK(stats.resultsPublished == 0);
    CHECK(stats.epochsExtracted == 1);
}

// ---- Lifecycle ----

TEST_CASE("Stopping abandons pending events and refuses new input", "[engine][lifecycle]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    h.feed(kEeg, 0, 260);
    h.flash("e1", 1.0);
    h.setNow(1.05);

    h.pipeline().stop();
    CHECK(h.pipeline().isStopped());

    auto stats = h.pipeline().stats();
    CHECK(stats.pendingEvents == 0);
    CHECK(stats.eventsDropped == 1);
    CHECK(stats.bufferedSamples == 0);
    CHECK(h.results().empty());

    const std::vector<core::f32> values{0.0f};
    auto sample = h.pipeline().ingestSample(kEeg, 2.0, values);
    REQUIRE_FALSE(sample.has_value());
    CHECK(sample.error().code() == core::ErrorCode::kShutdown);

    auto event = h.pipeline().submitEvent(kMarkers, sync::StimulusEvent{2.0, sync::StimulusKind::kFlash, "e2"});
    REQUIRE_FALSE(event.has_value());
    CHECK(event.error().code() == core::ErrorCode::kShutdown);

    auto restart = h.pipeline().start();
    REQUIRE_FALSE(restart.has_value());
    CHECK(restart.error().code() == core::ErrorCode::kShutdown);

    // idempotent
    h.pipeline().stop();
    CHECK(h.pipeline().stats().eventsDropped == 1);
}

TEST_CASE("The worker scores epochs as samples arrive", "[engine][lifecycle]")
{
    Harness h;
    h.calibrate(kEeg);
    h.calibrate(kMarkers);

    REQUIRE(h.pipeline().start().has_value());
    CHECK(h.pipeline().isRunning());

    auto twice = h.pipeline().start();
    REQUIRE_FALSE(twice.has_value());
    CHECK(twice.error().code() == core::ErrorCode::kInvalidState);

    h.feed(kEeg, 0, 250, {1.0});
    h.flash("e4", 1.0);
    h.feed(kEeg, 250, 401, {1.0});
    h.setNow(1.6);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (h.pipeline().stats().resultsPublished == 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    h.pipeline().stop(0.1);
    CHECK_FALSE(h.pipeline().isRunning());

    const auto results = h.results();
    REQUIRE(results.size() == 1);
    CHECK(results[0].detected);
}

} // namespace erp::engine
