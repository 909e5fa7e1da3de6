/**
 * @file TestEpochExtractor.cpp
 * @brief Unit tests for epoch::EpochExtractor and epoch::EpochGeometry.
 */

#include <catch2/catch.hpp>

#include "erp/epoch/EpochExtractor.hpp"

#include <vector>

namespace erp::epoch {

using Catch::Matchers::WithinAbs;

namespace {

constexpr core::f64 kRate = 250.0;

buffer::RingBufferConfig bufferConfig(core::usize channels)
{
    return buffer::RingBufferConfig{
        .channelCount = channels,
        .sampleRate = kRate,
        .retentionSec = 5.0,
        .outOfOrderToleranceSec = 0.1};
}

ExtractorConfig extractorConfig(core::usize channels, JitterPolicy policy = JitterPolicy::kFlag)
{
    ExtractorConfig config;
    config.geometry.sampleRate = kRate;
    config.geometry.channelCount = channels;
    config.jitterPolicy = policy;
    return config;
}

void fill(buffer::SampleRingBuffer &buffer, core::usize from, core::usize to, core::usize skipEvery = 0)
{
    for (core::usize i = from; i < to; ++i)
    {
        if (skipEvery != 0 && i % skipEvery == 0)
            continue;
        std::vector<core::f32> values(buffer.channelCount());
        for (core::usize ch = 0; ch < values.size(); ++ch)
            values[ch] = static_cast<core::f32>(i) + static_cast<core::f32>(ch) * 1000.0f;
        REQUIRE(buffer.ingest(static_cast<core::f64>(i) / kRate, values).has_value());
    }
}

} // namespace

TEST_CASE("EpochGeometry defaults describe a 200 sample epoch", "[epoch][geometry]")
{
    EpochGeometry geo;
    REQUIRE(geo.validate().has_value());
    REQUIRE(geo.expectedSamples() == 200);
    REQUIRE_THAT(geo.epochEnd(), WithinAbs(0.6, 1e-12));
}

TEST_CASE("EpochGeometry rejects nonsensical windows", "[epoch][geometry]")
{
    EpochGeometry geo;

    SECTION("reversed baseline")
    {
        geo.baselineStart = 0.0;
        geo.baselineEnd = -0.2;
    }
    SECTION("baseline after stimulus")
    {
        geo.baselineEnd = 0.1;
    }
    SECTION("response window past the epoch")
    {
        geo.responseEnd = 0.9;
    }
    SECTION("epoch ending before the stimulus")
    {
        geo.epochLength = 0.1;
    }

    auto result = geo.validate();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidConfig);
}

TEST_CASE("EpochExtractor copies a full-coverage window", "[epoch][extractor]")
{
    buffer::SampleRingBuffer buffer(bufferConfig(2));
    EpochExtractor extractor(buffer, extractorConfig(2));

    fill(buffer, 0, 401);

    auto epoch = extractor.extract(1.0, 7);
    REQUIRE(epoch.has_value());
    REQUIRE(epoch->eventId == 7);
    REQUIRE(epoch->channelCount() == 2);
    REQUIRE(epoch->sampleCount() == 200);
    REQUIRE(epoch->observedSamples == 200);
    REQUIRE_FALSE(epoch->jitterExceeded);
    REQUIRE_THAT(epoch->firstSampleTime, WithinAbs(0.8, 1e-9));
    REQUIRE(epoch->data(0, 0) == 200.0f);
    REQUIRE(epoch->data(1, 0) == 1200.0f);
    REQUIRE(epoch->data(0, 199) == 399.0f);
    REQUIRE(epoch->columnAt(0.0) == 50);
}

TEST_CASE("EpochExtractor never aliases the buffer", "[epoch][extractor]")
{
    buffer::SampleRingBuffer buffer(bufferConfig(1));
    EpochExtractor extractor(buffer, extractorConfig(1));
    fill(buffer, 0, 401);

    auto epoch = extractor.extract(1.0);
    REQUIRE(epoch.has_value());

    buffer.clear();
    REQUIRE(epoch->data(0, 10) == 210.0f);
}

TEST_CASE("EpochExtractor distinguishes pending from lost windows", "[epoch][extractor]")
{
    buffer::SampleRingBuffer buffer(bufferConfig(1));
    EpochExtractor extractor(buffer, extractorConfig(1));

    fill(buffer, 0, 350);
    auto pending = extractor.extract(1.0);
    REQUIRE_FALSE(pending.has_value());
    REQUIRE(pending.error().code() == core::ErrorCode::kRangeUnavailable);

    fill(buffer, 350, 250 * 8);
    auto lost = extractor.extract(1.0);
    REQUIRE_FALSE(lost.has_value());
    REQUIRE(lost.error().code() == core::ErrorCode::kRangeEvicted);
}

TEST_CASE("EpochExtractor reports dropped samples as jitter", "[epoch][extractor]")
{
    buffer::SampleRingBuffer buffer(bufferConfig(1));

    // drops one sample in ten, about 20 missing in the window
    fill(buffer, 0, 402, 10);

    SECTION("flagged by default")
    {
        EpochExtractor extractor(buffer, extractorConfig(1));
        auto epoch = extractor.extract(1.0);
        REQUIRE(epoch.has_value());
        REQUIRE(epoch->jitterExceeded);
        REQUIRE(epoch->observedSamples == 180);
        REQUIRE(epoch->sampleCount() == 200);
        REQUIRE(epoch->jitter() == -20);
    }

    SECTION("rejected under strict policy")
    {
        EpochExtractor extractor(buffer, extractorConfig(1, JitterPolicy::kReject));
        auto epoch = extractor.extract(1.0);
        REQUIRE_FALSE(epoch.has_value());
        REQUIRE(epoch.error().code() == core::ErrorCode::kJitterExceeded);
    }
}

TEST_CASE("EpochExtractor tolerates small deviations", "[epoch][extractor]")
{
    buffer::SampleRingBuffer buffer(bufferConfig(1));
    EpochExtractor extractor(buffer, extractorConfig(1, JitterPolicy::kReject));

    fill(buffer, 0, 401);
    // one late duplicate inside the window
    const std::vector<core::f32> extra{0.0f};
    REQUIRE(buffer.ingest(1.1, extra).has_value());

    auto epoch = extractor.extract(1.0);
    REQUIRE(epoch.has_value());
    REQUIRE(epoch->observedSamples == 201);
    REQUIRE_FALSE(epoch->jitterExceeded);
}

} // namespace erp::epoch
