/**
 * @file TestSampleRingBuffer.cpp
 * @brief Unit tests for buffer::SampleRingBuffer.
 */

#include <catch2/catch.hpp>

#include "erp/buffer/SampleRingBuffer.hpp"

#include <vector>

namespace erp::buffer {

using Catch::Matchers::WithinAbs;

namespace {

constexpr core::f64 kRate = 250.0;

RingBufferConfig makeConfig(core::usize channels = 1)
{
    return RingBufferConfig{
        .channelCount = channels,
        .sampleRate = kRate,
        .retentionSec = 5.0,
        .outOfOrderToleranceSec = 0.1};
}

void fill(SampleRingBuffer &buffer, core::usize fromIndex, core::usize toIndex)
{
    for (core::usize i = fromIndex; i < toIndex; ++i)
    {
        const auto t = static_cast<core::f64>(i) / kRate;
        const std::vector<core::f32> values{static_cast<core::f32>(i)};
        REQUIRE(buffer.ingest(t, values).has_value());
    }
}

} // namespace

TEST_CASE("SampleRingBuffer validates its configuration", "[buffer][ringbuffer]")
{
    REQUIRE(SampleRingBuffer::validate(makeConfig()).has_value());

    auto config = makeConfig();
    config.channelCount = 0;
    REQUIRE(SampleRingBuffer::validate(config).error().code() == core::ErrorCode::kInvalidConfig);

    config = makeConfig();
    config.sampleRate = 0.0;
    REQUIRE_FALSE(SampleRingBuffer::validate(config).has_value());

    config = makeConfig();
    config.retentionSec = -1.0;
    REQUIRE_FALSE(SampleRingBuffer::validate(config).has_value());
}

TEST_CASE("SampleRingBuffer keeps samples ordered and reports coverage", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());
    REQUIRE(buffer.empty());

    fill(buffer, 0, 100);

    const auto cov = buffer.coverage();
    REQUIRE(cov.count == 100);
    REQUIRE_THAT(cov.oldest, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(cov.newest, WithinAbs(99.0 / kRate, 1e-12));
}

TEST_CASE("SampleRingBuffer evicts data older than the retention window", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());

    fill(buffer, 0, 250 * 8);

    const auto cov = buffer.coverage();
    REQUIRE_THAT(cov.newest - cov.oldest, WithinAbs(5.0, 1.0 / kRate));
    REQUIRE((cov.count == 1250 || cov.count == 1251));
    REQUIRE(buffer.evictedCount() == 250 * 8 - cov.count);
    REQUIRE(buffer.size() <= buffer.capacity());
}

TEST_CASE("SampleRingBuffer inserts slightly late samples in order", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());

    const std::vector<core::f32> v{1.0f};
    REQUIRE(buffer.ingest(1.000, v).has_value());
    REQUIRE(buffer.ingest(1.008, v).has_value());
    REQUIRE(buffer.ingest(1.004, v).has_value());
    REQUIRE(buffer.ingest(0.950, v).has_value());

    auto slice = buffer.slice(0.950, 1.008);
    REQUIRE(slice.has_value());
    REQUIRE(slice->size() == 4);
    for (core::usize i = 1; i < slice->size(); ++i)
        REQUIRE((*slice)[i - 1].timestamp <= (*slice)[i].timestamp);
}

TEST_CASE("SampleRingBuffer rejects stale and malformed samples", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig(2));

    const std::vector<core::f32> ok{1.0f, 2.0f};
    REQUIRE(buffer.ingest(10.0, ok).has_value());

    SECTION("older than the tolerance is stale and dropped")
    {
        auto result = buffer.ingest(9.5, ok);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kStaleSample);
        REQUIRE(buffer.size() == 1);
        REQUIRE(buffer.staleCount() == 1);
    }

    SECTION("wrong channel count")
    {
        const std::vector<core::f32> bad{1.0f};
        auto result = buffer.ingest(10.1, bad);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kChannelCountMismatch);
    }
}

TEST_CASE("SampleRingBuffer slice returns copies of the inclusive range", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());
    fill(buffer, 0, 750);

    auto slice = buffer.slice(0.8, 1.6);
    REQUIRE(slice.has_value());
    REQUIRE(slice->size() == 201);
    REQUIRE_THAT(slice->front().timestamp, WithinAbs(0.8, 1e-9));
    REQUIRE_THAT(slice->back().timestamp, WithinAbs(1.6, 1e-9));
    REQUIRE(slice->front().values.size() == 1);
    REQUIRE(slice->front().values[0] == 200.0f);

    fill(buffer, 750, 800);
    REQUIRE(slice->front().values[0] == 200.0f);
}

TEST_CASE("SampleRingBuffer reports a range that is not covered yet", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());

    // 1.55 s of history: samples 0 .. 387
    fill(buffer, 0, 388);

    auto slice = buffer.slice(0.8, 1.6);
    REQUIRE_FALSE(slice.has_value());

    const auto &report = slice.error();
    REQUIRE_FALSE(report.permanentlyLost());
    REQUIRE(report.covered.count == 388);
    REQUIRE_THAT(report.covered.newest, WithinAbs(387.0 / kRate, 1e-12));
    REQUIRE(report.toError().code() == core::ErrorCode::kRangeUnavailable);
    REQUIRE_FALSE(buffer.covers(0.8, 1.6));

    fill(buffer, 388, 401);
    REQUIRE(buffer.covers(0.8, 1.6));
    REQUIRE(buffer.slice(0.8, 1.6).has_value());
}

TEST_CASE("SampleRingBuffer reports a range whose start was evicted", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());
    fill(buffer, 0, 250 * 7);

    auto slice = buffer.slice(0.5, 1.3);
    REQUIRE_FALSE(slice.has_value());
    REQUIRE(slice.error().permanentlyLost());
    REQUIRE(slice.error().toError().code() == core::ErrorCode::kRangeEvicted);
}

TEST_CASE("SampleRingBuffer release frees storage and refuses new samples", "[buffer][ringbuffer]")
{
    SampleRingBuffer buffer(makeConfig());
    fill(buffer, 0, 10);

    buffer.release();
    REQUIRE(buffer.empty());

    const std::vector<core::f32> v{1.0f};
    auto result = buffer.ingest(1.0, v);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kShutdown);
}

} // namespace erp::buffer
