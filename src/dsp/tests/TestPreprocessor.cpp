/**
 * @file TestPreprocessor.cpp
 * @brief Unit tests for dsp::Preprocessor.
 */

#include <catch2/catch.hpp>

#include "erp/dsp/Preprocessor.hpp"

#include <cmath>
#include <functional>
#include <numbers>
#include <random>

namespace erp::dsp {

using Catch::Matchers::WithinAbs;

namespace {

constexpr double kRate = 250.0;

epoch::Epoch makeEpoch(core::usize samples, const std::function<float(core::usize, double)> &signal,
                       core::usize channels = 1)
{
    epoch::Epoch e;
    e.sampleRate = kRate;
    e.startOffset = -0.2;
    e.expectedSamples = samples;
    e.observedSamples = samples;
    e.data.resize(static_cast<Eigen::Index>(channels), static_cast<Eigen::Index>(samples));
    for (core::usize ch = 0; ch < channels; ++ch)
        for (core::usize i = 0; i < samples; ++i)
            e.data(static_cast<Eigen::Index>(ch), static_cast<Eigen::Index>(i)) =
                signal(ch, static_cast<double>(i) / kRate - 0.2);
    return e;
}

float baselineMean(const epoch::Epoch &e, Eigen::Index ch)
{
    return e.data.row(ch).segment(0, 50).mean();
}

} // namespace

TEST_CASE("Preprocessor rejects invalid configurations", "[dsp][preprocessor]")
{
    SECTION("band above Nyquist")
    {
        auto p = Preprocessor::create({.bandLowHz = 0.5, .bandHighHz = 200.0});
        REQUIRE_FALSE(p.has_value());
        REQUIRE(p.error().code() == core::ErrorCode::kInvalidConfig);
    }

    SECTION("reversed baseline")
    {
        auto p = Preprocessor::create({.baselineStart = 0.0, .baselineEnd = -0.2});
        REQUIRE_FALSE(p.has_value());
    }

    SECTION("notch above Nyquist")
    {
        auto p = Preprocessor::create({.notchHz = 130.0});
        REQUIRE_FALSE(p.has_value());
    }
}

TEST_CASE("Preprocessor removes offsets and keeps in-band activity", "[dsp][preprocessor]")
{
    auto pre = Preprocessor::create({});
    REQUIRE(pre.has_value());

    const auto raw = makeEpoch(200, [](core::usize, double t) {
        return 100.0f + static_cast<float>(std::sin(2.0 * std::numbers::pi * 10.0 * t));
    });

    auto out = pre->process(raw);
    REQUIRE(out.has_value());
    REQUIRE(out->sampleCount() == 200);
    REQUIRE_THAT(baselineMean(*out, 0), WithinAbs(0.0, 1e-4));

    const float peak = out->data.row(0).segment(60, 100).maxCoeff();
    REQUIRE_THAT(peak, WithinAbs(1.0, 0.15));
}

TEST_CASE("Preprocessor is a pure function of its input", "[dsp][preprocessor]")
{
    auto pre = Preprocessor::create({});
    REQUIRE(pre.has_value());

    std::mt19937 rng(7);
    std::normal_distribution<float> noise(0.0f, 5.0f);
    const auto raw = makeEpoch(200, [&](core::usize, double) { return noise(rng); }, 3);
    const epoch::EpochMatrix before = raw.data;

    auto a = pre->process(raw);
    auto b = pre->process(raw);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->data == b->data);
    REQUIRE(raw.data == before);
}

TEST_CASE("Baseline correction is idempotent", "[dsp][preprocessor]")
{
    std::mt19937 rng(11);
    std::normal_distribution<float> noise(3.0f, 2.0f);
    auto e = makeEpoch(200, [&](core::usize ch, double) { return noise(rng) + 10.0f * static_cast<float>(ch); }, 2);

    REQUIRE(Preprocessor::baselineCorrect(e, -0.2, 0.0).has_value());
    const epoch::EpochMatrix once = e.data;

    REQUIRE(Preprocessor::baselineCorrect(e, -0.2, 0.0).has_value());
    REQUIRE((e.data - once).cwiseAbs().maxCoeff() < 1e-4f);

    for (Eigen::Index ch = 0; ch < e.data.rows(); ++ch)
        REQUIRE_THAT(baselineMean(e, ch), WithinAbs(0.0, 1e-4));
}

TEST_CASE("Baseline correction rejects an empty window", "[dsp][preprocessor]")
{
    auto e = makeEpoch(200, [](core::usize, double) { return 1.0f; });
    auto result = Preprocessor::baselineCorrect(e, 0.0, 0.0);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Preprocessor refuses epochs at another sample rate", "[dsp][preprocessor]")
{
    auto pre = Preprocessor::create({});
    REQUIRE(pre.has_value());

    auto e = makeEpoch(200, [](core::usize, double) { return 0.0f; });
    e.sampleRate = 500.0;
    REQUIRE(pre->process(e).error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Optional notch suppresses mains interference", "[dsp][preprocessor]")
{
    const auto mains = [](core::usize, double t) {
        return static_cast<float>(std::sin(2.0 * std::numbers::pi * 50.0 * t));
    };
    const auto raw = makeEpoch(1000, mains);

    auto plain = Preprocessor::create({.bandLowHz = 0.5, .bandHighHz = 100.0});
    auto notched = Preprocessor::create({.bandLowHz = 0.5, .bandHighHz = 100.0, .notchHz = 50.0});
    REQUIRE(plain.has_value());
    REQUIRE(notched.has_value());

    auto a = raw;
    auto b = raw;
    REQUIRE(plain->bandLimit(a).has_value());
    REQUIRE(notched->bandLimit(b).has_value());

    const float passed = a.data.row(0).segment(400, 200).cwiseAbs().maxCoeff();
    const float blocked = b.data.row(0).segment(400, 200).cwiseAbs().maxCoeff();
    REQUIRE(passed > 0.8f);
    REQUIRE(blocked < 0.1f);
}

} // namespace erp::dsp
