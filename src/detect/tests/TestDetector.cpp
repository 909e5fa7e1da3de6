/**
 * @file TestDetector.cpp
 * @brief Unit tests for detect::Detector, detect::ResponseTemplate and detect::ChannelWeights.
 */

#include <catch2/catch.hpp>

#include "erp/detect/Detector.hpp"

#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace erp::detect {

using Catch::Matchers::WithinAbs;

namespace {

constexpr core::f64 kRate = 250.0;

epoch::Epoch makeEpoch(core::usize channels)
{
    epoch::Epoch e;
    e.eventId = 1;
    e.startOffset = -0.2;
    e.sampleRate = kRate;
    e.data = epoch::EpochMatrix::Zero(static_cast<Eigen::Index>(channels), 200);
    e.observedSamples = 200;
    e.expectedSamples = 200;
    return e;
}

void addNoise(epoch::Epoch &e, core::f64 stddev, std::uint64_t seed)
{
    std::mt19937_64 rng{seed};
    std::normal_distribution<core::f64> dist{0.0, stddev};
    for (Eigen::Index r = 0; r < e.data.rows(); ++r)
        for (Eigen::Index c = 0; c < e.data.cols(); ++c)
            e.data(r, c) += static_cast<core::f32>(dist(rng));
}

void addResponse(epoch::Epoch &e, core::usize channel, core::f64 amplitude, core::Seconds latency = 0.3)
{
    const core::f64 sigma = 0.1 / 3.0;
    for (Eigen::Index c = 0; c < e.data.cols(); ++c)
    {
        const core::f64 t = e.startOffset + static_cast<core::f64>(c) / kRate - latency;
        e.data(static_cast<Eigen::Index>(channel), c) +=
            static_cast<core::f32>(amplitude * std::exp(-(t * t) / (2.0 * sigma * sigma)));
    }
}

Detector makeDetector(ChannelWeights weights = {})
{
    DetectorConfig config;
    config.sampleRate = kRate;
    config.channelWeights = std::move(weights);
    auto detector = Detector::create(std::move(config));
    REQUIRE(detector.has_value());
    return std::move(*detector);
}

} // namespace

TEST_CASE("ResponseTemplate peaks at its latency", "[detect][template]")
{
    auto tpl = ResponseTemplate::create(0.3, 0.1, 0.25, kRate, 62);
    REQUIRE(tpl.has_value());
    REQUIRE(tpl->size() == 62);

    Eigen::Index argmax = 0;
    tpl->samples().maxCoeff(&argmax);
    REQUIRE((argmax == 12 || argmax == 13)); // 0.298 s and 0.302 s straddle the latency

    Eigen::RowVectorXf same = tpl->samples().transpose() * 4.0f;
    same.array() += 7.0f;
    REQUIRE_THAT(tpl->correlate(same), WithinAbs(1.0, 1e-6));

    Eigen::RowVectorXf flat = Eigen::RowVectorXf::Constant(62, 3.0f);
    REQUIRE(tpl->correlate(flat) == 0.0);

    Eigen::RowVectorXf wrongSize = Eigen::RowVectorXf::Zero(10);
    REQUIRE(tpl->correlate(wrongSize) == 0.0);
}

TEST_CASE("ResponseTemplate rejects degenerate shapes", "[detect][template]")
{
    REQUIRE_FALSE(ResponseTemplate::create(0.3, 0.0, 0.25, kRate, 62).has_value());
    REQUIRE_FALSE(ResponseTemplate::create(0.3, 0.1, 0.25, kRate, 2).has_value());
    REQUIRE_FALSE(ResponseTemplate::create(0.3, 0.1, 0.25, 0.0, 62).has_value());
}

TEST_CASE("ChannelWeights favour canonical sites", "[detect][weights]")
{
    auto weights = ChannelWeights::fromNames({"Cz", "fp1", "PZ", "O2", "c3", "C4"});
    REQUIRE(weights.size() == 6);
    REQUIRE(weights[0] == 1.0);
    REQUIRE(weights[1] == 0.7);
    REQUIRE(weights[2] == 1.0);
    REQUIRE(weights[3] == 0.7);
    REQUIRE(weights[4] == 1.0);
    REQUIRE(weights[5] == 1.0);
    REQUIRE_THAT(weights.total(), WithinAbs(5.4, 1e-12));

    REQUIRE(ChannelWeights::fromValues({0.5, 0.0}).has_value());
    REQUIRE(ChannelWeights::fromValues({0.0, 0.0}).error().code() == core::ErrorCode::kInvalidConfig);
    REQUIRE(ChannelWeights::fromValues({1.0, -0.1}).error().code() == core::ErrorCode::kInvalidConfig);
    REQUIRE_FALSE(ChannelWeights::fromValues({}).has_value());
}

TEST_CASE("Detector::create validates its configuration", "[detect][config]")
{
    auto expectInvalid = [](DetectorConfig config) {
        auto detector = Detector::create(std::move(config));
        REQUIRE_FALSE(detector.has_value());
        REQUIRE(detector.error().code() == core::ErrorCode::kInvalidConfig);
    };

    DetectorConfig config;
    config.amplitudeThreshold = 0.0;
    expectInvalid(config);

    config = {};
    config.responseEnd = config.responseStart;
    expectInvalid(config);

    config = {};
    config.minConfidence = 1.5;
    expectInvalid(config);

    config = {};
    config.amplitudeWeight = 0.0;
    config.correlationWeight = 0.0;
    expectInvalid(config);
}

TEST_CASE("Detector finds an embedded response", "[detect][score]")
{
    auto detector = makeDetector();
    auto e = makeEpoch(1);
    addNoise(e, 0.3, 7);
    addResponse(e, 0, 5.0);

    auto score = detector.score(e);
    REQUIRE(score.has_value());
    REQUIRE(score->detected);
    REQUIRE(score->confidence >= 0.6);
    REQUIRE(score->confidence <= 1.0);
    REQUIRE(score->meanPeak > 4.0);
    REQUIRE(score->meanCorrelation > 0.8);
    REQUIRE(score->channels.size() == 1);
}

TEST_CASE("Detector rejects background noise", "[detect][score]")
{
    auto detector = makeDetector();
    for (std::uint64_t seed = 1; seed <= 20; ++seed)
    {
        auto e = makeEpoch(1);
        addNoise(e, 0.3, seed);
        auto score = detector.score(e);
        REQUIRE(score.has_value());
        REQUIRE_FALSE(score->detected);
        REQUIRE(score->confidence >= 0.0);
    }

    auto flat = makeEpoch(1);
    auto score = detector.score(flat);
    REQUIRE(score.has_value());
    REQUIRE(score->confidence == 0.0);
    REQUIRE_FALSE(score->detected);
}

TEST_CASE("Detector ignores a negative deflection", "[detect][score]")
{
    auto detector = makeDetector();
    auto e = makeEpoch(1);
    addResponse(e, 0, -5.0);

    auto score = detector.score(e);
    REQUIRE(score.has_value());
    REQUIRE(score->confidence == 0.0);
    REQUIRE_FALSE(score->detected);
}

TEST_CASE("Detector is a pure function of the epoch", "[detect][score]")
{
    auto detector = makeDetector();
    auto e = makeEpoch(3);
    addNoise(e, 0.3, 42);
    addResponse(e, 1, 1.5);

    const auto before = e.data;
    auto first = detector.score(e);
    auto second = detector.score(e);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->confidence == second->confidence);
    REQUIRE(first->detected == second->detected);
    REQUIRE(e.data == before);
}

TEST_CASE("Detector weights channels by relevance", "[detect][weights]")
{
    auto e = makeEpoch(2);
    addResponse(e, 1, 2.0);

    auto uniform = makeDetector().score(e);
    REQUIRE(uniform.has_value());
    REQUIRE_THAT(uniform->meanPeak, WithinAbs(1.0, 0.05));

    auto weighted = makeDetector(ChannelWeights::fromNames({"O1", "Cz"})).score(e);
    REQUIRE(weighted.has_value());
    REQUIRE(weighted->meanPeak > uniform->meanPeak);
    REQUIRE_THAT(weighted->meanPeak, WithinAbs(2.0 / 1.7, 0.05));
}

TEST_CASE("Detector averages clamped channel scores", "[detect][weights]")
{
    auto e = makeEpoch(2);
    addResponse(e, 0, 12.0);
    addResponse(e, 1, -1.0);
    e.data.row(1).array() -= 0.5f;

    auto score = makeDetector().score(e);
    REQUIRE(score.has_value());
    REQUIRE(score->channels.size() == 2);
    REQUIRE(score->channels[0].score == 1.0);
    REQUIRE(score->channels[1].score == 0.0);
    REQUIRE_THAT(score->confidence, WithinAbs(0.5, 1e-9));
    REQUIRE_FALSE(score->detected);

    auto weighted = makeDetector(ChannelWeights::fromNames({"Cz", "O1"})).score(e);
    REQUIRE(weighted.has_value());
    REQUIRE_THAT(weighted->confidence, WithinAbs(1.0 / 1.7, 1e-9));
    REQUIRE_FALSE(weighted->detected);

    auto favoured = makeDetector(ChannelWeights::fromNames({"O1", "Cz"})).score(e);
    REQUIRE(favoured.has_value());
    REQUIRE_THAT(favoured->confidence, WithinAbs(0.7 / 1.7, 1e-9));
}

TEST_CASE("Detector reports malformed epochs", "[detect][score]")
{
    auto detector = makeDetector(ChannelWeights::fromNames({"Cz", "Pz"}));

    auto threeChannels = makeEpoch(3);
    REQUIRE(detector.score(threeChannels).error().code() == core::ErrorCode::kChannelCountMismatch);

    auto wrongRate = makeEpoch(2);
    wrongRate.sampleRate = 500.0;
    REQUIRE(detector.score(wrongRate).error().code() == core::ErrorCode::kInvalidArgument);

    auto shortEpoch = makeEpoch(2);
    shortEpoch.data = epoch::EpochMatrix::Zero(2, 100);
    REQUIRE(detector.score(shortEpoch).error().code() == core::ErrorCode::kOutOfRange);
}

} // namespace erp::detect
