/**
 * @file Detector.hpp
 * @brief Stateless evoked-response scorer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_DETECT_DETECTOR_HPP
    #define ERP_DETECT_DETECTOR_HPP

    #include "erp/detect/ChannelWeights.hpp"
    #include "erp/detect/ResponseTemplate.hpp"
    #include "erp/epoch/Epoch.hpp"

    #include <optional>
    #include <vector>

namespace erp::detect {

struct DetectorConfig {
    core::f64 sampleRate = core::kDefaultSampleRate;
    core::Seconds responseStart = core::kDefaultResponseStartSec;
    core::Seconds responseEnd = core::kDefaultResponseEndSec;
    core::Seconds templateLatency = core::kDefaultTemplateLatencySec;
    core::Seconds templateWidth = core::kDefaultTemplateWidthSec;
    core::f64 amplitudeThreshold = core::kDefaultAmplitudeThresholdUv;
    core::f64 amplitudeWeight = core::kDefaultAmplitudeWeight;
    core::f64 correlationWeight = core::kDefaultCorrelationWeight;
    core::f64 minConfidence = core::kDefaultMinConfidence;
    ChannelWeights channelWeights; ///< empty: uniform over the epoch's channels
};

struct ChannelScore {
    core::f64 peak = 0.0;        ///< max amplitude inside the response window
    core::f64 correlation = 0.0; ///< Pearson correlation with the template
    core::f64 score = 0.0;       ///< combined, clamped to [0, 1]
};

struct DetectionScore {
    core::f64 confidence = 0.0;
    bool detected = false;
    core::f64 meanPeak = 0.0;        ///< channel-weighted, diagnostic only
    core::f64 meanCorrelation = 0.0; ///< channel-weighted, diagnostic only
    std::vector<ChannelScore> channels;
};

/**
 * @brief Scores a preprocessed epoch against a Gaussian response template.
 *
 * Inside the response window every channel is scored from its peak and its
 * template correlation,
 *
 *     score = clamp(wA * peak / threshold + wC * correlation, 0, 1)
 *
 * and the confidence is the channel-weighted mean of those scores. The
 * weighted mean peak and correlation are reported alongside.
 *
 * The scorer holds no history; identical epochs give identical scores.
 */
class Detector final {
public:
    [[nodiscard]] static core::Expected<Detector> create(DetectorConfig config);

    [[nodiscard]] core::Expected<DetectionScore> score(const epoch::Epoch &epoch) const;

    [[nodiscard]] const DetectorConfig &config() const noexcept { return _config; }
    [[nodiscard]] const ResponseTemplate &responseTemplate() const noexcept { return *_template; }

private:
    Detector(DetectorConfig config, ResponseTemplate tpl);

    DetectorConfig _config;
    std::optional<ResponseTemplate> _template;
};

} // namespace erp::detect

#endif // ERP_DETECT_DETECTOR_HPP
