/**
 * @file EpochExtractor.hpp
 * @brief Carves fixed-shape epochs out of the sample ring buffer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_EPOCH_EPOCH_EXTRACTOR_HPP
    #define ERP_EPOCH_EPOCH_EXTRACTOR_HPP

    #include "erp/buffer/SampleRingBuffer.hpp"
    #include "erp/epoch/Epoch.hpp"
    #include "erp/epoch/EpochGeometry.hpp"

namespace erp::epoch {

/**
 * @brief What to do when the observed sample count is off by more than the tolerance.
 */
enum class JitterPolicy : core::u8 {
    kFlag = 0, ///< keep the epoch, set Epoch::jitterExceeded
    kReject    ///< fail the extraction with kJitterExceeded
};

struct ExtractorConfig {
    EpochGeometry geometry;
    core::usize jitterToleranceSamples = core::kDefaultJitterToleranceSamples;
    JitterPolicy jitterPolicy = JitterPolicy::kFlag;
};

/**
 * @brief Stateless reader of a SampleRingBuffer.
 *
 * The extracted block always has geometry.expectedSamples() columns. When
 * fewer samples were observed the last one is held; the deviation is
 * reported through Epoch::observedSamples and Epoch::jitterExceeded.
 */
class EpochExtractor final {
public:
    EpochExtractor(const buffer::SampleRingBuffer &buffer, ExtractorConfig config);

    /**
     * @brief Extracts the epoch anchored at @p anchorTime (local clock).
     * @return kRangeUnavailable while the window is not covered yet,
     *         kRangeEvicted when it never will be, kJitterExceeded under
     *         JitterPolicy::kReject.
     */
    [[nodiscard]] core::Expected<Epoch> extract(core::Seconds anchorTime, core::u64 eventId = 0) const;

    [[nodiscard]] core::Seconds windowStart(core::Seconds anchorTime) const noexcept
    {
        return anchorTime + _config.geometry.baselineStart;
    }

    [[nodiscard]] core::Seconds windowEnd(core::Seconds anchorTime) const noexcept
    {
        return anchorTime + _config.geometry.epochEnd();
    }

    [[nodiscard]] const ExtractorConfig &config() const noexcept { return _config; }

private:
    const buffer::SampleRingBuffer &_buffer;
    ExtractorConfig _config;
};

} // namespace erp::epoch

#endif // ERP_EPOCH_EPOCH_EXTRACTOR_HPP
