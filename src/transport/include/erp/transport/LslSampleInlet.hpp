/**
 * @file LslSampleInlet.hpp
 * @brief Multi-channel EEG inlet over Lab Streaming Layer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_LSL_SAMPLE_INLET_HPP
    #define ERP_TRANSPORT_LSL_SAMPLE_INLET_HPP

    #include "erp/buffer/Sample.hpp"
    #include "erp/core/Expected.hpp"
    #include "erp/transport/LslCommon.hpp"

    #include <memory>
    #include <string>
    #include <vector>

namespace erp::transport {

/**
 * @brief RAII wrapper around a numeric lsl::stream_inlet.
 *
 * Timestamps are left on the producer's clock; the pipeline translates them.
 * Not thread-safe: one acquisition thread owns an inlet.
 */
class LslSampleInlet {
public:
    LslSampleInlet();
    ~LslSampleInlet();

    LslSampleInlet(LslSampleInlet &&) noexcept;
    LslSampleInlet &operator=(LslSampleInlet &&) noexcept;

    /** @brief Resolves the first available stream and opens the inlet. */
    [[nodiscard]] core::ExpectedVoid open(const LslInletConfig &config);

    /**
     * @brief Pulls up to @p maxSamples samples into @p out.
     *
     * Waits at most @p timeoutSec for the first sample, then takes whatever
     * is already available without blocking.
     *
     * @return Number of samples appended.
     */
    [[nodiscard]] core::Expected<core::usize> pull(std::vector<buffer::Sample> &out, core::usize maxSamples,
                                                   core::f64 timeoutSec);

    /** @brief Refreshes the producer/local clock correspondence. */
    [[nodiscard]] core::Expected<TimeCorrection> timeCorrection();

    [[nodiscard]] bool isOpen() const noexcept;
    void close() noexcept;

    [[nodiscard]] core::usize channelCount() const noexcept;
    [[nodiscard]] core::f64 sampleRate() const noexcept;
    [[nodiscard]] const std::string &streamName() const noexcept;
    [[nodiscard]] const std::vector<std::string> &channelLabels() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace erp::transport

#endif // ERP_TRANSPORT_LSL_SAMPLE_INLET_HPP
