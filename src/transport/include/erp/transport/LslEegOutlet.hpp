/**
 * @file LslEegOutlet.hpp
 * @brief Lab Streaming Layer outlet broadcasting multi-channel EEG.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_LSL_EEG_OUTLET_HPP
    #define ERP_TRANSPORT_LSL_EEG_OUTLET_HPP

    #include "erp/core/Expected.hpp"

    #include <memory>
    #include <span>
    #include <string>
    #include <vector>

namespace erp::transport {

struct LslEegOutletConfig {
    std::string streamName = "SimulatedEEG";
    std::string streamType = "EEG";
    std::string sourceId = "erp_simulator";
    std::vector<std::string> channelLabels{"Cz"};
    core::f64 sampleRate = 250.0;
    std::string unit = "microvolts";
};

/**
 * @brief RAII wrapper around a cf_float32 liblsl outlet.
 *
 * Channel labels, units and types are written to the stream description.
 */
class LslEegOutlet {
public:
    LslEegOutlet();
    ~LslEegOutlet();

    [[nodiscard]] core::ExpectedVoid open(const LslEegOutletConfig &config);

    /**
     * @brief Pushes one sample stamped with @p timestamp (LSL local clock).
     * @param values One value per channel.
     */
    [[nodiscard]] core::ExpectedVoid pushSample(std::span<const core::f32> values, core::Seconds timestamp);

    /** @brief True when at least one inlet is connected. */
    [[nodiscard]] bool hasConsumers() const;

    [[nodiscard]] bool isOpen() const noexcept;
    void close() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace erp::transport

#endif // ERP_TRANSPORT_LSL_EEG_OUTLET_HPP
