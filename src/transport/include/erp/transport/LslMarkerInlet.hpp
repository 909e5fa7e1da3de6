/**
 * @file LslMarkerInlet.hpp
 * @brief String marker inlet over Lab Streaming Layer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_LSL_MARKER_INLET_HPP
    #define ERP_TRANSPORT_LSL_MARKER_INLET_HPP

    #include "erp/core/Expected.hpp"
    #include "erp/transport/LslCommon.hpp"
    #include "erp/transport/MarkerCodec.hpp"

    #include <memory>
    #include <string>
    #include <vector>

namespace erp::transport {

/**
 * @brief RAII wrapper around a cf_string lsl::stream_inlet.
 *
 * Markers come out undecoded; decoding happens on the consumer side so
 * parse errors are reported where they are handled.
 */
class LslMarkerInlet {
public:
    LslMarkerInlet();
    ~LslMarkerInlet();

    LslMarkerInlet(LslMarkerInlet &&) noexcept;
    LslMarkerInlet &operator=(LslMarkerInlet &&) noexcept;

    [[nodiscard]] core::ExpectedVoid open(const LslInletConfig &config);

    /**
     * @brief Pulls up to @p maxMarkers markers, waiting at most @p timeoutSec for the first.
     * @return Number of markers appended to @p out.
     */
    [[nodiscard]] core::Expected<core::usize> pull(std::vector<RawMarker> &out, core::usize maxMarkers,
                                                   core::f64 timeoutSec);

    [[nodiscard]] core::Expected<TimeCorrection> timeCorrection();

    [[nodiscard]] bool isOpen() const noexcept;
    void close() noexcept;

    [[nodiscard]] const std::string &streamName() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace erp::transport

#endif // ERP_TRANSPORT_LSL_MARKER_INLET_HPP
