/**
 * @file LslResultPublisher.hpp
 * @brief Publishes detection results as string markers on an LSL outlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_LSL_RESULT_PUBLISHER_HPP
    #define ERP_TRANSPORT_LSL_RESULT_PUBLISHER_HPP

    #include "erp/publish/IResultPublisher.hpp"

    #include <memory>
    #include <string>

namespace erp::transport {

struct LslResultOutletConfig {
    std::string streamName = "P300Detection";
    std::string streamType = "Markers";
    std::string sourceId = "erp_detector";
};

/**
 * @brief Irregular-rate cf_string outlet carrying encodeResult() strings.
 *
 * Each result is stamped with its stimulus time so consumers can restore
 * event order.
 */
class LslResultPublisher final : public publish::IResultPublisher {
public:
    LslResultPublisher();
    ~LslResultPublisher() override;

    [[nodiscard]] core::ExpectedVoid open(const LslResultOutletConfig &config);

    [[nodiscard]] core::ExpectedVoid publish(const detect::DetectionResult &result) override;
    [[nodiscard]] const char *name() const noexcept override { return "lsl"; }

    [[nodiscard]] bool isOpen() const noexcept;
    void close() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace erp::transport

#endif // ERP_TRANSPORT_LSL_RESULT_PUBLISHER_HPP
