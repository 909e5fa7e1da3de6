/**
 * @file IResultPublisher.hpp
 * @brief Sink for detection results (Strategy pattern).
 *
 * Concrete implementations:
 *   - CallbackPublisher   forwards to a user callable (tests, embedding).
 *   - FanoutPublisher     forwards to several publishers.
 *   - transport::LslResultPublisher  pushes marker strings to an LSL outlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_PUBLISH_IRESULT_PUBLISHER_HPP
    #define ERP_PUBLISH_IRESULT_PUBLISHER_HPP

    #include "erp/core/Expected.hpp"
    #include "erp/detect/DetectionResult.hpp"

namespace erp::publish {

class IResultPublisher {
public:
    virtual ~IResultPublisher() = default;

    /**
     * @brief Hands one result to the external transport.
     *
     * A failure is reported to the caller; the result is not retried.
     */
    [[nodiscard]] virtual core::ExpectedVoid publish(const detect::DetectionResult &result) = 0;

    /** @brief Human-readable publisher name. */
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

} // namespace erp::publish

#endif // ERP_PUBLISH_IRESULT_PUBLISHER_HPP
