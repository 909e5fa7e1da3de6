/**
 * @file CallbackPublisher.hpp
 * @brief Publisher forwarding every result to a callable.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_PUBLISH_CALLBACK_PUBLISHER_HPP
    #define ERP_PUBLISH_CALLBACK_PUBLISHER_HPP

    #include "erp/publish/IResultPublisher.hpp"

    #include <functional>

namespace erp::publish {

class CallbackPublisher final : public IResultPublisher {
public:
    using Callback = std::function<core::ExpectedVoid(const detect::DetectionResult &)>;

    explicit CallbackPublisher(Callback callback);

    [[nodiscard]] core::ExpectedVoid publish(const detect::DetectionResult &result) override;
    [[nodiscard]] const char *name() const noexcept override { return "callback"; }

private:
    Callback _callback;
};

} // namespace erp::publish

#endif // ERP_PUBLISH_CALLBACK_PUBLISHER_HPP
