/**
 * @file FanoutPublisher.hpp
 * @brief Publisher broadcasting each result to several sinks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_PUBLISH_FANOUT_PUBLISHER_HPP
    #define ERP_PUBLISH_FANOUT_PUBLISHER_HPP

    #include "erp/publish/IResultPublisher.hpp"

    #include <memory>
    #include <vector>

namespace erp::publish {

/**
 * @brief Every sink receives every result, even after an earlier sink failed.
 *        The first failure is the one reported.
 */
class FanoutPublisher final : public IResultPublisher {
public:
    FanoutPublisher() = default;

    void add(std::unique_ptr<IResultPublisher> sink);

    [[nodiscard]] core::ExpectedVoid publish(const detect::DetectionResult &result) override;
    [[nodiscard]] const char *name() const noexcept override { return "fanout"; }

    [[nodiscard]] core::usize size() const noexcept { return _sinks.size(); }

private:
    std::vector<std::unique_ptr<IResultPublisher>> _sinks;
};

} // namespace erp::publish

#endif // ERP_PUBLISH_FANOUT_PUBLISHER_HPP
