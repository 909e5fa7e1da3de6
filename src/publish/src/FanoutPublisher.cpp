/**
 * @file FanoutPublisher.cpp
 * @brief Broadcast publisher.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/publish/FanoutPublisher.hpp"

#include "erp/core/Log.hpp"

#include <string>

namespace erp::publish {

void FanoutPublisher::add(std::unique_ptr<IResultPublisher> sink)
{
    if (sink)
        _sinks.push_back(std::move(sink));
}

core::ExpectedVoid FanoutPublisher::publish(const detect::DetectionResult &result)
{
    core::ExpectedVoid status{};
    for (auto &sink : _sinks)
    {
        auto sent = sink->publish(result);
        if (sent.has_value())
            continue;

        core::Log::warn("Publish", std::string(sink->name()) + ": " + sent.error().message());
        if (status.has_value())
            status = std::unexpected(std::move(sent.error()));
    }
    return status;
}

} // namespace erp::publish
