/**
 * @file LslResultPublisher.cpp
 * @brief Implementation of the LSL result outlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/transport/LslResultPublisher.hpp"

#include "erp/core/Log.hpp"
#include "erp/transport/MarkerCodec.hpp"

#include <lsl_cpp.h>

#include <vector>

namespace erp::transport {

struct LslResultPublisher::Impl {
    std::unique_ptr<lsl::stream_outlet> outlet;
};

LslResultPublisher::LslResultPublisher() = default;
LslResultPublisher::~LslResultPublisher() = default;

core::ExpectedVoid LslResultPublisher::open(const LslResultOutletConfig &config)
{
    if (isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL result outlet already open");

    auto impl = std::make_unique<Impl>();
    try
    {
        lsl::stream_info info(config.streamName, config.streamType, 1, lsl::IRREGULAR_RATE, lsl::cf_string,
                              config.sourceId);
        impl->outlet = std::make_unique<lsl::stream_outlet>(info);
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }

    core::Log::info("Lsl", "publishing results on '" + config.streamName + "'");
    _impl = std::move(impl);
    return {};
}

core::ExpectedVoid LslResultPublisher::publish(const detect::DetectionResult &result)
{
    if (!isOpen())
        return core::makeError(core::ErrorCode::kPublishFailed, "LSL result outlet not open");

    std::vector<std::string> sample{encodeResult(result)};
    try
    {
        _impl->outlet->push_sample(sample, result.timestamp);
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kPublishFailed, e.what());
    }
    return {};
}

bool LslResultPublisher::isOpen() const noexcept
{
    return _impl && _impl->outlet != nullptr;
}

void LslResultPublisher::close() noexcept
{
    _impl.reset();
}

} // namespace erp::transport
