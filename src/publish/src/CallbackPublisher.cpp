/**
 * @file CallbackPublisher.cpp
 * @brief Callable-backed publisher.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/publish/CallbackPublisher.hpp"

namespace erp::publish {

CallbackPublisher::CallbackPublisher(Callback callback) : _callback(std::move(callback)) {}

core::ExpectedVoid CallbackPublisher::publish(const detect::DetectionResult &result)
{
    if (!_callback)
        return core::makeError(core::ErrorCode::kPublishFailed, "callback publisher has no target");
    return _callback(result);
}

} // namespace erp::publish
