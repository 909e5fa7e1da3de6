/**
 * @file LslCommon.cpp
 * @brief Stream resolution and clock correction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "LslResolve.hpp"

#include "erp/core/Log.hpp"

namespace erp::transport {

core::Seconds localClock() noexcept
{
    return lsl::local_clock();
}

namespace detail {

core::Expected<lsl::stream_info> resolveFirst(const LslInletConfig &config)
{
    if (config.streamNames.empty())
        return core::makeError(core::ErrorCode::kInvalidConfig, "no stream name to resolve");

    for (const auto &name : config.streamNames)
    {
        core::Log::info("Lsl", "resolving stream '" + name + "'");
        try
        {
            auto results = lsl::resolve_stream("name", name, 1, config.resolveTimeoutSec);
            if (!results.empty())
                return results.front();
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorCode::kTransportFailed, e.what());
        }
        core::Log::warn("Lsl", "no stream named '" + name + "' on the network");
    }
    return core::makeError(core::ErrorCode::kStreamNotFound, "none of the configured streams could be resolved");
}

core::Expected<TimeCorrection> queryCorrection(lsl::stream_inlet &inlet, core::SourceId source, core::f64 timeoutSec)
{
    try
    {
        const core::f64 offset = inlet.time_correction(timeoutSec);
        const core::Seconds now = lsl::local_clock();
        return TimeCorrection{.source = source, .sourceTime = now - offset, .localTime = now};
    }
    catch (const lsl::timeout_error &e)
    {
        return core::makeError(core::ErrorCode::kUncalibrated, e.what());
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }
}

} // namespace detail

} // namespace erp::transport
