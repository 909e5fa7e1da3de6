/**
 * @file LslMarkerInlet.cpp
 * @brief Implementation of the LSL marker inlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/transport/LslMarkerInlet.hpp"

#include "LslResolve.hpp"
#include "erp/core/Log.hpp"

namespace erp::transport {

struct LslMarkerInlet::Impl {
    std::unique_ptr<lsl::stream_inlet> inlet;
    LslInletConfig config;
    std::string streamName;
    std::vector<std::string> scratch;
};

LslMarkerInlet::LslMarkerInlet() = default;
LslMarkerInlet::~LslMarkerInlet() = default;
LslMarkerInlet::LslMarkerInlet(LslMarkerInlet &&) noexcept = default;
LslMarkerInlet &LslMarkerInlet::operator=(LslMarkerInlet &&) noexcept = default;

core::ExpectedVoid LslMarkerInlet::open(const LslInletConfig &config)
{
    if (isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL marker inlet already open");

    const auto resolved = ERP_TRY(detail::resolveFirst(config));
    if (resolved.channel_format() != lsl::cf_string)
        return core::makeError(core::ErrorCode::kTransportFailed, "stream '" + resolved.name() + "' is not a marker stream");

    auto impl = std::make_unique<Impl>();
    try
    {
        impl->inlet = std::make_unique<lsl::stream_inlet>(resolved);
        impl->inlet->open_stream(config.resolveTimeoutSec);
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }

    impl->config = config;
    impl->streamName = resolved.name();
    impl->scratch.resize(static_cast<core::usize>(resolved.channel_count()));
    core::Log::info("Lsl", "listening to markers on '" + impl->streamName + "'");
    _impl = std::move(impl);
    return {};
}

core::Expected<core::usize> LslMarkerInlet::pull(std::vector<RawMarker> &out, core::usize maxMarkers,
                                                 core::f64 timeoutSec)
{
    if (!isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL marker inlet not open");

    core::usize count = 0;
    try
    {
        while (count < maxMarkers)
        {
            const core::f64 timestamp = _impl->inlet->pull_sample(_impl->scratch, count == 0 ? timeoutSec : 0.0);
            if (timestamp == 0.0)
                break;
            if (_impl->scratch.empty())
                continue;

            out.push_back(RawMarker{_impl->config.source, timestamp, _impl->scratch.front()});
            ++count;
        }
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }
    return count;
}

core::Expected<TimeCorrection> LslMarkerInlet::timeCorrection()
{
    if (!isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL marker inlet not open");
    return detail::queryCorrection(*_impl->inlet, _impl->config.source, _impl->config.correctionTimeoutSec);
}

bool LslMarkerInlet::isOpen() const noexcept
{
    return _impl && _impl->inlet != nullptr;
}

void LslMarkerInlet::close() noexcept
{
    _impl.reset();
}

const std::string &LslMarkerInlet::streamName() const noexcept
{
    static const std::string kNone;
    return _impl ? _impl->streamName : kNone;
}

} // namespace erp::transport
