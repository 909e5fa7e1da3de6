/**
 * @file LslEegOutlet.cpp
 * @brief Implementation of the LSL EEG outlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/transport/LslEegOutlet.hpp"

#include "erp/core/Log.hpp"

#include <lsl_cpp.h>

namespace erp::transport {

struct LslEegOutlet::Impl {
    std::unique_ptr<lsl::stream_outlet> outlet;
    core::usize channelCount = 0;
};

LslEegOutlet::LslEegOutlet() = default;
LslEegOutlet::~LslEegOutlet() = default;

core::ExpectedVoid LslEegOutlet::open(const LslEegOutletConfig &config)
{
    if (isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL EEG outlet already open");
    if (config.channelLabels.empty() || !(config.sampleRate > 0.0))
        return core::makeError(core::ErrorCode::kInvalidConfig, "EEG outlet needs channels and a positive rate");

    auto impl = std::make_unique<Impl>();
    impl->channelCount = config.channelLabels.size();
    try
    {
        lsl::stream_info info(config.streamName, config.streamType, static_cast<int>(impl->channelCount),
                              config.sampleRate, lsl::cf_float32, config.sourceId);

        lsl::xml_element channels = info.desc().append_child("channels");
        for (const auto &label : config.channelLabels)
        {
            channels.append_child("channel")
                .append_child_value("label", label)
                .append_child_value("unit", config.unit)
                .append_child_value("type", config.streamType);
        }
        impl->outlet = std::make_unique<lsl::stream_outlet>(info);
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }

    core::Log::info("Lsl", "streaming '" + config.streamName + "' (" + std::to_string(impl->channelCount) +
                               " channels)");
    _impl = std::move(impl);
    return {};
}

core::ExpectedVoid LslEegOutlet::pushSample(std::span<const core::f32> values, core::Seconds timestamp)
{
    if (!isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL EEG outlet not open");
    if (values.size() != _impl->channelCount)
        return core::makeError(core::ErrorCode::kChannelCountMismatch, "sample width differs from the outlet's");

    try
    {
        _impl->outlet->push_sample(values.data(), timestamp);
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }
    return {};
}

bool LslEegOutlet::hasConsumers() const
{
    return isOpen() && _impl->outlet->have_consumers();
}

bool LslEegOutlet::isOpen() const noexcept
{
    return _impl && _impl->outlet != nullptr;
}

void LslEegOutlet::close() noexcept
{
    _impl.reset();
}

} // namespace erp::transport
