/**
 * @file LslSampleInlet.cpp
 * @brief Implementation of the LSL EEG inlet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/transport/LslSampleInlet.hpp"

#include "LslResolve.hpp"
#include "erp/core/Log.hpp"

namespace erp::transport {

struct LslSampleInlet::Impl {
    std::unique_ptr<lsl::stream_inlet> inlet;
    LslInletConfig config;
    std::string streamName;
    std::vector<std::string> labels;
    core::usize channelCount = 0;
    core::f64 sampleRate = 0.0;
    std::vector<core::f32> scratch;
};

namespace {

std::vector<std::string> readLabels(const lsl::stream_info &info, core::usize channelCount)
{
    std::vector<std::string> labels;
    labels.reserve(channelCount);

    lsl::xml_element channel = info.desc().child("channels").child("channel");
    while (!channel.empty() && labels.size() < channelCount)
    {
        labels.emplace_back(channel.child_value("label"));
        channel = channel.next_sibling("channel");
    }
    while (labels.size() < channelCount)
        labels.push_back("Ch" + std::to_string(labels.size() + 1));
    return labels;
}

} // namespace

LslSampleInlet::LslSampleInlet() = default;
LslSampleInlet::~LslSampleInlet() = default;
LslSampleInlet::LslSampleInlet(LslSampleInlet &&) noexcept = default;
LslSampleInlet &LslSampleInlet::operator=(LslSampleInlet &&) noexcept = default;

core::ExpectedVoid LslSampleInlet::open(const LslInletConfig &config)
{
    if (isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL sample inlet already open");

    const auto resolved = ERP_TRY(detail::resolveFirst(config));
    if (resolved.channel_format() == lsl::cf_string)
        return core::makeError(core::ErrorCode::kTransportFailed, "stream '" + resolved.name() + "' carries strings");

    auto impl = std::make_unique<Impl>();
    try
    {
        impl->inlet = std::make_unique<lsl::stream_inlet>(resolved);
        const lsl::stream_info full = impl->inlet->info(config.resolveTimeoutSec);
        impl->channelCount = static_cast<core::usize>(full.channel_count());
        impl->sampleRate = full.nominal_srate();
        impl->streamName = full.name();
        impl->labels = readLabels(full, impl->channelCount);
        impl->inlet->open_stream(config.resolveTimeoutSec);
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }

    impl->config = config;
    impl->scratch.resize(impl->channelCount);
    core::Log::info("Lsl", "connected to '" + impl->streamName + "' (" + std::to_string(impl->channelCount) +
                               " channels, " + std::to_string(impl->sampleRate) + " Hz)");
    _impl = std::move(impl);
    return {};
}

core::Expected<core::usize> LslSampleInlet::pull(std::vector<buffer::Sample> &out, core::usize maxSamples,
                                                  core::f64 timeoutSec)
{
    if (!isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL sample inlet not open");

    core::usize count = 0;
    try
    {
        while (count < maxSamples)
        {
            const core::f64 timestamp = _impl->inlet->pull_sample(
                _impl->scratch.data(), static_cast<int>(_impl->channelCount), count == 0 ? timeoutSec : 0.0);
            if (timestamp == 0.0)
                break;

            out.push_back(buffer::Sample{timestamp, _impl->scratch});
            ++count;
        }
    }
    catch (const lsl::lost_error &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, std::string("stream lost: ") + e.what());
    }
    catch (const std::exception &e)
    {
        return core::makeError(core::ErrorCode::kTransportFailed, e.what());
    }
    return count;
}

core::Expected<TimeCorrection> LslSampleInlet::timeCorrection()
{
    if (!isOpen())
        return core::makeError(core::ErrorCode::kInvalidState, "LSL sample inlet not open");
    return detail::queryCorrection(*_impl->inlet, _impl->config.source, _impl->config.correctionTimeoutSec);
}

bool LslSampleInlet::isOpen() const noexcept
{
    return _impl && _impl->inlet != nullptr;
}

void LslSampleInlet::close() noexcept
{
    _impl.reset();
}

core::usize LslSampleInlet::channelCount() const noexcept
{
    return _impl ? _impl->channelCount : 0;
}

core::f64 LslSampleInlet::sampleRate() const noexcept
{
    return _impl ? _impl->sampleRate : 0.0;
}

const std::string &LslSampleInlet::streamName() const noexcept
{
    static const std::string kNone;
    return _impl ? _impl->streamName : kNone;
}

const std::vector<std::string> &LslSampleInlet::channelLabels() const noexcept
{
    static const std::vector<std::string> kNone;
    return _impl ? _impl->labels : kNone;
}

} // namespace erp::transport
