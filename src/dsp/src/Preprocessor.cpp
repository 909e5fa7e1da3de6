/**
 * @file Preprocessor.cpp
 * @brief Implementation of the epoch preprocessor.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/dsp/Preprocessor.hpp"

#include <cmath>
#include <vector>

namespace erp::dsp {

Preprocessor::Preprocessor(PreprocessorConfig config, SosFilter filter)
    : _config(config), _filter(std::move(filter))
{
}

core::Expected<Preprocessor> Preprocessor::create(const PreprocessorConfig &config)
{
    if (!(config.baselineStart < config.baselineEnd))
        return core::makeError(core::ErrorCode::kInvalidConfig, "baseline window is empty or reversed");

    auto filter = SosFilter::butterworthBandPass(config.bandLowHz, config.bandHighHz, config.sampleRate,
                                                 config.filterOrder);
    if (!filter)
        return core::makeError(core::ErrorCode::kInvalidConfig, filter.error().message());

    if (config.notchHz > 0.0)
    {
        if (config.notchHz >= config.sampleRate / 2.0 || config.notchQ <= 0.0)
            return core::makeError(core::ErrorCode::kInvalidConfig, "notch outside (0, Nyquist) or bad Q");
        std::vector<Biquad> notch{Biquad::notch(config.notchHz, config.sampleRate, config.notchQ)};
        filter->append(SosFilter{std::move(notch)});
    }

    return Preprocessor{config, std::move(*filter)};
}

core::Expected<epoch::Epoch> Preprocessor::process(const epoch::Epoch &raw) const
{
    if (std::abs(raw.sampleRate - _config.sampleRate) > 1e-9)
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "epoch sampled at " + std::to_string(raw.sampleRate) + " Hz, filter designed for "
            + std::to_string(_config.sampleRate) + " Hz");

    epoch::Epoch out = raw;
    ERP_TRY_VOID(bandLimit(out));
    ERP_TRY_VOID(baselineCorrect(out, _config.baselineStart, _config.baselineEnd));
    return out;
}

core::ExpectedVoid Preprocessor::bandLimit(epoch::Epoch &epoch) const
{
    if (epoch.data.size() == 0)
        return core::makeError(core::ErrorCode::kEmptyInput, "empty epoch");

    std::vector<core::f64> row(epoch.sampleCount());
    for (Eigen::Index ch = 0; ch < epoch.data.rows(); ++ch)
    {
        for (Eigen::Index i = 0; i < epoch.data.cols(); ++i)
            row[static_cast<core::usize>(i)] = static_cast<core::f64>(epoch.data(ch, i));

        const auto filtered = ERP_TRY(_filter.filtfilt(row));

        for (Eigen::Index i = 0; i < epoch.data.cols(); ++i)
            epoch.data(ch, i) = static_cast<core::f32>(filtered[static_cast<core::usize>(i)]);
    }
    return {};
}

core::ExpectedVoid Preprocessor::baselineCorrect(epoch::Epoch &epoch, core::Seconds start, core::Seconds end)
{
    const core::usize first = epoch.columnAt(start);
    const core::usize last = epoch.columnAt(end);
    if (last <= first)
        return core::makeError(core::ErrorCode::kInvalidArgument, "baseline window holds no sample");

    const auto width = static_cast<Eigen::Index>(last - first);
    for (Eigen::Index ch = 0; ch < epoch.data.rows(); ++ch)
    {
        const core::f64 mean =
            epoch.data.row(ch).segment(static_cast<Eigen::Index>(first), width).cast<core::f64>().mean();
        epoch.data.row(ch).array() -= static_cast<core::f32>(mean);
    }
    return {};
}

} // namespace erp::dsp
