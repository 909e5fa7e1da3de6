/**
 * @file ResponseTemplate.cpp
 * @brief Template sampling and correlation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/detect/ResponseTemplate.hpp"

#include <cmath>

namespace erp::detect {

ResponseTemplate::ResponseTemplate(Eigen::VectorXf samples)
    : _samples(std::move(samples))
{
    _centered = _samples.cast<core::f64>();
    _centered.array() -= _centered.mean();
    _norm = _centered.norm();
}

core::Expected<ResponseTemplate> ResponseTemplate::create(core::Seconds latency, core::Seconds width,
                                                          core::Seconds windowStart, core::f64 sampleRate,
                                                          core::usize count)
{
    if (!(width > 0.0) || !std::isfinite(latency))
        return core::makeError(core::ErrorCode::kInvalidConfig, "template width must be positive");
    if (!(sampleRate > 0.0) || count < 3)
        return core::makeError(core::ErrorCode::kInvalidConfig, "template needs at least three samples");

    const core::f64 sigma = width / 3.0;
    Eigen::VectorXf samples(static_cast<Eigen::Index>(count));
    for (core::usize i = 0; i < count; ++i)
    {
        const core::f64 t = windowStart + static_cast<core::f64>(i) / sampleRate;
        const core::f64 d = t - latency;
        samples(static_cast<Eigen::Index>(i)) = static_cast<core::f32>(std::exp(-(d * d) / (2.0 * sigma * sigma)));
    }

    ResponseTemplate tpl{std::move(samples)};
    if (tpl._norm <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "template is flat over the response window");
    return tpl;
}

core::f64 ResponseTemplate::correlate(const Eigen::Ref<const Eigen::RowVectorXf> &segment) const noexcept
{
    if (segment.size() != _centered.size() || _norm <= 0.0)
        return 0.0;

    Eigen::VectorXd x = segment.transpose().cast<core::f64>();
    x.array() -= x.mean();
    const core::f64 xNorm = x.norm();
    if (xNorm <= 0.0 || !std::isfinite(xNorm))
        return 0.0;

    return x.dot(_centered) / (xNorm * _norm);
}

} // namespace erp::detect
