/**
 * @file ResponseTemplate.hpp
 * @brief Idealized evoked response sampled over the response window.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_DETECT_RESPONSE_TEMPLATE_HPP
    #define ERP_DETECT_RESPONSE_TEMPLATE_HPP

    #include "erp/core/Expected.hpp"

    #include <Eigen/Dense>

namespace erp::detect {

/**
 * @brief Gaussian bump exp(-(t - latency)^2 / (2 sigma^2)), sigma = width / 3.
 *
 * Only the shape matters: the detector compares it to data through a
 * Pearson correlation, which ignores scale and offset.
 */
class ResponseTemplate final {
public:
    /**
     * @brief Samples the template at @p sampleRate over @p count samples
     *        starting at @p windowStart (seconds after the stimulus).
     */
    [[nodiscard]] static core::Expected<ResponseTemplate> create(
        core::Seconds latency, core::Seconds width, core::Seconds windowStart,
        core::f64 sampleRate, core::usize count);

    [[nodiscard]] const Eigen::VectorXf &samples() const noexcept { return _samples; }
    [[nodiscard]] core::usize size() const noexcept { return static_cast<core::usize>(_samples.size()); }

    /**
     * @brief Pearson correlation between @p segment and the template.
     * @return 0 when either side has no variance.
     */
    [[nodiscard]] core::f64 correlate(const Eigen::Ref<const Eigen::RowVectorXf> &segment) const noexcept;

private:
    explicit ResponseTemplate(Eigen::VectorXf samples);

    Eigen::VectorXf _samples;
    Eigen::VectorXd _centered;
    core::f64 _norm = 0.0;
};

} // namespace erp::detect

#endif // ERP_DETECT_RESPONSE_TEMPLATE_HPP
