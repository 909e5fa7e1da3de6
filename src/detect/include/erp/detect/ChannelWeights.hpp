/**
 * @file ChannelWeights.hpp
 * @brief Per-electrode relevance weights used when averaging channel scores.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_DETECT_CHANNEL_WEIGHTS_HPP
    #define ERP_DETECT_CHANNEL_WEIGHTS_HPP

    #include "erp/core/Constants.hpp"
    #include "erp/core/Expected.hpp"

    #include <string>
    #include <vector>

namespace erp::detect {

class ChannelWeights final {
public:
    ChannelWeights() = default;

    /**
     * @brief Full weight for the canonical centro-parietal sites (Cz, C3, C4, Pz),
     *        @p peripheral for every other label. Matching ignores case.
     */
    [[nodiscard]] static ChannelWeights fromNames(const std::vector<std::string> &names,
                                                  core::f64 canonical = core::kCanonicalChannelWeight,
                                                  core::f64 peripheral = core::kPeripheralChannelWeight);

    /** @brief Explicit weights; each must be finite and non-negative, not all zero. */
    [[nodiscard]] static core::Expected<ChannelWeights> fromValues(std::vector<core::f64> values);

    [[nodiscard]] static ChannelWeights uniform(core::usize channelCount);

    [[nodiscard]] static bool isCanonicalSite(const std::string &name) noexcept;

    [[nodiscard]] const std::vector<core::f64> &values() const noexcept { return _values; }
    [[nodiscard]] core::usize size() const noexcept { return _values.size(); }
    [[nodiscard]] core::f64 operator[](core::usize i) const noexcept { return _values[i]; }
    [[nodiscard]] core::f64 total() const noexcept;

private:
    explicit ChannelWeights(std::vector<core::f64> values) : _values(std::move(values)) {}

    std::vector<core::f64> _values;
};

} // namespace erp::detect

#endif // ERP_DETECT_CHANNEL_WEIGHTS_HPP
