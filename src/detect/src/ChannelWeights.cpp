/**
 * @file ChannelWeights.cpp
 * @brief Channel weight derivation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/detect/ChannelWeights.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <numeric>
#include <string_view>

namespace erp::detect {

namespace {

constexpr std::array<std::string_view, 4> kCanonicalSites = {"cz", "c3", "c4", "pz"};

bool equalsIgnoreCase(const std::string &lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size())
        return false;
    for (core::usize i = 0; i < lhs.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != static_cast<unsigned char>(rhs[i]))
            return false;
    }
    return true;
}

} // namespace

bool ChannelWeights::isCanonicalSite(const std::string &name) noexcept
{
    for (auto site : kCanonicalSites)
    {
        if (equalsIgnoreCase(name, site))
            return true;
    }
    return false;
}

ChannelWeights ChannelWeights::fromNames(const std::vector<std::string> &names, core::f64 canonical,
                                         core::f64 peripheral)
{
    std::vector<core::f64> values;
    values.reserve(names.size());
    for (const auto &name : names)
        values.push_back(isCanonicalSite(name) ? canonical : peripheral);
    return ChannelWeights{std::move(values)};
}

core::Expected<ChannelWeights> ChannelWeights::fromValues(std::vector<core::f64> values)
{
    if (values.empty())
        return core::makeError(core::ErrorCode::kInvalidConfig, "channel weights are empty");

    bool anyPositive = false;
    for (auto w : values)
    {
        if (!std::isfinite(w) || w < 0.0)
            return core::makeError(core::ErrorCode::kInvalidConfig, "channel weights must be finite and non-negative");
        anyPositive = anyPositive || w > 0.0;
    }
    if (!anyPositive)
        return core::makeError(core::ErrorCode::kInvalidConfig, "channel weights are all zero");

    return ChannelWeights{std::move(values)};
}

ChannelWeights ChannelWeights::uniform(core::usize channelCount)
{
    return ChannelWeights{std::vector<core::f64>(channelCount, 1.0)};
}

core::f64 ChannelWeights::total() const noexcept
{
    return std::accumulate(_values.begin(), _values.end(), 0.0);
}

} // namespace erp::detect
