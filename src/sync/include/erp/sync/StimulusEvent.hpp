/**
 * @file StimulusEvent.hpp
 * @brief Decoded stimulus marker as consumed by the synchronizer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_SYNC_STIMULUS_EVENT_HPP
    #define ERP_SYNC_STIMULUS_EVENT_HPP

    #include "erp/core/Types.hpp"

    #include <string>
    #include <string_view>

namespace erp::sync {

enum class StimulusKind : core::u8 {
    kTargetSet = 0, ///< identifier becomes the current focus
    kFlash          ///< identifier was just presented
};

[[nodiscard]] constexpr std::string_view stimulusKindName(StimulusKind kind) noexcept
{
    switch (kind) {
        case StimulusKind::kTargetSet: return "target_set";
        case StimulusKind::kFlash:     return "flash";
    }
    return "unknown";
}

/**
 * @brief A discrete marker, timestamped on its producer's clock.
 */
struct StimulusEvent {
    core::Seconds timestamp = 0.0;
    StimulusKind kind = StimulusKind::kFlash;
    std::string identifier;
};

} // namespace erp::sync

#endif // ERP_SYNC_STIMULUS_EVENT_HPP
