/**
 * @file DetectionResult.hpp
 * @brief Decision record emitted once per scored epoch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_DETECT_DETECTION_RESULT_HPP
    #define ERP_DETECT_DETECTION_RESULT_HPP

    #include "erp/core/Types.hpp"

    #include <string>

namespace erp::detect {

struct DetectionResult {
    core::u64 eventId = 0;
    std::string identifier;              ///< flashed identifier the result pertains to
    core::Seconds timestamp = 0.0;       ///< stimulus time, local clock
    core::Seconds sourceTimestamp = 0.0; ///< stimulus time, producer clock
    core::f64 confidence = 0.0;          ///< in [0, 1]
    bool detected = false;               ///< confidence >= min confidence
    bool isTargetHypothesis = false;     ///< identifier was the focus when flashed
    bool jitterFlagged = false;          ///< scored from an epoch with an off sample count
};

} // namespace erp::detect

#endif // ERP_DETECT_DETECTION_RESULT_HPP
