/**
 * @file Constants.hpp
 * @brief Default acquisition, epoch, and detection parameters.
 *
 * Every value here is a default for PipelineConfig::Builder; none of them
 * is read directly by the processing stages.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_CORE_CONSTANTS_HPP
    #define ERP_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace erp::core {

// ---- Acquisition ----

inline constexpr f64   kDefaultSampleRate       = 250.0;
inline constexpr usize kDefaultChannelCount     = 1;
inline constexpr f64   kDefaultRetentionSec     = 5.0;
inline constexpr f64   kDefaultOutOfOrderSec    = 0.1;

// ---- Epoch geometry (seconds relative to the stimulus) ----

inline constexpr f64 kDefaultBaselineStartSec = -0.2;
inline constexpr f64 kDefaultBaselineEndSec   = 0.0;
inline constexpr f64 kDefaultEpochLengthSec   = 0.8;
inline constexpr f64 kDefaultResponseStartSec = 0.25;
inline constexpr f64 kDefaultResponseEndSec   = 0.5;

inline constexpr usize kDefaultJitterToleranceSamples = 2;

// ---- Preprocessing ----

inline constexpr f64   kDefaultBandLowHz   = 0.5;
inline constexpr f64   kDefaultBandHighHz  = 30.0;
inline constexpr usize kDefaultFilterOrder = 4;
inline constexpr f64   kMainsNotchHz       = 50.0;

// ---- Detection ----

inline constexpr f64 kDefaultTemplateLatencySec = 0.3;
inline constexpr f64 kDefaultTemplateWidthSec   = 0.1;
inline constexpr f64 kDefaultAmplitudeThresholdUv = 2.0;
inline constexpr f64 kDefaultAmplitudeWeight    = 0.7;
inline constexpr f64 kDefaultCorrelationWeight  = 0.3;
inline constexpr f64 kDefaultMinConfidence      = 0.6;
inline constexpr f64 kCanonicalChannelWeight    = 1.0;
inline constexpr f64 kPeripheralChannelWeight   = 0.7;

// ---- Clock reconciliation ----

inline constexpr f64   kDefaultClockWindowSec        = 30.0;
inline constexpr usize kDefaultClockMaxCorrespondences = 512;
inline constexpr usize kDefaultClockMinCorrespondences = 1;
inline constexpr f64   kMinDriftSpanSec              = 1.0;

// ---- Scheduling ----

inline constexpr f64   kDefaultPollTickSec       = 0.02;
inline constexpr f64   kDefaultStatusIntervalSec = 10.0;
inline constexpr usize kDefaultDeferredEvents    = 64;

} // namespace erp::core

#endif // ERP_CORE_CONSTANTS_HPP
