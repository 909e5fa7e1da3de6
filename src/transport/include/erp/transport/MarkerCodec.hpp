/**
 * @file MarkerCodec.hpp
 * @brief String markers exchanged with the stimulus presenter and result consumers.
 *
 * Grammar: `kind|key=value|key=value...`
 *
 *   square_flash|square=e4                    -> StimulusKind::kFlash
 *   set_target|square=e4                      -> StimulusKind::kTargetSet
 *   p300_detected|square=e4|confidence=0.812  <- detected result
 *   p300_rejected|square=e4|confidence=0.214  <- result below min confidence
 *
 * Results may carry `target=0|1` and `jitter=1` after the confidence.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_MARKER_CODEC_HPP
    #define ERP_TRANSPORT_MARKER_CODEC_HPP

    #include "erp/core/Expected.hpp"
    #include "erp/detect/DetectionResult.hpp"
    #include "erp/sync/StimulusEvent.hpp"

    #include <optional>
    #include <string>
    #include <string_view>
    #include <utility>
    #include <vector>

namespace erp::transport {

inline constexpr std::string_view kFlashMarker = "square_flash";
inline constexpr std::string_view kTargetMarker = "set_target";
inline constexpr std::string_view kDetectedMarker = "p300_detected";
inline constexpr std::string_view kRejectedMarker = "p300_rejected";
inline constexpr std::string_view kIdentifierKey = "square";

/**
 * @brief Marker as received from a transport, before decoding.
 */
struct RawMarker {
    core::SourceId source = 0;
    core::Seconds timestamp = 0.0; ///< producer clock
    std::string payload;
};

/**
 * @brief Tokenized marker: leading kind, then ordered key/value pairs.
 */
struct MarkerFields {
    std::string kind;
    std::vector<std::pair<std::string, std::string>> fields;

    [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept;
};

/** @brief Splits a marker; fails with kParseError on an empty kind or a field without '='. */
[[nodiscard]] core::Expected<MarkerFields> parseMarker(std::string_view marker);

/**
 * @brief Decodes a stimulus marker.
 * @param timestamp Producer-clock timestamp the marker arrived with.
 */
[[nodiscard]] core::Expected<sync::StimulusEvent> decodeMarker(std::string_view marker, core::Seconds timestamp);

[[nodiscard]] std::string encodeStimulus(const sync::StimulusEvent &event);

/** @brief Serializes a result; the confidence is written with three decimals. */
[[nodiscard]] std::string encodeResult(const detect::DetectionResult &result);

/**
 * @brief Reads back a result string. Only the fields carried by the
 *        string are filled; event ids and times are left at zero.
 */
[[nodiscard]] core::Expected<detect::DetectionResult> decodeResult(std::string_view marker);

} // namespace erp::transport

#endif // ERP_TRANSPORT_MARKER_CODEC_HPP
