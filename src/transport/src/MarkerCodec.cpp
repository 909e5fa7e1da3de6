/**
 * @file MarkerCodec.cpp
 * @brief Marker string parsing and formatting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/transport/MarkerCodec.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace erp::transport {

namespace {

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

core::Expected<std::string> requireIdentifier(const MarkerFields &fields, std::string_view marker)
{
    auto id = fields.find(kIdentifierKey);
    if (!id || id->empty())
        return core::makeError(core::ErrorCode::kParseError, "marker without identifier: '" + std::string(marker) + "'");
    return std::string(*id);
}

core::Expected<bool> parseFlag(std::string_view value, std::string_view key)
{
    if (value == "1" || value == "true")
        return true;
    if (value == "0" || value == "false")
        return false;
    return core::makeError(core::ErrorCode::kParseError, "invalid " + std::string(key) + " flag '" + std::string(value) + "'");
}

} // namespace

std::optional<std::string_view> MarkerFields::find(std::string_view key) const noexcept
{
    for (const auto &[k, v] : fields)
    {
        if (k == key)
            return std::string_view(v);
    }
    return std::nullopt;
}

core::Expected<MarkerFields> parseMarker(std::string_view marker)
{
    marker = trim(marker);

    MarkerFields result;
    bool first = true;
    while (true)
    {
        const auto bar = marker.find('|');
        const std::string_view token = trim(marker.substr(0, bar));

        if (first)
        {
            if (token.empty())
                return core::makeError(core::ErrorCode::kParseError, "marker without kind");
            result.kind = std::string(token);
            first = false;
        }
        else if (!token.empty())
        {
            const auto eq = token.find('=');
            if (eq == std::string_view::npos || eq == 0)
            {
                return core::makeError(core::ErrorCode::kParseError,
                                       "malformed marker field '" + std::string(token) + "'");
            }
            result.fields.emplace_back(std::string(trim(token.substr(0, eq))), std::string(trim(token.substr(eq + 1))));
        }

        if (bar == std::string_view::npos)
            break;
        marker.remove_prefix(bar + 1);
    }
    return result;
}

core::Expected<sync::StimulusEvent> decodeMarker(std::string_view marker, core::Seconds timestamp)
{
    const auto fields = ERP_TRY(parseMarker(marker));

    sync::StimulusEvent event;
    event.timestamp = timestamp;
    if (fields.kind == kFlashMarker)
        event.kind = sync::StimulusKind::kFlash;
    else if (fields.kind == kTargetMarker)
        event.kind = sync::StimulusKind::kTargetSet;
    else
        return core::makeError(core::ErrorCode::kParseError, "unknown marker kind '" + fields.kind + "'");

    event.identifier = ERP_TRY(requireIdentifier(fields, marker));
    return event;
}

std::string encodeStimulus(const sync::StimulusEvent &event)
{
    std::string out{event.kind == sync::StimulusKind::kFlash ? kFlashMarker : kTargetMarker};
    out += '|';
    out += kIdentifierKey;
    out += '=';
    out += event.identifier;
    return out;
}

std::string encodeResult(const detect::DetectionResult &result)
{
    char confidence[32];
    std::snprintf(confidence, sizeof(confidence), "%.3f", result.confidence);

    std::string out{result.detected ? kDetectedMarker : kRejectedMarker};
    out += '|';
    out += kIdentifierKey;
    out += '=';
    out += result.identifier;
    out += "|confidence=";
    out += confidence;
    out += result.isTargetHypothesis ? "|target=1" : "|target=0";
    if (result.jitterFlagged)
        out += "|jitter=1";
    return out;
}

core::Expected<detect::DetectionResult> decodeResult(std::string_view marker)
{
    const auto fields = ERP_TRY(parseMarker(marker));

    detect::DetectionResult result;
    if (fields.kind == kDetectedMarker)
        result.detected = true;
    else if (fields.kind != kRejectedMarker)
        return core::makeError(core::ErrorCode::kParseError, "not a result marker: '" + fields.kind + "'");

    result.identifier = ERP_TRY(requireIdentifier(fields, marker));

    const auto confidence = fields.find("confidence");
    if (!confidence)
        return core::makeError(core::ErrorCode::kParseError, "result without confidence");

    const std::string text{*confidence};
    char *end = nullptr;
    errno = 0;
    const core::f64 value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno != 0 || !std::isfinite(value) || value < 0.0 ||
        value > 1.0)
        return core::makeError(core::ErrorCode::kParseError, "invalid confidence '" + text + "'");
    result.confidence = value;

    if (auto target = fields.find("target"))
        result.isTargetHypothesis = ERP_TRY(parseFlag(*target, "target"));
    if (auto jitter = fields.find("jitter"))
        result.jitterFlagged = ERP_TRY(parseFlag(*jitter, "jitter"));
    return result;
}

} // namespace erp::transport
