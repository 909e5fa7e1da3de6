/**
 * @file SampleRingBuffer.cpp
 * @brief Implementation of the timestamp-indexed sample ring.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "erp/buffer/SampleRingBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace erp::buffer {

core::Error RangeUnavailable::toError() const
{
    std::ostringstream os;
    os << "requested [" << requestedStart << ", " << requestedEnd << "] but buffer holds ";
    if (covered.count == 0)
        os << "no samples";
    else
        os << covered.count << " samples in [" << covered.oldest << ", " << covered.newest << "]";

    return core::Error{
        evicted ? core::ErrorCode::kRangeEvicted : core::ErrorCode::kRangeUnavailable,
        os.str()};
}

// ---- Construction ----

SampleRingBuffer::SampleRingBuffer(const RingBufferConfig &config)
    : _config(config)
{
    const core::f64 nominal = std::ceil(config.retentionSec * config.sampleRate * 1.25);
    _capacity = std::max<core::usize>(static_cast<core::usize>(nominal) + 16, 2);
    _edgeSlack = 0.5 / config.sampleRate;
    _matchEpsilon = 1e-3 / config.sampleRate;

    _timestamps.resize(_capacity, 0.0);
    _values.resize(_capacity * config.channelCount, 0.0f);
}

core::ExpectedVoid SampleRingBuffer::validate(const RingBufferConfig &config)
{
    if (config.channelCount == 0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "channel count must be positive");
    if (!std::isfinite(config.sampleRate) || config.sampleRate <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "sample rate must be positive");
    if (!std::isfinite(config.retentionSec) || config.retentionSec <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "retention must be positive");
    if (!std::isfinite(config.outOfOrderToleranceSec) || config.outOfOrderToleranceSec < 0.0)
        return core::makeError(core::ErrorCode::kInvalidConfig, "out-of-order tolerance must be >= 0");
    return {};
}

// ---- Writer ----

core::ExpectedVoid SampleRingBuffer::ingest(const Sample &sample)
{
    return ingest(sample.timestamp, sample.values);
}

core::ExpectedVoid SampleRingBuffer::ingest(core::Seconds timestamp, std::span<const core::f32> values)
{
    if (values.size() != _config.channelCount)
        return core::makeError(core::ErrorCode::kChannelCountMismatch,
            "sample has " + std::to_string(values.size()) + " channels, buffer expects "
            + std::to_string(_config.channelCount));
    if (!std::isfinite(timestamp))
        return core::makeError(core::ErrorCode::kInvalidArgument, "sample timestamp is not finite");

    std::lock_guard lock{_mutex};

    if (_capacity == 0)
        return core::makeError(core::ErrorCode::kShutdown, "buffer released");

    if (_size > 0 && timestamp < _timestamps[slot(0)] - _config.outOfOrderToleranceSec)
    {
        ++_stale;
        std::ostringstream os;
        os << "sample at " << timestamp << " is older than retained start " << _timestamps[slot(0)];
        return core::makeError(core::ErrorCode::kStaleSample, os.str());
    }

    if (_size == _capacity)
    {
        popFront();
        ++_evicted;
    }

    if (_size == 0 || timestamp >= _timestamps[slot(_size - 1)])
    {
        writeSlot(slot(_size), timestamp, values);
        ++_size;
    }
    else
    {
        const core::usize pos = upperBound(timestamp);
        ++_size;
        for (core::usize i = _size - 1; i > pos; --i)
            copySlot(i - 1, i);
        writeSlot(slot(pos), timestamp, values);
    }

    const core::Seconds horizon = _timestamps[slot(_size - 1)] - _config.retentionSec;
    while (_size > 1 && _timestamps[slot(0)] < horizon)
    {
        popFront();
        ++_evicted;
    }

    return {};
}

void SampleRingBuffer::clear()
{
    std::lock_guard lock{_mutex};
    _head = 0;
    _size = 0;
}

void SampleRingBuffer::release()
{
    std::lock_guard lock{_mutex};
    _head = 0;
    _size = 0;
    _capacity = 0;
    std::vector<core::Seconds>{}.swap(_timestamps);
    std::vector<core::f32>{}.swap(_values);
}

// ---- Readers ----

SliceResult SampleRingBuffer::slice(core::Seconds start, core::Seconds end) const
{
    std::lock_guard lock{_mutex};

    if (end < start || !coversLocked(start, end))
    {
        RangeUnavailable report;
        report.requestedStart = start;
        report.requestedEnd = end;
        report.covered = coverageLocked();
        report.evicted = _size > 0 && _timestamps[slot(0)] > start + _edgeSlack;
        return std::unexpected(report);
    }

    const core::usize first = lowerBound(start - _matchEpsilon);
    const core::usize last = upperBound(end + _matchEpsilon);

    std::vector<Sample> out;
    out.reserve(last - first);
    for (core::usize i = first; i < last; ++i)
    {
        const core::usize s = slot(i);
        const auto begin = _values.begin() + static_cast<core::isize>(s * _config.channelCount);
        out.push_back(Sample{
            .timestamp = _timestamps[s],
            .values = std::vector<core::f32>(begin, begin + static_cast<core::isize>(_config.channelCount))});
    }
    return out;
}

bool SampleRingBuffer::covers(core::Seconds start, core::Seconds end) const
{
    std::lock_guard lock{_mutex};
    return end >= start && coversLocked(start, end);
}

Coverage SampleRingBuffer::coverage() const
{
    std::lock_guard lock{_mutex};
    return coverageLocked();
}

core::usize SampleRingBuffer::size() const
{
    std::lock_guard lock{_mutex};
    return _size;
}

bool SampleRingBuffer::empty() const
{
    return size() == 0;
}

core::u64 SampleRingBuffer::staleCount() const
{
    std::lock_guard lock{_mutex};
    return _stale;
}

core::u64 SampleRingBuffer::evictedCount() const
{
    std::lock_guard lock{_mutex};
    return _evicted;
}

// ---- Private ----

core::usize SampleRingBuffer::slot(core::usize logical) const noexcept
{
    return (_head + logical) % _capacity;
}

core::usize SampleRingBuffer::lowerBound(core::Seconds t) const noexcept
{
    core::usize lo = 0;
    core::usize hi = _size;
    while (lo < hi)
    {
        const core::usize mid = lo + (hi - lo) / 2;
        if (_timestamps[slot(mid)] < t)
            lo = mid + 1;
        else
            hi = mid;
    }
    return lo;
}

core::usize SampleRingBuffer::upperBound(core::Seconds t) const noexcept
{
    core::usize lo = 0;
    core::usize hi = _size;
    while (lo < hi)
    {
        const core::usize mid = lo + (hi - lo) / 2;
        if (_timestamps[slot(mid)] <= t)
            lo = mid + 1;
        else
            hi = mid;
    }
    return lo;
}

Coverage SampleRingBuffer::coverageLocked() const noexcept
{
    if (_size == 0)
        return {};
    return Coverage{
        .oldest = _timestamps[slot(0)],
        .newest = _timestamps[slot(_size - 1)],
        .count = _size};
}

bool SampleRingBuffer::coversLocked(core::Seconds start, core::Seconds end) const noexcept
{
    if (_size == 0)
        return false;
    return _timestamps[slot(0)] <= start + _edgeSlack
        && _timestamps[slot(_size - 1)] >= end - _edgeSlack;
}

void SampleRingBuffer::writeSlot(core::usize physical, core::Seconds timestamp,
                                 std::span<const core::f32> values) noexcept
{
    _timestamps[physical] = timestamp;
    std::copy(values.begin(), values.end(),
              _values.begin() + static_cast<core::isize>(physical * _config.channelCount));
}

void SampleRingBuffer::copySlot(core::usize fromLogical, core::usize toLogical) noexcept
{
    const core::usize from = slot(fromLogical);
    const core::usize to = slot(toLogical);
    const auto channels = static_cast<core::isize>(_config.channelCount);

    _timestamps[to] = _timestamps[from];
    const auto src = _values.begin() + static_cast<core::isize>(from) * channels;
    std::copy(src, src + channels, _values.begin() + static_cast<core::isize>(to) * channels);
}

void SampleRingBuffer::popFront() noexcept
{
    _head = (_head + 1) % _capacity;
    --_size;
}

} // namespace erp::buffer
