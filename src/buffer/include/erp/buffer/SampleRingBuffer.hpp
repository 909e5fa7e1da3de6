/**
 * @file SampleRingBuffer.hpp
 * @brief Fixed-duration, timestamp-indexed store of multi-channel samples.
 *
 * The buffer keeps the most recent @c retentionSec seconds of data in a
 * preallocated ring (timestamps and interleaved channel values). Samples
 * are kept in non-decreasing timestamp order; slightly late samples are
 * inserted in place, samples older than the oldest retained one by more
 * than the out-of-order tolerance are rejected as stale.
 *
 * Thread safety: one writer (ingest) and any number of readers (slice,
 * coverage). Every operation holds the internal mutex for a bounded time:
 * ingest touches at most a few slots, slice copies only the requested range.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_BUFFER_SAMPLE_RING_BUFFER_HPP
    #define ERP_BUFFER_SAMPLE_RING_BUFFER_HPP

    #include "erp/buffer/Sample.hpp"
    #include "erp/core/Expected.hpp"
    #include "erp/core/NonCopyable.hpp"

    #include <expected>
    #include <mutex>
    #include <span>
    #include <vector>

namespace erp::buffer {

/**
 * @brief Construction parameters of a SampleRingBuffer.
 */
struct RingBufferConfig {
    core::usize channelCount = 1;
    core::f64 sampleRate = 250.0;
    core::f64 retentionSec = 5.0;
    core::f64 outOfOrderToleranceSec = 0.1;
};

/**
 * @brief Time range currently held by the buffer.
 */
struct Coverage {
    core::Seconds oldest = 0.0;
    core::Seconds newest = 0.0;
    core::usize count = 0;
};

/**
 * @brief Report returned when a requested range is not fully covered.
 *
 * Distinguishes a range that is not covered yet (retry later) from one
 * whose start has already been evicted (abandon).
 */
struct RangeUnavailable {
    core::Seconds requestedStart = 0.0;
    core::Seconds requestedEnd = 0.0;
    Coverage covered;
    bool evicted = false;

    /**
     * @brief True when the start of the range has already left the buffer.
     */
    [[nodiscard]] bool permanentlyLost() const noexcept { return evicted; }

    /**
     * @brief Converts the report into an Error (kRangeUnavailable or kRangeEvicted).
     */
    [[nodiscard]] core::Error toError() const;
};

using SliceResult = std::expected<std::vector<Sample>, RangeUnavailable>;

/**
 * @brief Timestamp-indexed multi-channel sample store.
 *
 * @code
 *   SampleRingBuffer buffer({.channelCount = 1, .sampleRate = 250.0});
 *   buffer.ingest({.timestamp = 0.0, .values = {1.0f}});
 *   auto slice = buffer.slice(0.0, 0.5);
 *   if (!slice && !slice.error().permanentlyLost()) { ... retry later ... }
 * @endcode
 */
class SampleRingBuffer final : private core::NonCopyable<SampleRingBuffer> {
public:
    /**
     * @brief Allocates storage for the retention window.
     * @param config Buffer geometry. Use validate() first when the values
     *               come from outside.
     */
    explicit SampleRingBuffer(const RingBufferConfig &config);

    /**
     * @brief Checks that @p config describes a usable buffer.
     */
    [[nodiscard]] static core::ExpectedVoid validate(const RingBufferConfig &config);

    /**
     * @brief Appends one sample, evicting data older than the retention window.
     *
     * @return kStaleSample when the sample is older than the oldest retained
     *         sample by more than the tolerance (the sample is dropped),
     *         kChannelCountMismatch when the channel count differs.
     */
    [[nodiscard]] core::ExpectedVoid ingest(core::Seconds timestamp, std::span<const core::f32> values);
    [[nodiscard]] core::ExpectedVoid ingest(const Sample &sample);

    /**
     * @brief Copies every sample with @p start <= timestamp <= @p end.
     *
     * Succeeds only when the range is fully covered (within half a sample
     * period at each edge); otherwise reports what is actually held.
     */
    [[nodiscard]] SliceResult slice(core::Seconds start, core::Seconds end) const;

    /**
     * @brief True when [start, end] would be returned by slice().
     */
    [[nodiscard]] bool covers(core::Seconds start, core::Seconds end) const;

    [[nodiscard]] Coverage coverage() const;
    [[nodiscard]] core::usize size() const;
    [[nodiscard]] bool empty() const;

    /**
     * @brief Drops every sample, keeping the storage.
     */
    void clear();

    /**
     * @brief Drops every sample and frees the storage. Later ingests fail
     *        with kShutdown.
     */
    void release();

    [[nodiscard]] core::usize channelCount() const noexcept { return _config.channelCount; }
    [[nodiscard]] core::f64 sampleRate() const noexcept { return _config.sampleRate; }
    [[nodiscard]] core::usize capacity() const noexcept { return _capacity; }

    /** @brief Samples rejected as stale since construction. */
    [[nodiscard]] core::u64 staleCount() const;

    /** @brief Samples evicted by the retention window or a full ring. */
    [[nodiscard]] core::u64 evictedCount() const;

private:
    [[nodiscard]] core::usize slot(core::usize logical) const noexcept;
    [[nodiscard]] core::usize lowerBound(core::Seconds t) const noexcept;
    [[nodiscard]] core::usize upperBound(core::Seconds t) const noexcept;
    [[nodiscard]] Coverage coverageLocked() const noexcept;
    [[nodiscard]] bool coversLocked(core::Seconds start, core::Seconds end) const noexcept;

    void writeSlot(core::usize physical, core::Seconds timestamp, std::span<const core::f32> values) noexcept;
    void copySlot(core::usize fromLogical, core::usize toLogical) noexcept;
    void popFront() noexcept;

    RingBufferConfig _config;
    core::usize _capacity = 0;
    core::f64 _edgeSlack = 0.0;
    core::f64 _matchEpsilon = 0.0;

    mutable std::mutex _mutex;
    std::vector<core::Seconds> _timestamps;
    std::vector<core::f32> _values;
    core::usize _head = 0;
    core::usize _size = 0;
    core::u64 _stale = 0;
    core::u64 _evicted = 0;
};

} // namespace erp::buffer

#endif // ERP_BUFFER_SAMPLE_RING_BUFFER_HPP
