/**
 * @file InboundQueue.hpp
 * @brief Lock-free SPSC hand-off between an acquisition thread and the pipeline.
 *
 * Each transport inlet runs on its own thread and owns the producer side;
 * the thread feeding the pipeline owns the consumer side.
 *
 * @see https://www.boost.org/doc/libs/release/doc/html/lockfree.html
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_INBOUND_QUEUE_HPP
    #define ERP_TRANSPORT_INBOUND_QUEUE_HPP

    #include "erp/core/Types.hpp"

    #include <boost/lockfree/spsc_queue.hpp>

    #include <atomic>
    #include <bit>
    #include <utility>

namespace erp::transport {

/**
 * @brief Bounded wait-free queue with overflow accounting.
 *
 * @tparam T        Element type
 * @tparam Capacity Maximum number of queued elements (power of two)
 *
 * Exactly one thread calls push(), exactly one calls pop()/drain().
 *
 * @code
 *   InboundQueue<buffer::Sample, 4096> samples;
 *
 *   // acquisition thread
 *   if (!samples.push(sample)) { ... }
 *
 *   // pipeline feeder
 *   samples.drain([&](buffer::Sample &s) { feed(s); });
 * @endcode
 */
template <typename T, core::usize Capacity = 4096>
    requires (std::has_single_bit(Capacity))
class InboundQueue {
public:
    InboundQueue();

    /**
     * @brief Enqueues an element (producer side).
     * @return false, and counts a drop, when the queue is full.
     */
    bool push(const T &item);

    /** @brief Dequeues one element (consumer side). */
    bool pop(T &item);

    /**
     * @brief Dequeues every available element, invoking @p callback on each.
     * @tparam Func Callable with signature void(T&)
     * @return Number of elements drained
     */
    template <typename Func>
    core::usize drain(Func &&callback);

    /** @brief Approximate number of queued elements, consumer side. */
    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /** @brief Elements refused because the queue was full. */
    [[nodiscard]] core::u64 dropped() const noexcept { return _dropped.load(std::memory_order_relaxed); }

    [[nodiscard]] static constexpr core::usize capacity() noexcept { return Capacity; }

private:
    boost::lockfree::spsc_queue<T> _queue;
    std::atomic<core::u64> _dropped{0};
};

} // namespace erp::transport

    #include "InboundQueue.inl"

#endif // ERP_TRANSPORT_INBOUND_QUEUE_HPP
