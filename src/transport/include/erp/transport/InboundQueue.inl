/**
 * @file InboundQueue.inl
 * @brief Template implementation for InboundQueue<T, Capacity>.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

namespace erp::transport {

template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity))
InboundQueue<T, Capacity>::InboundQueue()
    : _queue(Capacity)
{
}

template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity))
bool InboundQueue<T, Capacity>::push(const T &item)
{
    if (_queue.push(item))
        return true;
    _dropped.fetch_add(1, std::memory_order_relaxed);
    return false;
}

template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity))
bool InboundQueue<T, Capacity>::pop(T &item)
{
    return _queue.pop(item);
}

template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity))
template <typename Func>
core::usize InboundQueue<T, Capacity>::drain(Func &&callback)
{
    core::usize count = 0;
    T item;
    while (_queue.pop(item))
    {
        callback(item);
        ++count;
    }
    return count;
}

template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity))
core::usize InboundQueue<T, Capacity>::size() const noexcept
{
    return _queue.read_available();
}

template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity))
bool InboundQueue<T, Capacity>::empty() const noexcept
{
    return _queue.read_available() == 0;
}

} // namespace erp::transport
