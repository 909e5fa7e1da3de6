/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy and move operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_CORE_NON_COPYABLE_HPP
    #define ERP_CORE_NON_COPYABLE_HPP

namespace erp::core {

/**
 * @brief Inherit (privately) to pin an object that owns a mutex, a thread,
 *        or state referenced by other components.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)                 = delete;
    NonCopyable &operator=(NonCopyable &&)      = delete;
};

} // namespace erp::core

#endif // ERP_CORE_NON_COPYABLE_HPP
