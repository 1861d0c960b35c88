#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace pinshare::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * Used where a sequence of kernel interactions must be rolled back if a later
 * step fails, e.g. a buffer is lent to a driver and then the command that
 * starts the transfer is rejected:
 *
 * @code
 *  auto rollback = pinshare::basics::make_scope_guard([&] { (void)rng_buf.reclaim(); });
 *  auto cmd = kernel.command(kRngDriver, kGetBytes, len, 0);
 *  if (cmd.is_error())
 *      return;              // rollback reclaims the buffer
 *  rollback.dismiss();      // the transfer is running, keep the buffer lent
 * @endcode
 *
 * The callable must be `noexcept`: cleanup in this library is unsharing, which
 * cannot fail, and a destructor has no way to report an error anyway.
 *
 * Movable but not copyable; a moved-from guard is inactive.
 *
 * ### Thread Safety
 *
 * Not thread-safe. A guard belongs to the scope that created it.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept; cleanup cannot report errors.");

    /**
     * @brief Checks if the guard is active and will execute on scope exit.
     */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /**
     * @brief Move constructor. The source guard is dismissed.
     */
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable now if active, then dismisses the guard.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief A factory function to create a ScopeGuard.
 *
 * @note The callable is stored by value. Any references it captures must
 *       outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace pinshare::basics
