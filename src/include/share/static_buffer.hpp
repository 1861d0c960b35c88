#pragma once
/**
 * @file static_buffer.hpp
 * @brief Lending read-only data with static storage duration to the kernel.
 *
 * String literals, constant tables and other process-lifetime data can be lent
 * without first copying them into a Buffer. The kernel may only read them: a
 * ReadWrite request is refused before reaching the kernel, and a capability
 * that fixes ReadWrite at compile time does not compile.
 *
 * @code
 * static const char kGreeting[] = "Hello, World!\n";
 * StaticBuffer<char[15], StaticCapability<AccessMode::ReadOnly, 1, 1>> msg{kernel, kGreeting};
 * auto st = msg.share();
 * @endcode
 */

#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

#include "share/kernel_abi.hpp"
#include "share/share_state.hpp"
#include "utils/result.hpp"

namespace pinshare
{

template <typename T, ShareCapability Cap>
class StaticBuffer
{
    static_assert(!capability_fixes_read_write<Cap>(),
                  "StaticBuffer storage is read-only; a ReadWrite capability cannot lend it.");

  public:
    using value_type = T;
    using capability_type = Cap;

    /**
     * @brief Wraps `data`, which must outlive the StaticBuffer (in practice:
     *        static storage duration).
     */
    StaticBuffer(SharePrimitive &kernel, const T &data) noexcept
        : m_kernel(&kernel), m_data(std::addressof(data))
    {
    }

    StaticBuffer(const StaticBuffer &) = delete;
    StaticBuffer &operator=(const StaticBuffer &) = delete;
    StaticBuffer(StaticBuffer &&) = delete;
    StaticBuffer &operator=(StaticBuffer &&) = delete;

    ~StaticBuffer()
    {
        if (const auto info = m_cap.info())
        {
            detail::unshare_region(*m_kernel, *info);
        }
    }

    /**
     * @brief Lends the data to the kernel, read-only.
     * @return ok; AlreadyShared; ReadOnlyStorage for a ReadWrite request;
     *         Kernel with the kernel's code if the kernel refuses.
     */
    template <typename... Args>
    [[nodiscard]] Status share(Args &&...args)
    {
        if (m_cap.is_shared())
        {
            return make_share_error(ShareError::AlreadyShared);
        }
        const ShareInfo info = Cap::request(std::forward<Args>(args)...);
        if (info.mode == AccessMode::ReadWrite)
        {
            return make_share_error(ShareError::ReadOnlyStorage);
        }
        auto status = detail::share_region(*m_kernel, info, std::as_bytes(std::span<const T, 1>(m_data, 1)));
        if (status.is_ok())
        {
            m_cap.mark_shared(info);
        }
        return status;
    }

    [[nodiscard]] bool is_shared() const noexcept { return m_cap.is_shared(); }
    [[nodiscard]] std::optional<ShareInfo> share_state() const noexcept { return m_cap.info(); }

    /// The data; null while the kernel holds it.
    [[nodiscard]] const T *access() const noexcept { return m_cap.is_shared() ? nullptr : m_data; }

    /// Revokes the share, if any, and returns the data. Idempotent.
    const T &reclaim() noexcept
    {
        if (const auto info = m_cap.info())
        {
            detail::unshare_region(*m_kernel, *info);
            m_cap.mark_unshared();
        }
        return *m_data;
    }

  private:
    SharePrimitive *m_kernel;
    const T *m_data;
    Cap m_cap{};
};

} // namespace pinshare
