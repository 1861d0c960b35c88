#pragma once
/**
 * @file buffer.hpp
 * @brief A pinned buffer that can be lent to the kernel and reclaimed.
 *
 * A Buffer owns its storage and a capability descriptor recording whether the
 * storage is currently lent. While it is lent the application cannot reach the
 * storage through the Buffer (`access()` / `access_mut()` return null); it gets
 * the storage back with `reclaim()`, or by handing the kernel a replacement
 * with `exchange()`.
 *
 * ### Pinning
 * The kernel holds the storage's address while it is shared, so a Buffer is
 * neither copyable nor movable. Create it in place (a local, a member, a
 * static) and pass it by reference. Factory functions still work through
 * guaranteed copy elision.
 *
 * ### Destruction
 * Destroying a shared Buffer revokes the share first. The storage is never
 * released while the kernel can still reach it.
 *
 * ### Thread Safety
 * Not thread-safe. Completion upcalls arrive at yield points on the same thread.
 */

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

#include "share/kernel_abi.hpp"
#include "share/share_state.hpp"
#include "utils/result.hpp"

namespace pinshare
{

/**
 * @brief Result of Buffer::exchange().
 *
 * `storage` always refers to valid memory: on success it is the storage just
 * returned by the kernel; on failure it is the storage of the buffer that is
 * still lent, which must not be touched until a later reclaim or exchange.
 */
template <typename T>
struct ExchangeOutcome
{
    T &storage;
    Status status;
};

template <typename T, ShareCapability Cap>
class Buffer
{
    static_assert(std::is_trivially_copyable_v<T>,
                  "Buffer storage is lent to the kernel as raw bytes; T must be trivially copyable.");

  public:
    using value_type = T;
    using capability_type = Cap;

    /**
     * @brief Creates an unshared buffer with value-initialized storage.
     */
    explicit Buffer(SharePrimitive &kernel) requires std::default_initializable<T>
        : m_kernel(&kernel), m_storage{}
    {
    }

    Buffer(SharePrimitive &kernel, const T &initial) : m_kernel(&kernel), m_storage(initial) {}

    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;
    Buffer(Buffer &&) = delete;
    Buffer &operator=(Buffer &&) = delete;

    ~Buffer()
    {
        if (const auto info = m_cap.info())
        {
            detail::unshare_region(*m_kernel, *info);
        }
    }

    /**
     * @brief Lends the storage to the kernel.
     *
     * The arguments select mode and resource id as the capability requires:
     * none for StaticCapability, an AccessMode for ModeCapability, an
     * AccessMode and a ResourceId (or a ShareInfo) for DynamicCapability.
     *
     * @return ok; AlreadyShared if the buffer is already lent (the kernel is not
     *         called); Kernel with the kernel's code if the kernel refuses, in
     *         which case the buffer stays unshared.
     */
    template <typename... Args>
    [[nodiscard]] Status share(Args &&...args)
    {
        if (m_cap.is_shared())
        {
            return make_share_error(ShareError::AlreadyShared);
        }
        const ShareInfo info = Cap::request(std::forward<Args>(args)...);
        auto status = detail::share_region(*m_kernel, info, std::as_bytes(std::span<T, 1>(&m_storage, 1)));
        if (status.is_ok())
        {
            m_cap.mark_shared(info);
        }
        return status;
    }

    [[nodiscard]] bool is_shared() const noexcept { return m_cap.is_shared(); }

    /**
     * @brief The current share, or nullopt while the buffer is unshared.
     */
    [[nodiscard]] std::optional<ShareInfo> share_state() const noexcept { return m_cap.info(); }

    /// Read access to the storage; null while the kernel holds it.
    [[nodiscard]] const T *access() const noexcept
    {
        return m_cap.is_shared() ? nullptr : std::addressof(m_storage);
    }

    /// Write access to the storage; null while the kernel holds it.
    [[nodiscard]] T *access_mut() noexcept
    {
        return m_cap.is_shared() ? nullptr : std::addressof(m_storage);
    }

    /**
     * @brief Revokes the share, if any, and returns the storage.
     *
     * Idempotent. Also the way to cancel an in-flight kernel operation: once
     * this returns the kernel will not touch the storage again.
     */
    T &reclaim() noexcept
    {
        if (const auto info = m_cap.info())
        {
            detail::unshare_region(*m_kernel, *info);
            m_cap.mark_unshared();
        }
        return m_storage;
    }

    /**
     * @brief Hands `other` to the kernel in place of this buffer.
     *
     * `other` is shared under this buffer's mode and resource id in one kernel
     * call, which replaces this buffer's region: there is no moment at which the
     * kernel has no valid region for the slot.
     *
     * - this buffer unshared: NotShared, no kernel call.
     * - `other` bound to a different kernel: ForeignKernel, no kernel call.
     * - `other` already shared: AlreadyShared, no kernel call.
     * - kernel refuses: Kernel error; this buffer stays shared, `other` stays
     *   unshared.
     * - success: this buffer is unshared, `other` is shared, and `storage`
     *   refers to this buffer's storage (the data the kernel just produced).
     */
    template <typename U>
    [[nodiscard]] ExchangeOutcome<T> exchange(Buffer<U, Cap> &other)
    {
        const auto info = m_cap.info();
        if (!info)
        {
            return {m_storage, make_share_error(ShareError::NotShared)};
        }
        if (other.m_kernel != m_kernel)
        {
            return {m_storage, make_share_error(ShareError::ForeignKernel)};
        }
        if (other.m_cap.is_shared())
        {
            return {m_storage, make_share_error(ShareError::AlreadyShared)};
        }
        auto status = detail::share_region(*other.m_kernel, *info,
                                           std::as_bytes(std::span<U, 1>(&other.m_storage, 1)));
        if (status.is_ok())
        {
            other.m_cap.mark_shared(*info);
            m_cap.mark_unshared();
        }
        return {m_storage, std::move(status)};
    }

  private:
    template <typename, ShareCapability> friend class Buffer;

    SharePrimitive *m_kernel;
    T m_storage;
    Cap m_cap{};
};

/// The common case: a fixed-size byte array.
template <std::size_t N, ShareCapability Cap>
using ByteBuffer = Buffer<std::array<uint8_t, N>, Cap>;

} // namespace pinshare
