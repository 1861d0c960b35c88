#pragma once
/**
 * @file share_state.hpp
 * @brief Capability descriptors: how a buffer records whether, and how, it is lent.
 *
 * Every buffer carries one capability object. It answers two questions:
 *  - which (mode, driver, buffer) a share request addresses (`request(...)`),
 *  - whether the buffer is currently shared, and under which ShareInfo.
 *
 * Three descriptors cover the ways an application knows its resources:
 *
 * | Descriptor                          | mode         | resource id  | state          |
 * |-------------------------------------|--------------|--------------|----------------|
 * | StaticCapability<Mode, Drv, Buf>    | compile time | compile time | one flag       |
 * | ModeCapability<Drv, Buf>            | share time   | compile time | optional mode  |
 * | DynamicCapability                   | share time   | share time   | optional info  |
 *
 * The state machine is the same for all three: Unshared, then Shared(info) after
 * a successful share, then Unshared again on reclaim, exchange or destruction.
 *
 * The kernel interaction itself lives in the non-template functions of
 * `detail`, so all buffer types funnel through one implementation.
 */

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "pinshare_export.h"
#include "share/kernel_abi.hpp"
#include "utils/result.hpp"

namespace pinshare
{

namespace detail
{

/**
 * @brief Lends `region` to the kernel under `info`.
 *
 * Returns ok, or `ShareError::Kernel` carrying the kernel's code. The caller
 * records the new state only on success.
 */
PINSHARE_EXPORT Status share_region(SharePrimitive &kernel, const ShareInfo &info,
                                    std::span<const std::byte> region);

/**
 * @brief Revokes the slot `info`. The kernel never touches the region afterwards.
 */
PINSHARE_EXPORT void unshare_region(SharePrimitive &kernel, const ShareInfo &info) noexcept;

} // namespace detail

/**
 * @brief Requirements on a capability descriptor.
 */
template <typename C>
concept ShareCapability = std::default_initializable<C> && requires(C c, const C cc, const ShareInfo &info) {
    { cc.is_shared() } noexcept -> std::same_as<bool>;
    { cc.info() } noexcept -> std::same_as<std::optional<ShareInfo>>;
    { c.mark_shared(info) } noexcept;
    { c.mark_unshared() } noexcept;
};

/**
 * @brief Mode and resource id fixed at compile time; the state is a single flag.
 *
 * @code
 * using ConsoleOut = StaticCapability<AccessMode::ReadOnly, 1, 1>;
 * ByteBuffer<16, ConsoleOut> msg{kernel};
 * auto st = msg.share();
 * @endcode
 */
template <AccessMode Mode, uint32_t Driver, uint32_t Slot>
class StaticCapability
{
  public:
    static constexpr AccessMode kMode = Mode;
    static constexpr ResourceId kId{Driver, Slot};

    static constexpr ShareInfo request() noexcept { return ShareInfo{kMode, kId}; }

    bool is_shared() const noexcept { return m_shared; }
    std::optional<ShareInfo> info() const noexcept
    {
        if (!m_shared)
            return std::nullopt;
        return ShareInfo{kMode, kId};
    }
    // `info` always equals request(): exchange only moves shares between
    // buffers of the same capability type.
    void mark_shared(const ShareInfo &) noexcept { m_shared = true; }
    void mark_unshared() noexcept { m_shared = false; }

  private:
    bool m_shared{false};
};

/**
 * @brief Resource id fixed at compile time, mode chosen at each share.
 */
template <uint32_t Driver, uint32_t Slot>
class ModeCapability
{
  public:
    static constexpr ResourceId kId{Driver, Slot};

    static constexpr ShareInfo request(AccessMode mode) noexcept { return ShareInfo{mode, kId}; }

    bool is_shared() const noexcept { return m_mode.has_value(); }
    std::optional<ShareInfo> info() const noexcept
    {
        if (!m_mode)
            return std::nullopt;
        return ShareInfo{*m_mode, kId};
    }
    void mark_shared(const ShareInfo &info) noexcept { m_mode = info.mode; }
    void mark_unshared() noexcept { m_mode.reset(); }

  private:
    std::optional<AccessMode> m_mode;
};

/**
 * @brief Mode and resource id both chosen at each share, e.g. from RuntimeConfig.
 */
class DynamicCapability
{
  public:
    static constexpr ShareInfo request(AccessMode mode, ResourceId id) noexcept
    {
        return ShareInfo{mode, id};
    }
    static constexpr ShareInfo request(const ShareInfo &info) noexcept { return info; }

    bool is_shared() const noexcept { return m_info.has_value(); }
    std::optional<ShareInfo> info() const noexcept { return m_info; }
    void mark_shared(const ShareInfo &info) noexcept { m_info = info; }
    void mark_unshared() noexcept { m_info.reset(); }

  private:
    std::optional<ShareInfo> m_info;
};

/**
 * @brief True if `Cap` fixes the ReadWrite mode at compile time.
 */
template <typename Cap>
constexpr bool capability_fixes_read_write() noexcept
{
    if constexpr (requires { Cap::kMode; })
    {
        return Cap::kMode == AccessMode::ReadWrite;
    }
    else
    {
        return false;
    }
}

} // namespace pinshare
