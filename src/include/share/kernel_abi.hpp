#pragma once
/**
 * @file kernel_abi.hpp
 * @brief The kernel's buffer-sharing system-call surface, as seen from a process.
 *
 * A process lends memory to a driver by "allowing" a region under a slot named
 * by (access mode, driver number, buffer number) and revokes it by "unallowing"
 * the slot. ReadOnly and ReadWrite allows are separate slot classes: the same
 * (driver, buffer) pair names two distinct slots. Allowing a region into an
 * occupied slot replaces the previous region in a single call.
 *
 * `SharePrimitive` is the seam between this library and the kernel. On target
 * hardware it wraps the system calls; on a host it is a simulation (see
 * sim_kernel.hpp) or a test double. It is always passed by reference.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "pinshare_export.h"
#include "utils/result.hpp"

namespace pinshare
{

/**
 * @brief Kernel error numbers, as returned by the allow and command calls.
 */
enum class ErrorCode : uint32_t
{
    Fail = 1,
    Busy = 2,
    Already = 3,
    Off = 4,
    Reserve = 5,
    Invalid = 6,
    Size = 7,
    Cancel = 8,
    NoMem = 9,
    NoSupport = 10,
    NoDevice = 11,
    Uninstalled = 12,
    NoAck = 13,
};

/**
 * @brief Whether the kernel may only read a region, or also write it.
 *
 * The values are the kernel's allow system-call class numbers.
 */
enum class AccessMode : uint32_t
{
    ReadWrite = 3,
    ReadOnly = 4,
};

/**
 * @brief The (driver, buffer) pair naming a kernel sharing slot.
 */
struct ResourceId
{
    uint32_t driver{0};
    uint32_t buffer{0};

    friend bool operator==(const ResourceId &, const ResourceId &) = default;
};

/**
 * @brief Everything needed to address a share: the mode and the resource id.
 */
struct ShareInfo
{
    AccessMode mode{AccessMode::ReadOnly};
    ResourceId id{};

    friend bool operator==(const ShareInfo &, const ShareInfo &) = default;
};

/// Outcome of a raw kernel call; the error is the kernel's own code.
using KernelResult = Result<std::monostate, ErrorCode>;

PINSHARE_EXPORT const char *to_string(ErrorCode code) noexcept;
PINSHARE_EXPORT const char *to_string(AccessMode mode) noexcept;

/**
 * @brief Parses "rw"/"readwrite" and "ro"/"readonly" (case-insensitive).
 */
PINSHARE_EXPORT std::optional<AccessMode> parse_access_mode(const std::string &text) noexcept;

[[nodiscard]] inline KernelResult kernel_ok()
{
    return KernelResult::ok(std::monostate{});
}

[[nodiscard]] inline KernelResult kernel_error(ErrorCode code)
{
    return KernelResult::error(code, static_cast<int>(code));
}

/**
 * @brief Builds a failed Result of any value type for a kernel rejection.
 *
 * The error is `ShareError::Kernel` and the detail code is the kernel's code,
 * unchanged.
 */
template <typename T = std::monostate>
[[nodiscard]] Result<T, ShareError> make_kernel_error(ErrorCode code)
{
    return Result<T, ShareError>::error(ShareError::Kernel, static_cast<int>(code));
}

/**
 * @brief Builds a failed Result for a local precondition failure.
 *
 * The detail code is the kernel code the same condition would have produced:
 * Already for AlreadyShared, Invalid for the others.
 */
template <typename T = std::monostate>
[[nodiscard]] Result<T, ShareError> make_share_error(ShareError err)
{
    const ErrorCode code = err == ShareError::AlreadyShared ? ErrorCode::Already : ErrorCode::Invalid;
    return Result<T, ShareError>::error(err, static_cast<int>(code));
}

/**
 * @brief Recovers the kernel ErrorCode carried by a failed Result.
 */
template <typename T, typename E>
[[nodiscard]] ErrorCode kernel_code(const Result<T, E> &result)
{
    return static_cast<ErrorCode>(result.error_code());
}

/**
 * @class SharePrimitive
 * @brief The kernel operations the sharing layer needs.
 *
 * Implementations must honor the slot semantics above. `unshare` cannot fail:
 * once it returns, the kernel holds no reference to the region previously
 * allowed under that slot and will never touch it again.
 */
class PINSHARE_EXPORT SharePrimitive
{
  public:
    virtual ~SharePrimitive() = default;

    /**
     * @brief Allows `len` bytes at `addr` under slot (mode, id).
     *
     * Replaces any region currently allowed under the same slot.
     */
    virtual KernelResult share(ResourceId id, void *addr, std::size_t len, AccessMode mode) = 0;

    /**
     * @brief Revokes the slot (mode, id). A no-op for an empty slot.
     */
    virtual void unshare(ResourceId id, AccessMode mode) noexcept = 0;

    /**
     * @brief Issues a driver command (start a transfer, query, ...).
     */
    virtual KernelResult command(uint32_t driver, uint32_t command_num, uint32_t arg0,
                                 uint32_t arg1) = 0;
};

} // namespace pinshare

template <> struct fmt::formatter<pinshare::ResourceId> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const pinshare::ResourceId &id, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{:#x}/{}", id.driver, id.buffer);
    }
};
