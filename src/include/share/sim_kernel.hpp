#pragma once
/**
 * @file sim_kernel.hpp
 * @brief In-process stand-in for the kernel's sharing and command interface.
 *
 * SimKernel runs on a host and behaves like the kernel as far as this library
 * can observe:
 *  - a slot table keyed by (mode, driver, buffer); sharing into an occupied
 *    slot replaces the region, unsharing empties it,
 *  - unknown drivers answer NoDevice; null or empty regions, and ReadWrite
 *    regions overlapping another live share, answer Invalid,
 *  - two capsules: an RNG (driver 0x40001) that fills its ReadWrite buffer 0
 *    and a console (driver 1) that reads its ReadOnly buffer 1,
 *  - completions are only delivered from `yield()`, and an operation whose
 *    buffer was unshared before that point is dropped (cancelled).
 *
 * Destroying a SimKernel that still holds shares is a lifetime bug in the
 * caller and panics.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <tuple>

#include "pinshare_export.h"
#include "share/kernel_abi.hpp"

namespace pinshare::sim
{

/// Command 0 of every driver: succeeds if the driver exists.
inline constexpr uint32_t kCommandExists = 0;

inline constexpr uint32_t kConsoleDriver = 1;
inline constexpr uint32_t kConsoleWrite = 1;         ///< command: arg0 = byte count
inline constexpr uint32_t kConsoleWriteBuffer = 1;   ///< ReadOnly buffer number
inline constexpr uint32_t kConsoleWriteComplete = 1; ///< upcall: (bytes written, 0, 0)

inline constexpr uint32_t kRngDriver = 0x40001;
inline constexpr uint32_t kRngGetBytes = 1;    ///< command: arg0 = byte count
inline constexpr uint32_t kRngBuffer = 0;      ///< ReadWrite buffer number
inline constexpr uint32_t kRngGetBytesDone = 0; ///< upcall: (0, bytes filled, 0)

/// Upcall signature: three driver-defined arguments.
using Upcall = std::function<void(uint32_t, uint32_t, uint32_t)>;

class PINSHARE_EXPORT SimKernel final : public SharePrimitive
{
  public:
    explicit SimKernel(uint64_t rng_seed = 0x9E3779B97F4A7C15ull);
    ~SimKernel() override;

    SimKernel(const SimKernel &) = delete;
    SimKernel &operator=(const SimKernel &) = delete;

    // --- SharePrimitive ---
    KernelResult share(ResourceId id, void *addr, std::size_t len, AccessMode mode) override;
    void unshare(ResourceId id, AccessMode mode) noexcept override;
    KernelResult command(uint32_t driver, uint32_t command_num, uint32_t arg0,
                         uint32_t arg1) override;

    // --- Scheduling ---

    /**
     * @brief Registers the upcall for (driver, subscribe_num), replacing any
     *        previous one. An empty function unsubscribes.
     */
    KernelResult subscribe(uint32_t driver, uint32_t subscribe_num, Upcall upcall);

    /**
     * @brief Completes every operation queued before the call and runs the
     *        matching upcalls.
     *
     * Operations queued by the upcalls themselves wait for the next yield().
     * @return the number of operations that completed (cancelled ones excluded).
     */
    std::size_t yield();

    // --- Test controls ---

    /// The next share() call fails with `code` without touching the slot table.
    void fail_next_share(ErrorCode code) noexcept { m_fail_next_share = code; }

    /// Adds a driver that only answers the existence command.
    void register_driver(uint32_t driver);

    // --- Introspection ---
    [[nodiscard]] bool is_shared(ResourceId id, AccessMode mode) const noexcept;
    /// True if (id) is shared in either mode.
    [[nodiscard]] bool is_shared(ResourceId id) const noexcept;
    /// The region currently allowed under the slot, if any.
    [[nodiscard]] std::optional<std::span<const std::byte>> region(ResourceId id,
                                                                   AccessMode mode) const;
    [[nodiscard]] std::size_t live_shares() const noexcept { return m_slots.size(); }
    [[nodiscard]] std::size_t pending_operations() const noexcept { return m_pending.size(); }
    [[nodiscard]] std::size_t share_calls() const noexcept { return m_share_calls; }
    [[nodiscard]] std::size_t unshare_calls() const noexcept { return m_unshare_calls; }
    [[nodiscard]] std::size_t cancelled_operations() const noexcept { return m_cancelled; }
    [[nodiscard]] const std::string &console_output() const noexcept { return m_console; }

  private:
    // (mode, driver, buffer)
    using SlotKey = std::tuple<uint32_t, uint32_t, uint32_t>;

    struct Region
    {
        std::byte *addr;
        std::size_t len;
    };

    struct PendingOp
    {
        uint32_t driver;
        uint32_t command;
        uint32_t count;
    };

    static SlotKey key_of(ResourceId id, AccessMode mode) noexcept
    {
        return SlotKey{static_cast<uint32_t>(mode), id.driver, id.buffer};
    }

    const Region *find_region(ResourceId id, AccessMode mode) const noexcept;
    bool overlaps_other(const SlotKey &key, const std::byte *addr, std::size_t len) const noexcept;
    bool has_pending(uint32_t driver) const noexcept;
    uint32_t complete(const PendingOp &op, const Region &region);
    void fire_upcall(uint32_t driver, uint32_t subscribe_num, uint32_t a0, uint32_t a1,
                     uint32_t a2);
    uint8_t next_random_byte() noexcept;

    std::map<SlotKey, Region> m_slots;
    std::map<std::pair<uint32_t, uint32_t>, Upcall> m_upcalls;
    std::deque<PendingOp> m_pending;
    std::set<uint32_t> m_drivers;
    std::optional<ErrorCode> m_fail_next_share;
    std::string m_console;
    uint64_t m_rng_state;
    std::size_t m_share_calls{0};
    std::size_t m_unshare_calls{0};
    std::size_t m_cancelled{0};
};

} // namespace pinshare::sim
