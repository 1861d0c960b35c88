/**
 * @file sim_kernel.cpp
 * @brief Host simulation of the kernel's allow/command/subscribe interface.
 */
#include "psh_service.hpp"
#include "share/sim_kernel.hpp"

#include <algorithm>
#include <cstring>

namespace pinshare::sim
{

namespace
{

// The slot a capsule reads or writes for a given driver.
struct CapsuleSlot
{
    ResourceId id;
    AccessMode mode;
};

constexpr CapsuleSlot kRngSlot{ResourceId{kRngDriver, kRngBuffer}, AccessMode::ReadWrite};
constexpr CapsuleSlot kConsoleSlot{ResourceId{kConsoleDriver, kConsoleWriteBuffer},
                                   AccessMode::ReadOnly};

} // namespace

SimKernel::SimKernel(uint64_t rng_seed)
    // xorshift64 has a fixed point at zero
    : m_drivers{kConsoleDriver, kRngDriver}, m_rng_state(rng_seed != 0 ? rng_seed : 1)
{
}

SimKernel::~SimKernel()
{
    if (!m_slots.empty())
    {
        const auto &[key, region] = *m_slots.begin();
        PSH_PANIC("SimKernel destroyed with {} live share(s); first: mode {} driver {:#x} buffer {} "
                  "({} bytes)",
                  m_slots.size(), std::get<0>(key), std::get<1>(key), std::get<2>(key),
                  region.len);
    }
}

// ============================================================================
// SharePrimitive
// ============================================================================

KernelResult SimKernel::share(ResourceId id, void *addr, std::size_t len, AccessMode mode)
{
    ++m_share_calls;
    if (m_fail_next_share)
    {
        const ErrorCode code = *m_fail_next_share;
        m_fail_next_share.reset();
        LOGGER_DEBUG("[sim] injected share failure {} for {}", to_string(code), id);
        return kernel_error(code);
    }
    if (m_drivers.count(id.driver) == 0)
    {
        return kernel_error(ErrorCode::NoDevice);
    }
    if (addr == nullptr || len == 0)
    {
        return kernel_error(ErrorCode::Invalid);
    }

    const SlotKey key = key_of(id, mode);
    auto *bytes = static_cast<std::byte *>(addr);
    if (mode == AccessMode::ReadWrite && overlaps_other(key, bytes, len))
    {
        LOGGER_DEBUG("[sim] ReadWrite share of {} overlaps another live share", id);
        return kernel_error(ErrorCode::Invalid);
    }

    m_slots[key] = Region{bytes, len};
    return kernel_ok();
}

void SimKernel::unshare(ResourceId id, AccessMode mode) noexcept
{
    ++m_unshare_calls;
    m_slots.erase(key_of(id, mode));
}

KernelResult SimKernel::command(uint32_t driver, uint32_t command_num, uint32_t arg0,
                                uint32_t arg1)
{
    (void)arg1;
    if (m_drivers.count(driver) == 0)
    {
        return kernel_error(ErrorCode::NoDevice);
    }
    if (command_num == kCommandExists)
    {
        return kernel_ok();
    }

    const CapsuleSlot *slot = nullptr;
    if (driver == kRngDriver && command_num == kRngGetBytes)
    {
        slot = &kRngSlot;
    }
    else if (driver == kConsoleDriver && command_num == kConsoleWrite)
    {
        slot = &kConsoleSlot;
    }
    if (slot == nullptr)
    {
        return kernel_error(ErrorCode::NoSupport);
    }
    if (find_region(slot->id, slot->mode) == nullptr)
    {
        return kernel_error(ErrorCode::Reserve);
    }
    if (has_pending(driver))
    {
        return kernel_error(ErrorCode::Busy);
    }

    m_pending.push_back(PendingOp{driver, command_num, arg0});
    LOGGER_TRACE("[sim] queued command {} on driver {:#x} ({} bytes)", command_num, driver, arg0);
    return kernel_ok();
}

// ============================================================================
// Scheduling
// ============================================================================

KernelResult SimKernel::subscribe(uint32_t driver, uint32_t subscribe_num, Upcall upcall)
{
    if (m_drivers.count(driver) == 0)
    {
        return kernel_error(ErrorCode::NoDevice);
    }
    if (upcall)
    {
        m_upcalls[{driver, subscribe_num}] = std::move(upcall);
    }
    else
    {
        m_upcalls.erase({driver, subscribe_num});
    }
    return kernel_ok();
}

std::size_t SimKernel::yield()
{
    std::deque<PendingOp> batch;
    batch.swap(m_pending);

    std::size_t completed = 0;
    for (const auto &op : batch)
    {
        const CapsuleSlot &slot = op.driver == kRngDriver ? kRngSlot : kConsoleSlot;
        const Region *region = find_region(slot.id, slot.mode);
        if (region == nullptr)
        {
            // The buffer was reclaimed before completion.
            ++m_cancelled;
            LOGGER_TRACE("[sim] command {} on driver {:#x} cancelled by unshare", op.command,
                         op.driver);
            continue;
        }
        const uint32_t done = complete(op, *region);
        ++completed;
        if (op.driver == kRngDriver)
        {
            fire_upcall(kRngDriver, kRngGetBytesDone, 0, done, 0);
        }
        else
        {
            fire_upcall(kConsoleDriver, kConsoleWriteComplete, done, 0, 0);
        }
    }
    return completed;
}

// ============================================================================
// Test controls and introspection
// ============================================================================

void SimKernel::register_driver(uint32_t driver)
{
    m_drivers.insert(driver);
}

bool SimKernel::is_shared(ResourceId id, AccessMode mode) const noexcept
{
    return find_region(id, mode) != nullptr;
}

bool SimKernel::is_shared(ResourceId id) const noexcept
{
    return is_shared(id, AccessMode::ReadOnly) || is_shared(id, AccessMode::ReadWrite);
}

std::optional<std::span<const std::byte>> SimKernel::region(ResourceId id, AccessMode mode) const
{
    const Region *r = find_region(id, mode);
    if (r == nullptr)
        return std::nullopt;
    return std::span<const std::byte>(r->addr, r->len);
}

// ============================================================================
// Internals
// ============================================================================

const SimKernel::Region *SimKernel::find_region(ResourceId id, AccessMode mode) const noexcept
{
    const auto it = m_slots.find(key_of(id, mode));
    return it == m_slots.end() ? nullptr : &it->second;
}

bool SimKernel::overlaps_other(const SlotKey &key, const std::byte *addr,
                               std::size_t len) const noexcept
{
    const std::byte *end = addr + len;
    return std::any_of(m_slots.begin(), m_slots.end(),
                       [&](const auto &entry)
                       {
                           if (entry.first == key)
                               return false; // replaced by this share
                           const Region &r = entry.second;
                           return addr < r.addr + r.len && r.addr < end;
                       });
}

bool SimKernel::has_pending(uint32_t driver) const noexcept
{
    return std::any_of(m_pending.begin(), m_pending.end(),
                       [driver](const PendingOp &op) { return op.driver == driver; });
}

uint32_t SimKernel::complete(const PendingOp &op, const Region &region)
{
    const std::size_t n = std::min<std::size_t>(op.count, region.len);
    if (op.driver == kRngDriver)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            region.addr[i] = std::byte{next_random_byte()};
        }
        LOGGER_TRACE("[sim] rng filled {} bytes: {}", n,
                     format_tools::hex_dump(std::span<const std::byte>(region.addr, n)));
    }
    else
    {
        m_console.append(reinterpret_cast<const char *>(region.addr), n);
    }
    return static_cast<uint32_t>(n);
}

void SimKernel::fire_upcall(uint32_t driver, uint32_t subscribe_num, uint32_t a0, uint32_t a1,
                            uint32_t a2)
{
    const auto it = m_upcalls.find({driver, subscribe_num});
    if (it == m_upcalls.end())
        return;
    // Copy: the upcall may resubscribe and replace itself.
    Upcall upcall = it->second;
    upcall(a0, a1, a2);
}

uint8_t SimKernel::next_random_byte() noexcept
{
    m_rng_state ^= m_rng_state << 13;
    m_rng_state ^= m_rng_state >> 7;
    m_rng_state ^= m_rng_state << 17;
    return static_cast<uint8_t>(m_rng_state >> 24);
}

} // namespace pinshare::sim
