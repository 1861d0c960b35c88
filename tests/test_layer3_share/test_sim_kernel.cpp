// tests/test_layer3_share/test_sim_kernel.cpp
/**
 * @file test_sim_kernel.cpp
 * @brief The host kernel simulation: slot table, commands, completions and
 *        cancellation.
 *
 * These tests talk to SimKernel through the raw SharePrimitive calls, so they
 * pin down the behavior the buffer tests rely on.
 */
#include "psh_share.hpp"
#include "gtest/gtest.h"

#include <array>
#include <vector>

using namespace pinshare;
using namespace pinshare::sim;

namespace
{
constexpr ResourceId kRng{kRngDriver, kRngBuffer};
constexpr ResourceId kConsole{kConsoleDriver, kConsoleWriteBuffer};
} // namespace

// ============================================================================
// Slot table
// ============================================================================

TEST(SimKernelTest, ShareAndUnshare)
{
    SimKernel kernel;
    std::array<std::byte, 4> buf{};

    ASSERT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    EXPECT_TRUE(kernel.is_shared(kRng, AccessMode::ReadWrite));
    EXPECT_FALSE(kernel.is_shared(kRng, AccessMode::ReadOnly));
    EXPECT_TRUE(kernel.is_shared(kRng));
    EXPECT_EQ(kernel.live_shares(), 1u);

    auto region = kernel.region(kRng, AccessMode::ReadWrite);
    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->data(), buf.data());
    EXPECT_EQ(region->size(), 4u);

    kernel.unshare(kRng, AccessMode::ReadWrite);
    EXPECT_FALSE(kernel.is_shared(kRng));
    EXPECT_EQ(kernel.live_shares(), 0u);
    EXPECT_EQ(kernel.share_calls(), 1u);
    EXPECT_EQ(kernel.unshare_calls(), 1u);
}

TEST(SimKernelTest, UnshareEmptySlotIsNoop)
{
    SimKernel kernel;
    kernel.unshare(kConsole, AccessMode::ReadOnly);
    EXPECT_EQ(kernel.live_shares(), 0u);
    EXPECT_EQ(kernel.unshare_calls(), 1u);
}

TEST(SimKernelTest, ModesAreSeparateSlots)
{
    SimKernel kernel;
    std::array<std::byte, 4> a{};
    std::array<std::byte, 4> b{};
    ASSERT_TRUE(kernel.share(kRng, a.data(), a.size(), AccessMode::ReadOnly).is_ok());
    ASSERT_TRUE(kernel.share(kRng, b.data(), b.size(), AccessMode::ReadWrite).is_ok());
    EXPECT_EQ(kernel.live_shares(), 2u);
    kernel.unshare(kRng, AccessMode::ReadOnly);
    kernel.unshare(kRng, AccessMode::ReadWrite);
}

TEST(SimKernelTest, ShareIntoOccupiedSlotReplacesRegion)
{
    SimKernel kernel;
    std::array<std::byte, 4> a{};
    std::array<std::byte, 8> b{};
    ASSERT_TRUE(kernel.share(kRng, a.data(), a.size(), AccessMode::ReadWrite).is_ok());
    ASSERT_TRUE(kernel.share(kRng, b.data(), b.size(), AccessMode::ReadWrite).is_ok());
    EXPECT_EQ(kernel.live_shares(), 1u);
    EXPECT_EQ(kernel.region(kRng, AccessMode::ReadWrite)->data(), b.data());
    kernel.unshare(kRng, AccessMode::ReadWrite);
}

TEST(SimKernelTest, ShareRejections)
{
    SimKernel kernel;
    std::array<std::byte, 8> buf{};

    auto no_dev = kernel.share(ResourceId{0x9999, 0}, buf.data(), buf.size(), AccessMode::ReadOnly);
    ASSERT_TRUE(no_dev.is_error());
    EXPECT_EQ(no_dev.error(), ErrorCode::NoDevice);

    auto null_addr = kernel.share(kRng, nullptr, 4, AccessMode::ReadWrite);
    ASSERT_TRUE(null_addr.is_error());
    EXPECT_EQ(null_addr.error(), ErrorCode::Invalid);

    auto empty = kernel.share(kRng, buf.data(), 0, AccessMode::ReadWrite);
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error(), ErrorCode::Invalid);

    EXPECT_EQ(kernel.live_shares(), 0u);
}

TEST(SimKernelTest, OverlappingReadWriteShareIsInvalid)
{
    SimKernel kernel;
    std::array<std::byte, 8> buf{};
    ASSERT_TRUE(kernel.share(kConsole, buf.data(), buf.size(), AccessMode::ReadOnly).is_ok());

    auto res = kernel.share(kRng, buf.data() + 4, 4, AccessMode::ReadWrite);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error(), ErrorCode::Invalid);
    EXPECT_FALSE(kernel.is_shared(kRng));

    // Disjoint regions are fine.
    std::array<std::byte, 8> other{};
    EXPECT_TRUE(kernel.share(kRng, other.data(), other.size(), AccessMode::ReadWrite).is_ok());
    kernel.unshare(kRng, AccessMode::ReadWrite);
    kernel.unshare(kConsole, AccessMode::ReadOnly);
}

TEST(SimKernelTest, InjectedFailureAffectsOneCall)
{
    SimKernel kernel;
    std::array<std::byte, 4> buf{};
    kernel.fail_next_share(ErrorCode::NoMem);

    auto first = kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite);
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error(), ErrorCode::NoMem);
    EXPECT_FALSE(kernel.is_shared(kRng));

    EXPECT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    kernel.unshare(kRng, AccessMode::ReadWrite);
}

// ============================================================================
// Commands and completions
// ============================================================================

TEST(SimKernelTest, CommandRejections)
{
    SimKernel kernel;
    EXPECT_TRUE(kernel.command(kRngDriver, kCommandExists, 0, 0).is_ok());
    EXPECT_EQ(kernel.command(0x9999, kCommandExists, 0, 0).error(), ErrorCode::NoDevice);
    EXPECT_EQ(kernel.command(kRngDriver, 42, 0, 0).error(), ErrorCode::NoSupport);
    // No buffer shared yet.
    EXPECT_EQ(kernel.command(kRngDriver, kRngGetBytes, 4, 0).error(), ErrorCode::Reserve);

    kernel.register_driver(0x30000);
    EXPECT_TRUE(kernel.command(0x30000, kCommandExists, 0, 0).is_ok());
    EXPECT_EQ(kernel.command(0x30000, 1, 0, 0).error(), ErrorCode::NoSupport);
}

TEST(SimKernelTest, RngFillsSharedBufferOnYield)
{
    SimKernel kernel(1234);
    std::array<std::byte, 8> buf{};
    std::vector<uint32_t> filled;
    ASSERT_TRUE(kernel
                    .subscribe(kRngDriver, kRngGetBytesDone,
                               [&](uint32_t, uint32_t n, uint32_t) { filled.push_back(n); })
                    .is_ok());
    ASSERT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 8, 0).is_ok());
    EXPECT_EQ(kernel.command(kRngDriver, kRngGetBytes, 8, 0).error(), ErrorCode::Busy);
    EXPECT_EQ(kernel.pending_operations(), 1u);

    // Nothing happens before the yield.
    EXPECT_TRUE(filled.empty());

    EXPECT_EQ(kernel.yield(), 1u);
    ASSERT_EQ(filled.size(), 1u);
    EXPECT_EQ(filled[0], 8u);
    EXPECT_EQ(kernel.pending_operations(), 0u);

    const std::array<std::byte, 8> zeros{};
    EXPECT_NE(buf, zeros);
    kernel.unshare(kRng, AccessMode::ReadWrite);
}

TEST(SimKernelTest, RngIsDeterministicForSeed)
{
    auto draw = [](uint64_t seed)
    {
        SimKernel kernel(seed);
        std::array<std::byte, 16> buf{};
        EXPECT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
        EXPECT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 16, 0).is_ok());
        kernel.yield();
        kernel.unshare(kRng, AccessMode::ReadWrite);
        return buf;
    };
    EXPECT_EQ(draw(7), draw(7));
    EXPECT_NE(draw(7), draw(8));
}

TEST(SimKernelTest, CountIsClampedToRegion)
{
    SimKernel kernel;
    std::array<std::byte, 4> buf{};
    uint32_t filled = 0;
    ASSERT_TRUE(kernel
                    .subscribe(kRngDriver, kRngGetBytesDone,
                               [&](uint32_t, uint32_t n, uint32_t) { filled = n; })
                    .is_ok());
    ASSERT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 100, 0).is_ok());
    kernel.yield();
    EXPECT_EQ(filled, 4u);
    kernel.unshare(kRng, AccessMode::ReadWrite);
}

TEST(SimKernelTest, ConsoleReadsSharedBuffer)
{
    SimKernel kernel;
    static const char kText[] = "hi there";
    uint32_t written = 0;
    ASSERT_TRUE(kernel
                    .subscribe(kConsoleDriver, kConsoleWriteComplete,
                               [&](uint32_t n, uint32_t, uint32_t) { written = n; })
                    .is_ok());
    ASSERT_TRUE(kernel
                    .share(kConsole, const_cast<char *>(kText), sizeof(kText) - 1,
                           AccessMode::ReadOnly)
                    .is_ok());
    ASSERT_TRUE(kernel.command(kConsoleDriver, kConsoleWrite, 2, 0).is_ok());
    kernel.yield();
    EXPECT_EQ(written, 2u);
    EXPECT_EQ(kernel.console_output(), "hi");
    kernel.unshare(kConsole, AccessMode::ReadOnly);
}

TEST(SimKernelTest, UnsubscribeStopsUpcalls)
{
    SimKernel kernel;
    std::array<std::byte, 4> buf{};
    int calls = 0;
    ASSERT_TRUE(kernel
                    .subscribe(kRngDriver, kRngGetBytesDone,
                               [&](uint32_t, uint32_t, uint32_t) { ++calls; })
                    .is_ok());
    ASSERT_TRUE(kernel.subscribe(kRngDriver, kRngGetBytesDone, nullptr).is_ok());
    EXPECT_EQ(kernel.subscribe(0x9999, 0, nullptr).error(), ErrorCode::NoDevice);

    ASSERT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 4, 0).is_ok());
    EXPECT_EQ(kernel.yield(), 1u);
    EXPECT_EQ(calls, 0);
    kernel.unshare(kRng, AccessMode::ReadWrite);
}

TEST(SimKernelTest, CommandsIssuedFromUpcallWaitForNextYield)
{
    SimKernel kernel;
    std::array<std::byte, 4> buf{};
    int calls = 0;
    ASSERT_TRUE(kernel
                    .subscribe(kRngDriver, kRngGetBytesDone,
                               [&](uint32_t, uint32_t, uint32_t)
                               {
                                   ++calls;
                                   EXPECT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 4, 0).is_ok());
                               })
                    .is_ok());
    ASSERT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 4, 0).is_ok());

    EXPECT_EQ(kernel.yield(), 1u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(kernel.pending_operations(), 1u);
    EXPECT_EQ(kernel.yield(), 1u);
    EXPECT_EQ(calls, 2);

    ASSERT_TRUE(kernel.subscribe(kRngDriver, kRngGetBytesDone, nullptr).is_ok());
    kernel.unshare(kRng, AccessMode::ReadWrite);
    kernel.yield();
}

TEST(SimKernelTest, UnshareCancelsPendingOperation)
{
    SimKernel kernel;
    std::array<std::byte, 4> buf{};
    int calls = 0;
    ASSERT_TRUE(kernel
                    .subscribe(kRngDriver, kRngGetBytesDone,
                               [&](uint32_t, uint32_t, uint32_t) { ++calls; })
                    .is_ok());
    ASSERT_TRUE(kernel.share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite).is_ok());
    ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 4, 0).is_ok());
    kernel.unshare(kRng, AccessMode::ReadWrite);

    EXPECT_EQ(kernel.yield(), 0u);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(kernel.cancelled_operations(), 1u);
    const std::array<std::byte, 4> zeros{};
    EXPECT_EQ(buf, zeros);
}

// ============================================================================
// Lifetime
// ============================================================================

TEST(SimKernelDeathTest, DestroyingWithLiveSharePanics)
{
    using Bytes4 = std::array<std::byte, 4>;
    EXPECT_DEATH(
        {
            auto *kernel = new SimKernel();
            static Bytes4 buf{};
            (void)kernel->share(kRng, buf.data(), buf.size(), AccessMode::ReadWrite);
            delete kernel;
        },
        "live share");
}
