// tests/test_layer3_share/test_double_buffer_stream.cpp
/**
 * @file test_double_buffer_stream.cpp
 * @brief DoubleBufferStream state machine and a streamed RNG transfer.
 */
#include "psh_share.hpp"
#include "mock_share_primitive.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <array>
#include <vector>

using namespace pinshare;
using namespace pinshare::sim;
using namespace pinshare::tests::helper;
using ::testing::_;
using ::testing::InSequence;
using ::testing::StrictMock;

namespace
{

constexpr ResourceId kRng{kRngDriver, kRngBuffer};
using Chunk = std::array<uint8_t, 8>;
using RngStream = DoubleBufferStream<Chunk, StaticCapability<AccessMode::ReadWrite, kRngDriver, kRngBuffer>>;
using ModeStream = DoubleBufferStream<Chunk, ModeCapability<kRngDriver, kRngBuffer>>;

// Exactly one side is shared once the stream runs.
void expect_one_side_shared(const RngStream &stream)
{
    EXPECT_NE(stream.buffer_a().is_shared(), stream.buffer_b().is_shared());
    EXPECT_EQ(stream.buffer_a().is_shared(), stream.active_side() == StreamSide::A);
}

} // namespace

// ============================================================================
// State machine (mock kernel)
// ============================================================================

TEST(DoubleBufferStreamTest, StartAndAlternate)
{
    StrictMock<MockSharePrimitive> kernel;
    RngStream stream{kernel, Chunk{0xaa, 0xaa, 0xaa, 0xaa, 0xaa, 0xaa, 0xaa, 0xaa}};
    const void *addr_a = stream.buffer_a().access();
    const void *addr_b = stream.buffer_b().access();

    {
        InSequence seq;
        EXPECT_CALL(kernel, share(kRng, const_cast<void *>(addr_a), 8u, AccessMode::ReadWrite))
            .WillOnce(KernelAccepts());
        EXPECT_CALL(kernel, share(kRng, const_cast<void *>(addr_b), 8u, AccessMode::ReadWrite))
            .WillOnce(KernelAccepts());
        EXPECT_CALL(kernel, share(kRng, const_cast<void *>(addr_a), 8u, AccessMode::ReadWrite))
            .WillOnce(KernelAccepts());
        EXPECT_CALL(kernel, unshare(kRng, AccessMode::ReadWrite)).Times(1);
    }

    EXPECT_EQ(stream.active_side(), StreamSide::None);
    EXPECT_FALSE(stream.is_streaming());
    EXPECT_EQ(stream.standby(), nullptr);

    ASSERT_TRUE(stream.start().is_ok());
    EXPECT_EQ(stream.active_side(), StreamSide::A);
    expect_one_side_shared(stream);
    EXPECT_EQ(static_cast<const void *>(stream.standby()), addr_b);

    auto first = stream.advance();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(static_cast<const void *>(&first.content().get()), addr_a);
    EXPECT_EQ(stream.active_side(), StreamSide::B);
    expect_one_side_shared(stream);

    auto second = stream.advance();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(static_cast<const void *>(&second.content().get()), addr_b);
    EXPECT_EQ(stream.active_side(), StreamSide::A);
    expect_one_side_shared(stream);
}

TEST(DoubleBufferStreamTest, AdvanceBeforeStart)
{
    StrictMock<MockSharePrimitive> kernel;
    RngStream stream{kernel};
    auto res = stream.advance();
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error(), ShareError::NotStreaming);
}

TEST(DoubleBufferStreamTest, StartTwice)
{
    StrictMock<MockSharePrimitive> kernel;
    RngStream stream{kernel};
    EXPECT_CALL(kernel, share(_, _, _, _)).WillOnce(KernelAccepts());
    EXPECT_CALL(kernel, unshare(_, _)).Times(1);

    ASSERT_TRUE(stream.start().is_ok());
    auto again = stream.start();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error(), ShareError::AlreadyShared);
    EXPECT_EQ(stream.active_side(), StreamSide::A);
}

TEST(DoubleBufferStreamTest, StartRejectedByKernel)
{
    StrictMock<MockSharePrimitive> kernel;
    RngStream stream{kernel};
    EXPECT_CALL(kernel, share(_, _, _, _))
        .WillOnce(KernelRejects(ErrorCode::Off))
        .WillOnce(KernelAccepts());
    EXPECT_CALL(kernel, unshare(_, _)).Times(1);

    auto st = stream.start();
    ASSERT_TRUE(st.is_error());
    EXPECT_EQ(kernel_code(st), ErrorCode::Off);
    EXPECT_EQ(stream.active_side(), StreamSide::None);
    EXPECT_FALSE(stream.buffer_a().is_shared());

    EXPECT_TRUE(stream.start().is_ok());
}

TEST(DoubleBufferStreamTest, AdvanceFailureDoesNotFlip)
{
    StrictMock<MockSharePrimitive> kernel;
    RngStream stream{kernel};
    {
        InSequence seq;
        EXPECT_CALL(kernel, share(_, _, _, _)).WillOnce(KernelAccepts());
        EXPECT_CALL(kernel, share(_, _, _, _)).WillOnce(KernelRejects(ErrorCode::Busy));
        EXPECT_CALL(kernel, unshare(kRng, AccessMode::ReadWrite)).Times(1);
    }

    ASSERT_TRUE(stream.start().is_ok());
    auto res = stream.advance();
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error(), ShareError::Kernel);
    EXPECT_EQ(kernel_code(res), ErrorCode::Busy);
    EXPECT_EQ(stream.active_side(), StreamSide::A);
    EXPECT_TRUE(stream.buffer_a().is_shared());
    EXPECT_FALSE(stream.buffer_b().is_shared());
}

TEST(DoubleBufferStreamTest, ModeChosenAtStartIsKept)
{
    StrictMock<MockSharePrimitive> kernel;
    ModeStream stream{kernel};
    EXPECT_CALL(kernel, share(kRng, _, 8u, AccessMode::ReadOnly)).Times(2).WillRepeatedly(KernelAccepts());
    EXPECT_CALL(kernel, unshare(kRng, AccessMode::ReadOnly)).Times(1);

    ASSERT_TRUE(stream.start(AccessMode::ReadOnly).is_ok());
    ASSERT_TRUE(stream.advance().is_ok());
    EXPECT_EQ(stream.buffer_b().share_state(), (ShareInfo{AccessMode::ReadOnly, kRng}));
}

TEST(DoubleBufferStreamTest, SideNames)
{
    EXPECT_STREQ(to_string(StreamSide::None), "None");
    EXPECT_STREQ(to_string(StreamSide::A), "A");
    EXPECT_STREQ(to_string(StreamSide::B), "B");
}

// ============================================================================
// Streaming against SimKernel
// ============================================================================

TEST(DoubleBufferStreamSimTest, StreamsRandomChunks)
{
    SimKernel kernel(2024);
    std::vector<Chunk> received;
    {
        RngStream stream{kernel};
        constexpr std::size_t kChunks = 4;

        ASSERT_TRUE(kernel
                        .subscribe(kRngDriver, kRngGetBytesDone,
                                   [&](uint32_t, uint32_t n, uint32_t)
                                   {
                                       EXPECT_EQ(n, 8u);
                                       auto chunk = stream.advance();
                                       ASSERT_TRUE(chunk.is_ok());
                                       received.push_back(chunk.content().get());
                                       if (received.size() < kChunks)
                                       {
                                           EXPECT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 8, 0).is_ok());
                                       }
                                   })
                        .is_ok());

        ASSERT_TRUE(stream.start().is_ok());
        ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 8, 0).is_ok());
        while (kernel.pending_operations() > 0)
        {
            kernel.yield();
        }
        ASSERT_TRUE(kernel.subscribe(kRngDriver, kRngGetBytesDone, nullptr).is_ok());

        EXPECT_TRUE(stream.is_streaming());
        EXPECT_EQ(kernel.live_shares(), 1u);
        // The last advance moved the share to side A again.
        EXPECT_EQ(stream.active_side(), StreamSide::A);
    }
    EXPECT_EQ(kernel.live_shares(), 0u);

    ASSERT_EQ(received.size(), 4u);
    EXPECT_NE(received[0], received[1]);
    EXPECT_NE(received[1], received[2]);
    EXPECT_NE(received[0], Chunk{});
}

TEST(DoubleBufferStreamSimTest, DestroyingStreamCancelsPendingTransfer)
{
    SimKernel kernel;
    {
        RngStream stream{kernel};
        ASSERT_TRUE(stream.start().is_ok());
        ASSERT_TRUE(kernel.command(kRngDriver, kRngGetBytes, 8, 0).is_ok());
    }
    EXPECT_EQ(kernel.live_shares(), 0u);
    EXPECT_EQ(kernel.yield(), 0u);
    EXPECT_EQ(kernel.cancelled_operations(), 1u);
}
