#pragma once
/**
 * @file double_buffer_stream.hpp
 * @brief Continuous transfers through two alternating buffers.
 *
 * One buffer is always lent to the kernel; the other belongs to the
 * application. Each completion moves the share to the idle buffer and hands
 * back the one the kernel just finished with, so the driver never waits for
 * the application to drain a buffer.
 *
 * @code
 * DoubleBufferStream<std::array<uint8_t, 8>, ModeCapability<kRngDriver, 0>> stream{kernel};
 * auto st = stream.start(AccessMode::ReadWrite);
 * // ... command the driver, yield until its completion upcall, then:
 * auto chunk = stream.advance();
 * if (chunk.is_ok()) consume(chunk.content().get());
 * @endcode
 *
 * `advance()` must only be called after the completion for the active side was
 * observed; the stream does not check this.
 */

#include <concepts>
#include <functional>

#include "share/buffer.hpp"
#include "share/kernel_abi.hpp"
#include "share/share_state.hpp"
#include "utils/debug_info.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"

namespace pinshare
{

enum class StreamSide
{
    None, ///< not started
    A,
    B,
};

inline const char *to_string(StreamSide side) noexcept
{
    switch (side)
    {
    case StreamSide::None:
        return "None";
    case StreamSide::A:
        return "A";
    case StreamSide::B:
        return "B";
    default:
        return "Unknown";
    }
}

template <typename T, ShareCapability Cap>
class DoubleBufferStream
{
  public:
    using value_type = T;
    using buffer_type = Buffer<T, Cap>;

    explicit DoubleBufferStream(SharePrimitive &kernel) requires std::default_initializable<T>
        : m_a(kernel), m_b(kernel)
    {
    }

    DoubleBufferStream(SharePrimitive &kernel, const T &initial)
        : m_a(kernel, initial), m_b(kernel, initial)
    {
    }

    DoubleBufferStream(const DoubleBufferStream &) = delete;
    DoubleBufferStream &operator=(const DoubleBufferStream &) = delete;
    DoubleBufferStream(DoubleBufferStream &&) = delete;
    DoubleBufferStream &operator=(DoubleBufferStream &&) = delete;

    // The members' destructors unshare whichever side is active.
    ~DoubleBufferStream() = default;

    /**
     * @brief Lends side A to the kernel.
     *
     * Arguments are passed to the capability as for Buffer::share().
     * @return ok; AlreadyShared if already streaming (no kernel call); Kernel
     *         with the kernel's code if refused, leaving the stream not started.
     */
    template <typename... Args>
    [[nodiscard]] Status start(Args &&...args)
    {
        if (m_active != StreamSide::None)
        {
            return make_share_error(ShareError::AlreadyShared);
        }
        auto status = m_a.share(std::forward<Args>(args)...);
        if (status.is_error())
        {
            LOGGER_DEBUG("stream start failed: {} ({})", to_string(status.error()),
                         status.error_code());
            return status;
        }
        m_active = StreamSide::A;
        return status;
    }

    /**
     * @brief Moves the share to the idle side and returns the storage the kernel
     *        just released.
     *
     * @return the reclaimed storage; NotStreaming before start(); Kernel with
     *         the kernel's code if the share of the idle side is refused, in
     *         which case nothing changes and no storage is returned.
     */
    [[nodiscard]] StorageResult<T> advance()
    {
        switch (m_active)
        {
        case StreamSide::None:
            return make_share_error<std::reference_wrapper<T>>(ShareError::NotStreaming);
        case StreamSide::A:
            return swap_to(m_a, m_b, StreamSide::B);
        case StreamSide::B:
            return swap_to(m_b, m_a, StreamSide::A);
        }
        PSH_PANIC("DoubleBufferStream in invalid state {}", static_cast<int>(m_active));
    }

    [[nodiscard]] StreamSide active_side() const noexcept { return m_active; }
    [[nodiscard]] bool is_streaming() const noexcept { return m_active != StreamSide::None; }

    /**
     * @brief Storage of the side the application owns while streaming; null
     *        before start().
     */
    [[nodiscard]] T *standby() noexcept
    {
        switch (m_active)
        {
        case StreamSide::A:
            return m_b.access_mut();
        case StreamSide::B:
            return m_a.access_mut();
        default:
            return nullptr;
        }
    }

    [[nodiscard]] const buffer_type &buffer_a() const noexcept { return m_a; }
    [[nodiscard]] const buffer_type &buffer_b() const noexcept { return m_b; }

  private:
    StorageResult<T> swap_to(buffer_type &active, buffer_type &idle, StreamSide next)
    {
        auto outcome = active.exchange(idle);
        if (outcome.status.is_error())
        {
            LOGGER_DEBUG("stream advance from side {} failed: {} ({})", to_string(m_active),
                         to_string(outcome.status.error()), outcome.status.error_code());
            return StorageResult<T>::error(outcome.status.error(), outcome.status.error_code());
        }
        m_active = next;
        return StorageResult<T>::ok(std::ref(outcome.storage));
    }

    buffer_type m_a;
    buffer_type m_b;
    StreamSide m_active{StreamSide::None};
};

} // namespace pinshare
