/**
 * @file rng_stream_example.cpp
 * @brief Example: continuous random data through a double-buffered stream.
 *
 * One 8-byte buffer is always lent to the RNG driver. Each completion upcall
 * moves the share to the idle buffer, re-arms the driver and consumes the
 * bytes that were just produced.
 */
#include "psh_share.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <span>
#include <stdexcept>

using namespace pinshare;
using namespace pinshare::utils;

namespace
{

constexpr std::size_t kChunk = 8;

using Chunk = std::array<uint8_t, kChunk>;
using RngStream = DoubleBufferStream<Chunk, ModeCapability<sim::kRngDriver, sim::kRngBuffer>>;

} // namespace

int main()
{
    config::RuntimeConfig cfg;
    try
    {
        cfg = config::RuntimeConfig::load();
        config::apply_logging(cfg);
    }
    catch (const std::runtime_error &e)
    {
        fmt::print(stderr, "configuration error: {}\n", e.what());
        return 1;
    }
    LOGGER_INFO("{} starting (pinshare {})", platform::get_executable_name(),
                platform::get_version_string());

    const uint32_t request = std::min<uint32_t>(cfg.stream.chunk_bytes, kChunk);
    const uint32_t chunks = cfg.stream.chunks;

    sim::SimKernel kernel{cfg.sim.rng_seed};
    RngStream stream{kernel};

    uint32_t received = 0;
    bool failed = false;
    auto on_chunk = [&](uint32_t, uint32_t count, uint32_t)
    {
        auto chunk = stream.advance();
        if (chunk.is_error())
        {
            LOGGER_ERROR("advance failed: {} (code {})", to_string(chunk.error()),
                         chunk.error_code());
            failed = true;
            return;
        }
        ++received;
        if (received < chunks)
        {
            auto cmd = kernel.command(sim::kRngDriver, sim::kRngGetBytes, request, 0);
            if (cmd.is_error())
            {
                LOGGER_ERROR("rng request rejected: {}", to_string(kernel_code(cmd)));
                failed = true;
            }
        }
        const Chunk &data = chunk.content().get();
        fmt::print("chunk {:2}: {}\n", received,
                   format_tools::hex_dump(std::as_bytes(std::span(data)).first(count)));
    };
    if (auto sub = kernel.subscribe(sim::kRngDriver, sim::kRngGetBytesDone, on_chunk);
        sub.is_error())
    {
        LOGGER_ERROR("subscribe failed: {}", to_string(kernel_code(sub)));
        return 1;
    }

    if (auto st = stream.start(AccessMode::ReadWrite); st.is_error())
    {
        LOGGER_ERROR("stream start failed: {} (code {})", to_string(st.error()), st.error_code());
        return 1;
    }
    if (auto cmd = kernel.command(sim::kRngDriver, sim::kRngGetBytes, request, 0); cmd.is_error())
    {
        LOGGER_ERROR("rng request rejected: {}", to_string(kernel_code(cmd)));
        return 1;
    }

    while (received < chunks && !failed)
    {
        kernel.yield();
    }
    LOGGER_INFO("received {} chunks, stream active side {}", received,
                to_string(stream.active_side()));

    Logger::instance().shutdown();
    return failed ? 1 : 0;
}
