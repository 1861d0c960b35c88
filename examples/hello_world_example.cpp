/**
 * @file hello_world_example.cpp
 * @brief Example: lend a constant string to the console driver.
 *
 * The message lives in static storage, so it is lent in place through a
 * StaticBuffer. The console capability is fixed at compile time: ReadOnly,
 * driver 1, buffer 1.
 */
#include "psh_share.hpp"

#include <cstdio>
#include <stdexcept>

using namespace pinshare;
using namespace pinshare::utils;

namespace
{

constexpr char kGreeting[] = "Hello, World!\n";

using ConsoleOut = StaticCapability<AccessMode::ReadOnly, sim::kConsoleDriver, sim::kConsoleWriteBuffer>;

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

    sim::SimKernel kernel{cfg.sim.rng_seed};
    StaticBuffer<decltype(kGreeting), ConsoleOut> message{kernel, kGreeting};

    bool written = false;
    auto on_written = [&](uint32_t count, uint32_t, uint32_t)
    {
        LOGGER_INFO("console wrote {} bytes", count);
        written = true;
    };
    if (auto sub = kernel.subscribe(sim::kConsoleDriver, sim::kConsoleWriteComplete, on_written);
        sub.is_error())
    {
        LOGGER_ERROR("subscribe failed: {}", to_string(kernel_code(sub)));
        return 1;
    }

    if (auto st = message.share(); st.is_error())
    {
        LOGGER_ERROR("share failed: {} (code {})", to_string(st.error()), st.error_code());
        return 1;
    }

    // The terminating NUL stays in the buffer but is not written.
    auto cmd = kernel.command(sim::kConsoleDriver, sim::kConsoleWrite, sizeof(kGreeting) - 1, 0);
    if (cmd.is_error())
    {
        LOGGER_ERROR("console write rejected: {}", to_string(kernel_code(cmd)));
        return 1;
    }

    while (!written)
    {
        kernel.yield();
    }
    message.reclaim();

    fmt::print("{}", kernel.console_output());
    Logger::instance().shutdown();
    return 0;
}
