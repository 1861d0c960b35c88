/**
 * @file print_rng_example.cpp
 * @brief Example: read random bytes, then print them through the console.
 *
 * Both resources come from the runtime configuration ("rng" and "console"), so
 * the buffers use DynamicCapability. A scope guard hands the RNG buffer back if
 * the driver refuses the request after the buffer was lent.
 */
#include "psh_share.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>

#include <fmt/ranges.h>

using namespace pinshare;
using namespace pinshare::utils;

namespace
{

constexpr std::size_t kRandomBytes = 16;

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

    const auto rng_res = cfg.resource("rng");
    const auto console_res = cfg.resource("console");
    if (!rng_res || !console_res)
    {
        LOGGER_ERROR("configuration must define the 'rng' and 'console' resources");
        return 1;
    }

    sim::SimKernel kernel{cfg.sim.rng_seed};
    ByteBuffer<kRandomBytes, DynamicCapability> random{kernel};
    Buffer<std::array<char, kRandomBytes * 2 + 1>, DynamicCapability> text{kernel};

    bool fetched = false;
    bool printed = false;
    auto on_fetched = [&](uint32_t, uint32_t count, uint32_t)
    {
        LOGGER_DEBUG("rng delivered {} bytes", count);
        fetched = true;
    };
    auto on_printed = [&](uint32_t, uint32_t, uint32_t) { printed = true; };
    if (auto sub = kernel.subscribe(rng_res->id.driver, sim::kRngGetBytesDone, on_fetched);
        sub.is_error())
    {
        LOGGER_ERROR("rng subscribe failed: {}", to_string(kernel_code(sub)));
        return 1;
    }
    if (auto sub = kernel.subscribe(console_res->id.driver, sim::kConsoleWriteComplete, on_printed);
        sub.is_error())
    {
        LOGGER_ERROR("console subscribe failed: {}", to_string(kernel_code(sub)));
        return 1;
    }

    // --- Fetch ---
    if (auto st = random.share(rng_res->info()); st.is_error())
    {
        LOGGER_ERROR("rng share failed: {} (code {})", to_string(st.error()), st.error_code());
        return 1;
    }
    {
        auto rollback = basics::make_scope_guard([&]() noexcept { (void)random.reclaim(); });
        auto cmd = kernel.command(rng_res->id.driver, sim::kRngGetBytes, kRandomBytes, 0);
        if (cmd.is_error())
        {
            LOGGER_ERROR("rng request rejected: {}", to_string(kernel_code(cmd)));
            return 1;
        }
        rollback.dismiss();
    }
    while (!fetched)
    {
        kernel.yield();
    }
    const auto &bytes = random.reclaim();

    // --- Format into the console buffer while it is ours ---
    auto *out = text.access_mut();
    auto end = fmt::format_to_n(out->data(), out->size() - 1, "{:02x}", fmt::join(bytes, ""));
    *end.out = '\n';
    const auto len = static_cast<uint32_t>(end.size + 1);

    // --- Print ---
    if (auto st = text.share(console_res->info()); st.is_error())
    {
        LOGGER_ERROR("console share failed: {} (code {})", to_string(st.error()), st.error_code());
        return 1;
    }
    if (auto cmd = kernel.command(console_res->id.driver, sim::kConsoleWrite, len, 0); cmd.is_error())
    {
        LOGGER_ERROR("console write rejected: {}", to_string(kernel_code(cmd)));
        text.reclaim();
        return 1;
    }
    while (!printed)
    {
        kernel.yield();
    }
    text.reclaim();

    fmt::print("{}", kernel.console_output());
    Logger::instance().shutdown();
    return 0;
}
