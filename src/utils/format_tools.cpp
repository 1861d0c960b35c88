// format_tools.cpp
#include "psh_base.hpp"

namespace pinshare::format_tools
{

// Two-step formatting: whole seconds through fmt's chrono support, then the
// microsecond fraction appended by hand. Works with every fmt release that
// ships fmt/chrono.h.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string hex_dump(std::span<const std::byte> bytes, std::size_t max_bytes)
{
    const std::size_t shown = bytes.size() < max_bytes ? bytes.size() : max_bytes;
    fmt::memory_buffer mb;
    mb.reserve(shown * 3 + 4);
    for (std::size_t i = 0; i < shown; ++i)
    {
        if (i != 0)
            mb.push_back(' ');
        fmt::format_to(std::back_inserter(mb), "{:02x}", std::to_integer<unsigned>(bytes[i]));
    }
    if (shown < bytes.size())
    {
        fmt::format_to(std::back_inserter(mb), " ...");
    }
    return fmt::to_string(mb);
}

} // namespace pinshare::format_tools
