/**
 * @file debug_info.cpp
 * @brief Stack trace printing for pinshare::debug::print_stack_trace()
 *
 * POSIX builds resolve frames with backtrace()/dladdr() and demangle through the
 * C++ ABI. Other platforms print a notice; panics still report their location.
 */
#include "psh_base.hpp"

#if defined(PINSHARE_IS_POSIX)
#include <array>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#include <memory>
#endif

namespace pinshare::debug
{

#if defined(PINSHARE_IS_POSIX)

namespace
{

constexpr int kMaxFrames = 64;

std::string demangle(const char *symbol)
{
    if (symbol == nullptr)
        return "??";
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> out(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), std::free);
    if (status == 0 && out)
        return std::string(out.get());
    return std::string(symbol);
}

} // namespace

void print_stack_trace() noexcept
{
    try
    {
        std::array<void *, kMaxFrames> frames{};
        const int count = ::backtrace(frames.data(), kMaxFrames);
        fmt::print(stderr, "Stack Trace (most recent call first):\n");
        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < count; ++i)
        {
            Dl_info info{};
            if (::dladdr(frames[static_cast<size_t>(i)], &info) != 0)
            {
                const auto *base = static_cast<const char *>(info.dli_saddr);
                const auto offset = base != nullptr
                                        ? static_cast<const char *>(frames[static_cast<size_t>(i)]) - base
                                        : 0;
                fmt::print(stderr, "  #{:<2} {} + 0x{:x} [{}]\n", i - 1, demangle(info.dli_sname),
                           offset,
                           format_tools::filename_only(info.dli_fname ? info.dli_fname : "??"));
            }
            else
            {
                fmt::print(stderr, "  #{:<2} {}\n", i - 1, frames[static_cast<size_t>(i)]);
            }
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "  [stack trace unavailable: {}]\n", e.what());
    }
    std::fflush(stderr);
}

#else

void print_stack_trace() noexcept
{
    fmt::print(stderr, "Stack Trace: not supported on this platform.\n");
    std::fflush(stderr);
}

#endif

} // namespace pinshare::debug
