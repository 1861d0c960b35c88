/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messaging.
 *
 * Functions in `pinshare::debug` use `fmt` for compile-time format string checks and
 * `std::source_location` for automatic source code location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace pinshare::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX systems this uses `backtrace` and `dladdr`, demangling C++ symbols
 * where possible. Other platforms print a one-line notice instead.
 */
PINSHARE_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors only: the message and the caller's location
 * are printed to `stderr`, followed by a stack trace, then `std::abort()`.
 *
 * @param loc The source location where `panic` was called (see `PSH_PANIC`).
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    const std::string where =
        fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                    loc.function_name());
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", where, body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   where, fmt::string_view(fmt_str), e.what());
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL EXCEPTION DURING PANIC: fmt_str['{}'] ({})\n",
                   where, fmt::string_view(fmt_str), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  FATAL EXCEPTION DURING DEBUG_MSG: fmt_str['{}'] ({})\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

} // namespace pinshare::debug

/**
 * @brief Calls `pinshare::debug::panic` with the caller's source location.
 */
#ifndef PSH_PANIC
#define PSH_PANIC(fmt, ...)                                                                        \
    ::pinshare::debug::panic(std::source_location::current(),                                     \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a debug message; compiled out unless PINSHARE_ENABLE_DEBUG_MESSAGES is set.
 */
#ifndef PSH_DEBUG
#if defined(PINSHARE_ENABLE_DEBUG_MESSAGES)
#define PSH_DEBUG(fmt, ...) ::pinshare::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define PSH_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
