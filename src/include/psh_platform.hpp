#pragma once
/**
 * @file psh_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (PINSHARE_PLATFORM_LINUX, PINSHARE_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_LINUX) &&             \
                                !defined(PLATFORM_FREEBSD) && defined(_WIN64))
#define PINSHARE_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define PINSHARE_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define PINSHARE_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define PINSHARE_PLATFORM_LINUX 1

#else
#define PINSHARE_PLATFORM_UNKNOWN 1
#endif

// Convenience booleans for source code usage:
#if defined(PINSHARE_PLATFORM_WIN64)
#define PINSHARE_IS_WINDOWS 1
#undef PINSHARE_IS_POSIX
#elif defined(PINSHARE_PLATFORM_APPLE) || defined(PINSHARE_PLATFORM_FREEBSD) ||                    \
    defined(PINSHARE_PLATFORM_LINUX)
#undef PINSHARE_IS_WINDOWS
#define PINSHARE_IS_POSIX 1
#else
#undef PINSHARE_IS_WINDOWS
#undef PINSHARE_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// Capability descriptors are constrained with concepts and the buffer API hands
// out std::span views of the lent storage.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "pinshare_export.h"

namespace pinshare::platform
{

/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
PINSHARE_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
PINSHARE_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets the full version string (major.minor.patch) of the library.
 */
PINSHARE_EXPORT const char *get_version_string() noexcept;

} // namespace pinshare::platform
