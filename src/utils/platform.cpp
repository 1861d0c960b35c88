/**
 * @file platform.cpp
 * @brief Process identity helpers used by the logger and the examples.
 */
#include "psh_platform.hpp"

#include <filesystem>
#include <vector>

#include <fmt/core.h>

#if defined(PINSHARE_IS_POSIX)
#include <climits>
#include <unistd.h>
#endif

#if defined(PINSHARE_PLATFORM_APPLE)
#include <mach-o/dyld.h>
#endif

#ifndef PINSHARE_VERSION_STRING
#define PINSHARE_VERSION_STRING "0.0.0"
#endif

namespace pinshare::platform
{

uint64_t get_pid() noexcept
{
#if defined(PINSHARE_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(PINSHARE_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(PINSHARE_PLATFORM_APPLE)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::vector<char> buf(size);
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
        {
            return "unknown_apple";
        }
        full_path = std::string(buf.data());
#elif defined(PINSHARE_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
        {
            return "unknown_win";
        }
        full_path.assign(buf.data(), len);
#else
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

const char *get_version_string() noexcept
{
    return PINSHARE_VERSION_STRING;
}

} // namespace pinshare::platform
