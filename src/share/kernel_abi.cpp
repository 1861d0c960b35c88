#include "share/kernel_abi.hpp"

#include <cctype>

namespace pinshare
{

const char *to_string(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::Fail:
        return "FAIL";
    case ErrorCode::Busy:
        return "BUSY";
    case ErrorCode::Already:
        return "ALREADY";
    case ErrorCode::Off:
        return "OFF";
    case ErrorCode::Reserve:
        return "RESERVE";
    case ErrorCode::Invalid:
        return "INVAL";
    case ErrorCode::Size:
        return "SIZE";
    case ErrorCode::Cancel:
        return "CANCEL";
    case ErrorCode::NoMem:
        return "NOMEM";
    case ErrorCode::NoSupport:
        return "NOSUPPORT";
    case ErrorCode::NoDevice:
        return "NODEVICE";
    case ErrorCode::Uninstalled:
        return "UNINSTALLED";
    case ErrorCode::NoAck:
        return "NOACK";
    default:
        return "UNKNOWN";
    }
}

const char *to_string(AccessMode mode) noexcept
{
    switch (mode)
    {
    case AccessMode::ReadWrite:
        return "ReadWrite";
    case AccessMode::ReadOnly:
        return "ReadOnly";
    default:
        return "Unknown";
    }
}

std::optional<AccessMode> parse_access_mode(const std::string &text) noexcept
{
    std::string lower;
    lower.reserve(text.size());
    for (char c : text)
    {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "rw" || lower == "readwrite")
        return AccessMode::ReadWrite;
    if (lower == "ro" || lower == "readonly")
        return AccessMode::ReadOnly;
    return std::nullopt;
}

} // namespace pinshare
