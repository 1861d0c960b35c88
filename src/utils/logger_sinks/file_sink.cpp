#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>

namespace pinshare::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
    m_file = std::fopen(path.c_str(), "a");
    if (m_file == nullptr)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

void FileSink::write(const LogMessage &msg)
{
    const auto line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::runtime_error(
            fmt::format("Short write to log file '{}': {}", m_path, std::strerror(errno)));
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

std::string FileSink::description() const
{
    return "File: " + m_path;
}

} // namespace pinshare::utils
