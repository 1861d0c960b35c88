/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous logger.
 ******************************************************************************/

#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include "psh_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace pinshare::utils
{

struct Logger::Impl
{
    std::mutex m_sink_mutex;
    std::unique_ptr<Sink> sink_{std::make_unique<ConsoleSink>()};
    std::atomic<Level> level_{Level::L_INFO};
    std::function<void(const std::string &)> error_callback_;

    // Swaps in a new sink, flushing the old one first.
    void replace_sink(std::unique_ptr<Sink> sink)
    {
        std::unique_ptr<Sink> old;
        {
            std::lock_guard<std::mutex> lock(m_sink_mutex);
            old = std::move(sink_);
            sink_ = std::move(sink);
        }
        if (old)
        {
            old->flush();
        }
    }

    void report_error(const std::string &what)
    {
        std::function<void(const std::string &)> cb;
        {
            std::lock_guard<std::mutex> lock(m_sink_mutex);
            cb = error_callback_;
        }
        if (cb)
        {
            cb(what);
        }
    }
};

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Never destroyed: buffers with static storage duration unshare, and log,
    // after function-local statics are gone.
    static Logger *const instance = new Logger();
    return *instance;
}

void Logger::set_console()
{
    pImpl->replace_sink(std::make_unique<ConsoleSink>());
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::runtime_error &e)
    {
        pImpl->report_error(e.what());
        return false;
    }
    pImpl->replace_sink(std::move(sink));
    return true;
}

void Logger::set_sink(std::unique_ptr<Sink> sink)
{
    pImpl->replace_sink(std::move(sink));
}

void Logger::shutdown()
{
    pImpl->replace_sink(nullptr);
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
    if (pImpl->sink_)
    {
        pImpl->sink_->flush();
    }
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
    pImpl->error_callback_ = std::move(cb);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
    {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warn" || lower == "warning")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::write_record(Level lvl, fmt::memory_buffer &&body) noexcept
{
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
        if (!pImpl->sink_)
            return;
        try
        {
            pImpl->sink_->write(LogMessage{.timestamp = std::chrono::system_clock::now(),
                                           .process_id = platform::get_pid(),
                                           .level = static_cast<int>(lvl),
                                           .body = std::move(body)});
            return;
        }
        catch (const std::exception &e)
        {
            failure = fmt::format("{} write failed: {}", pImpl->sink_->description(), e.what());
        }
    }
    // Outside the lock: the callback may log.
    try
    {
        pImpl->report_error(failure);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PINSHARE] log write error callback threw: {}\n", e.what());
    }
}

} // namespace pinshare::utils
