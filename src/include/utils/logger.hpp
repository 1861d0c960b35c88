/*******************************************************************************
 * @file logger.hpp
 * @brief Synchronous, thread-safe logging utility.
 *
 * **Design**
 * The sharing layer runs on a single-threaded, event-driven process model, so
 * log records are formatted on the caller's thread and written straight to the
 * active sink under a mutex. There is no background worker: when a logging call
 * returns, the line has been handed to the sink.
 *
 * 1.  **Sink Abstraction**: A `Sink` base class defines a simple interface for
 *     writing and flushing. `ConsoleSink` (stderr, the default) and `FileSink`
 *     (append-only file) are provided; tests may install their own sink.
 * 2.  **Levels**: A runtime level filters records; `LOGGER_COMPILE_LEVEL`
 *     removes records below it at compile time.
 * 3.  **Robustness**: A failing sink never propagates into the caller. The
 *     error is reported through the write-error callback, if one is set.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("shared {} bytes with driver {:#x}", len, driver);
 *
 * Logger& logger = Logger::instance();
 * logger.set_logfile("/tmp/pinshare.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown(); // flushes and closes the sink
 * ```
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "pinshare_export.h"
#include "utils/format_tools.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace pinshare::utils
{

class Sink;

class PINSHARE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---

    /**
     * @brief Switch logging to the console (stderr).
     */
    void set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @return false if the file could not be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Install a caller-provided sink. A null sink discards all records.
     */
    void set_sink(std::unique_ptr<Sink> sink);

    /**
     * @brief Flushes and releases the active sink. Records logged afterwards are
     *        dropped until a new sink is installed.
     */
    void shutdown();

    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback to be invoked when the sink fails to write or open.
     *
     * The callback runs on the logging thread with the logger lock released.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
     */
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    /**
     * @brief Formats and writes one record at the compile-time level `lvl`.
     *
     * Records below LOGGER_COMPILE_LEVEL compile to nothing. A format failure
     * is logged as "[FORMAT ERROR] ..." at the same level instead of thrown.
     */
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    /// As log_fmt(), with a format string only known at run time.
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    // Writes one formatted record to the active sink.
    void write_record(Level lvl, fmt::memory_buffer &&body) noexcept;

    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            write_record(lvl, format_tools::make_buffer(fmt_str, std::forward<Args>(args)...));
        }
        catch (const std::exception &ex)
        {
            write_record(lvl, format_tools::make_buffer("[FORMAT ERROR] {}", ex.what()));
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        write_record(lvl, format_tools::make_buffer_rt(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &ex)
    {
        write_record(lvl, format_tools::make_buffer("[FORMAT ERROR] {}", ex.what()));
    }
}

} // namespace pinshare::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define PSH_LOG_AT_(lvl, fmt, ...)                                                                 \
    ::pinshare::utils::Logger::instance().log_fmt<::pinshare::utils::Logger::Level::lvl>(         \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define PSH_LOG_RT_AT_(lvl, fmt, ...)                                                              \
    ::pinshare::utils::Logger::instance().log_fmt_runtime(::pinshare::utils::Logger::Level::lvl,  \
                                                          fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) PSH_LOG_AT_(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) PSH_LOG_AT_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) PSH_LOG_AT_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) PSH_LOG_AT_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) PSH_LOG_AT_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) PSH_LOG_AT_(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_DEBUG_RT(fmt, ...) PSH_LOG_RT_AT_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...) PSH_LOG_RT_AT_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...) PSH_LOG_RT_AT_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...) PSH_LOG_RT_AT_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
