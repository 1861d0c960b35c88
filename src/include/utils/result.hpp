/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Sharing a buffer with the kernel fails in expected ways (the buffer is already
 * lent, the kernel rejects the region, ...). Those failures are values, not
 * exceptions: every fallible operation of the sharing layer returns a Result.
 *
 * - Distinguishes between success (T) and expected failures (E)
 * - Carries a numeric detail code next to the error enum; for kernel
 *   rejections this is the kernel's error number, verbatim
 * - No implicit conversions to bool
 */

#pragma once

#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace pinshare
{

/**
 * @brief Error category for buffer sharing operations
 *
 * Local precondition failures are detected before the kernel is involved and
 * never reach it. `Kernel` means the kernel itself rejected the request; the
 * Result's error_code() then holds the kernel's code unchanged.
 */
enum class ShareError
{
    AlreadyShared,   ///< Buffer (or stream) is already lent to the kernel
    NotShared,       ///< Operation needs a lent buffer, but it is not lent
    NotStreaming,    ///< Stream has not been started
    ReadOnlyStorage, ///< ReadWrite share requested for read-only static data
    ForeignKernel,   ///< Exchange between buffers bound to different kernels
    Kernel           ///< Kernel rejected the request; see error_code()
};

/**
 * @brief Convert ShareError to string for logging/debugging
 */
inline const char *to_string(ShareError err) noexcept
{
    switch (err)
    {
    case ShareError::AlreadyShared:
        return "AlreadyShared";
    case ShareError::NotShared:
        return "NotShared";
    case ShareError::NotStreaming:
        return "NotStreaming";
    case ShareError::ReadOnlyStorage:
        return "ReadOnlyStorage";
    case ShareError::ForeignKernel:
        return "ForeignKernel";
    case ShareError::Kernel:
        return "Kernel";
    default:
        return "Unknown";
    }
}

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type (use std::monostate for "no value", see Status)
 * @tparam E Error enum type
 *
 * Usage:
 * @code
 * Status st = buffer.share(AccessMode::ReadWrite);
 * if (st.is_error()) {
 *     LOGGER_WARN("share failed: {} (code {})", to_string(st.error()), st.error_code());
 * }
 * @endcode
 *
 * Not thread-safe; a Result belongs to the caller that received it.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Create a successful Result containing a value
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error enum value
     * @param code Optional detailed error code (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    // Movable but not copyable
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Get the success content
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @brief Get the error enum value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @brief Get the detailed error code
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

// ====================================================================
// Convenience Aliases
// ====================================================================

/**
 * @brief Outcome of an operation with no value (share, start, ...)
 */
using Status = Result<std::monostate, ShareError>;

/**
 * @brief Outcome of an operation that hands back lent storage (stream advance)
 *
 * Holds a reference to the reclaimed storage on success; on failure no storage
 * is returned at all.
 */
template <typename T>
using StorageResult = Result<std::reference_wrapper<T>, ShareError>;

[[nodiscard]] inline Status ok_status()
{
    return Status::ok(std::monostate{});
}

} // namespace pinshare
