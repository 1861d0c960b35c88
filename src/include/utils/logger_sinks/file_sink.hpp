#pragma once

#include <cstdio>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace pinshare::utils
{

/**
 * @brief Appends formatted log lines to a file.
 *
 * The constructor throws std::runtime_error if the file cannot be opened.
 */
class PINSHARE_EXPORT FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

    const std::string &path() const noexcept { return m_path; }

  private:
    std::string m_path;
    std::FILE *m_file{nullptr};
};

} // namespace pinshare::utils
