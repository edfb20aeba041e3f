#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace solohub::utils
{

/**
 * @brief Appends formatted log lines to a file.
 *
 * With use_flock (POSIX), every line is written under an advisory exclusive lock,
 * so several processes can share one log file without interleaving partial lines.
 * The constructor throws std::runtime_error if the file cannot be opened.
 */
class FileSink : public Sink
{
  public:
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    void write_all(const std::string &content);
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock{false};
#if defined(SOLOHUB_PLATFORM_WIN64)
    HANDLE m_file_handle{INVALID_HANDLE_VALUE};
#else
    int m_fd{-1};
#endif
};

} // namespace solohub::utils
