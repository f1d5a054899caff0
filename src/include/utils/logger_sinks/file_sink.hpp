#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace poolhub::utils
{

/**
 * @brief Appends log lines to a file. Several processes sharing one pool may log to the
 *        same file; with `use_flock` each write holds an advisory lock.
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending.
     */
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    bool m_use_flock = false;
    int m_fd = -1;
};

} // namespace poolhub::utils
