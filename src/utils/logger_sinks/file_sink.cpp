#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace poolhub::utils
{

FileSink::FileSink(const std::filesystem::path &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
    std::error_code ec;
    if (m_path.has_parent_path())
    {
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::system_error err(errno, std::generic_category(), "open failed for log file");
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), err.what()));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
    }
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const std::string line = format_logmsg(msg, mode);
    if (m_use_flock)
    {
        // Advisory only, but serializes writers that cooperate.
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t written = ::write(m_fd, line.data(), line.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (written < 0 || static_cast<size_t>(written) != line.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
}

void FileSink::flush()
{
    ::fsync(m_fd);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace poolhub::utils
