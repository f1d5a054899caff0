#include "ph_base.hpp"
#include "utils/lock_file.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace poolhub::utils
{

LeaderLock::LeaderLock(fs::path lock_path, uint64_t own_pid)
    : m_path(std::move(lock_path)), m_pid(own_pid)
{
}

LeaderLock::~LeaderLock()
{
    release();
}

std::optional<LockRecord> LeaderLock::read_record_at(const fs::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto parsed = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_object() || !parsed.contains("pid") || !parsed["pid"].is_number_integer())
    {
        return std::nullopt;
    }
    LockRecord record;
    record.pid = parsed["pid"].get<uint64_t>();
    record.timestamp = parsed.value("timestamp", int64_t{0});
    return record;
}

std::optional<LockRecord> LeaderLock::read_record() const
{
    return read_record_at(m_path);
}

bool LeaderLock::holder_alive() const
{
    const auto record = read_record();
    return record.has_value() && platform::is_process_alive(record->pid);
}

fs::path LeaderLock::write_temp_record() const
{
    const fs::path temp = m_path.string() + fmt::format(".{}.tmp", m_pid);
    const nlohmann::json record = {{"pid", m_pid}, {"timestamp", platform::wall_clock_ms()}};
    const std::string content = record.dump();

    const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd == -1)
    {
        throw std::system_error(errno, std::generic_category(),
                                "LeaderLock: cannot create " + temp.string());
    }
    auto close_fd = basics::make_scope_guard([fd] { ::close(fd); });
    const ssize_t written = ::write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size())
    {
        const int saved = errno;
        ::unlink(temp.c_str());
        throw std::system_error(saved, std::generic_category(),
                                "LeaderLock: cannot write " + temp.string());
    }
    return temp;
}

bool LeaderLock::try_acquire()
{
    if (m_held)
    {
        return true;
    }

    if (const auto existing = read_record())
    {
        if (platform::is_process_alive(existing->pid))
        {
            return false;
        }
        LOGGER_INFO("LeaderLock: removing stale lock of dead pid {}", existing->pid);
        ::unlink(m_path.c_str());
    }

    fs::path temp;
    try
    {
        temp = write_temp_record();
    }
    catch (const std::system_error &e)
    {
        LOGGER_WARN("{}", e.what());
        return false;
    }
    const int rc = ::link(temp.c_str(), m_path.c_str());
    const int saved_errno = errno;
    ::unlink(temp.c_str());

    if (rc == -1)
    {
        if (saved_errno != EEXIST)
        {
            LOGGER_WARN("LeaderLock: link({}) failed: {}", m_path.string(),
                        std::generic_category().message(saved_errno));
        }
        return false;
    }

    // Another contender may have removed our file as "stale" between link and now.
    const auto verified = read_record();
    if (!verified || verified->pid != m_pid)
    {
        return false;
    }
    m_held = true;
    return true;
}

void LeaderLock::force_acquire()
{
    if (try_acquire())
    {
        return;
    }
    try
    {
        const fs::path temp = write_temp_record();
        if (::rename(temp.c_str(), m_path.c_str()) == -1)
        {
            const int saved = errno;
            ::unlink(temp.c_str());
            throw std::system_error(saved, std::generic_category(), "LeaderLock: rename");
        }
        LOGGER_WARN("LeaderLock: forcibly took over {}", m_path.string());
    }
    catch (const std::system_error &e)
    {
        LOGGER_ERROR("LeaderLock: force acquisition failed: {}", e.what());
    }
    // Leadership is assumed even if the record could not be written.
    m_held = true;
}

void LeaderLock::release() noexcept
{
    if (!m_held)
    {
        return;
    }
    m_held = false;
    try
    {
        const auto record = read_record();
        if (record && record->pid == m_pid)
        {
            ::unlink(m_path.c_str());
        }
    }
    catch (const std::exception &e)
    {
        PH_DEBUG("LeaderLock::release: {}", e.what());
    }
}

} // namespace poolhub::utils
