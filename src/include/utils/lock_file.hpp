#pragma once
/**
 * @file lock_file.hpp
 * @brief Cross-process leader election through a pid-stamped lockfile.
 *
 * The lockfile holds `{"pid": <int>, "timestamp": <ms since epoch>}`. A process is the
 * leader while the file exists and names it; a record whose pid is no longer alive is
 * stale and may be taken over.
 *
 * Acquisition never overwrites a record: the complete record is written to a private
 * temporary file which is then hard-linked to the lock path. link(2) fails with EEXIST
 * if the path exists, so exactly one contender wins and readers never observe a
 * partially written record. The winner re-reads the file to confirm its own pid.
 *
 * This is the only cross-process synchronization primitive in poolhub.
 */
#include "ph_base.hpp"

#include <filesystem>
#include <optional>

namespace poolhub::utils
{

struct LockRecord
{
    uint64_t pid = 0;
    int64_t timestamp = 0; ///< milliseconds since the Unix epoch
};

class POOLHUB_UTILS_EXPORT LeaderLock
{
  public:
    explicit LeaderLock(std::filesystem::path lock_path, uint64_t own_pid = platform::get_pid());

    /** Releases the lock if this object still holds it. */
    ~LeaderLock();

    LeaderLock(const LeaderLock &) = delete;
    LeaderLock &operator=(const LeaderLock &) = delete;

    /**
     * @brief Attempts to become leader.
     *
     * Fails if the record names a live process. A stale record is removed first.
     * Lock contention is not an error: every failure mode returns false.
     */
    [[nodiscard]] bool try_acquire();

    /**
     * @brief Last-resort acquisition after bounded retries. Tries try_acquire() and, if
     *        that fails, atomically replaces the record with our own. Another live
     *        process may still believe it is leader afterwards.
     */
    void force_acquire();

    /**
     * @brief Removes the lockfile if it still names this process. Idempotent.
     */
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return m_held; }

    /** @brief Reads and parses the current record; empty if missing or unreadable. */
    [[nodiscard]] std::optional<LockRecord> read_record() const;

    /** @brief True if a record exists and its pid is alive. */
    [[nodiscard]] bool holder_alive() const;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

    /** @brief Parses a lockfile at an arbitrary path (used by diagnostics and tests). */
    static std::optional<LockRecord> read_record_at(const std::filesystem::path &path);

  private:
    std::filesystem::path write_temp_record() const;

    std::filesystem::path m_path;
    uint64_t m_pid;
    bool m_held = false;
};

} // namespace poolhub::utils
