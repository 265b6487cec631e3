#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace procutil {

/**
 * @brief Owner information recorded inside a lock file.
 */
struct LockInfo {
    unsigned long pid = 0;  ///< Process that created the lock
    std::string hostname;   ///< Host the owning process runs on
    std::string created_at; ///< RFC3339 creation time
};

/// Locks older than this are considered abandoned regardless of owner.
constexpr std::chrono::hours LOCK_STALE_AFTER{24};

/**
 * @brief Attempt to acquire an exclusive lock by creating a lock file.
 *
 * The file is created with `O_EXCL` so only one process can succeed. The
 * owner's pid, host name and creation time are written into it so other
 * processes can decide whether the lock is still alive.
 *
 * @param path Filesystem location of the lock file.
 * @param info Owner information to store.
 * @return true if the lock file was successfully created.
 */
bool acquire_lock_file(const std::filesystem::path& path, const LockInfo& info);

/**
 * @brief Release a previously acquired lock file by deleting it.
 */
void release_lock_file(const std::filesystem::path& path);

/**
 * @brief Read the owner information stored in a lock file.
 *
 * Unknown lines are ignored. A bare pid on the first line is also accepted.
 */
std::optional<LockInfo> read_lock_info(const std::filesystem::path& path);

/**
 * @brief Check whether a process with the given PID is currently running.
 */
bool process_running(unsigned long pid);

/**
 * @brief Modification time of a lock file, or nullopt if it cannot be read.
 */
std::optional<std::chrono::system_clock::time_point>
lock_file_mtime(const std::filesystem::path& path);

/**
 * @brief Decide whether a lock left behind by another process may be broken.
 *
 * A lock is stale when its creation time or @p modified is at least
 * @ref LOCK_STALE_AFTER old, or when it was created on @p host by a pid that
 * no longer exists. A lock without a pid or a readable creation time is only
 * stale once the file itself has aged out.
 */
bool lock_is_stale(const LockInfo& info, const std::string& host,
                   std::chrono::system_clock::time_point now,
                   std::chrono::system_clock::time_point modified);

/**
 * @brief RAII guard that holds a lock file for its lifetime.
 *
 * The constructor attempts to acquire the lock at the given path and the
 * destructor releases it if held.
 */
struct LockFileGuard {
    std::filesystem::path path; ///< Location of the lock file.
    bool locked = false;        ///< Whether the lock was successfully acquired.
    LockFileGuard(const std::filesystem::path& p, const LockInfo& info); ///< Acquire lock.
    ~LockFileGuard();                                                   ///< Release lock.
    LockFileGuard(const LockFileGuard&) = delete;
    LockFileGuard& operator=(const LockFileGuard&) = delete;
};

} // namespace procutil

#endif // LOCK_UTILS_HPP
