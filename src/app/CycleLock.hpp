#pragma once

#include <chrono>
#include <filesystem>

namespace hostwatch::app {

/**
 * @brief Exclusive advisory lock serializing check cycles across processes.
 *
 * Holds flock(LOCK_EX) on a lock file for its lifetime. The daemon and a
 * one-shot check started from the command line share the same file, so at
 * most one cycle runs at a time. Separate CycleLock objects in one process
 * also exclude each other.
 *
 * @note This class is non-copyable.
 */
class CycleLock {
public:
    /**
     * @brief Tries to take the lock, polling until it is free or the wait expires.
     * @param path Lock file; created if missing.
     * @param wait Maximum time to wait. Zero tries once.
     * @throws std::runtime_error if the lock file cannot be opened.
     */
    CycleLock(const std::filesystem::path& path, std::chrono::milliseconds wait);

    /**
     * @brief Releases the lock and closes the file.
     */
    ~CycleLock();

    CycleLock(const CycleLock&) = delete;
    CycleLock& operator=(const CycleLock&) = delete;

    bool acquired() const { return acquired_; }

private:
    int fd_{-1};
    bool acquired_{false};
};

} // namespace hostwatch::app
