/**
 * @file file_lock.hpp
 * @brief Advisory exclusive lock scoped to a check-and-act sequence
 *
 * Wraps flock(2) on a dedicated lock file (never the PID Record itself).
 * The lock is released when the FileLock is destroyed, and by the kernel
 * if the holder dies. The descriptor is opened close-on-exec so a
 * launched target never inherits it.
 */

#pragma once

#include <string>
#include <filesystem>
#include <chrono>

namespace runctl {

    /**
     * @brief RAII holder of an exclusive flock()
     *
     * Usage:
     *   FileLock lock(pidfile.string() + ".lock", std::chrono::seconds(10));
     *   // ... check PID Record, launch, write PID Record ...
     *   // lock released at end of scope
     *
     * Two FileLock objects on the same path exclude each other even
     * within one process, since each opens its own file description.
     */
    class FileLock {
    public:
        /**
         * @brief Acquires the lock, polling until timeout
         *
         * @param path Lock file path (created if missing, never deleted)
         * @param timeout Maximum time to wait for a competing holder
         * @throws SupervisorError IO_ERROR if the file can't be opened or
         *         the lock is still held when timeout expires
         */
        FileLock(std::filesystem::path path, std::chrono::milliseconds timeout);

        ~FileLock();

        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;

        /**
         * @brief Releases the lock early
         *
         * Safe to call more than once.
         */
        void release();

        [[nodiscard]] bool held() const { return fd_ >= 0; }

        [[nodiscard]] std::filesystem::path get_path() const { return path_; }

    private:
        std::filesystem::path path_;
        int fd_ = -1;
    };

} // namespace runctl
