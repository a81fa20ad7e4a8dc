/**
 * @file process_table.hpp
 * @brief Queries against the live OS process table
 *
 * Provides:
 * - Liveness check for a single PID (kill(pid, 0), zombies count as dead)
 * - Command line of a PID from /proc/<pid>/cmdline
 * - Start time of a PID, which identifies one process across PID reuse
 * - Name-match scan of /proc for processes whose command line contains a
 *   pattern, excluding runctl itself
 *
 * The scan is diagnostic only; the PID Record remains the source of truth.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <sys/types.h>

namespace runctl {

    /**
     * @brief One process found by the name-match scan
     */
    struct ProcessInfo {
        pid_t pid = -1;
        std::string cmdline;   ///< argv joined with spaces
    };

    /**
     * @brief Stateless access to the process table
     */
    class ProcessTable {
    public:
        /**
         * @brief Checks whether pid names a live process
         *
         * EPERM from kill() means the process exists but belongs to another
         * user; that still counts as alive. A zombie (state 'Z' in
         * /proc/<pid>/stat) has already exited and counts as dead.
         *
         * @param pid Process identifier
         * @return true if the process exists and has not exited
         */
        static bool is_alive(pid_t pid);

        /**
         * @brief Reads the command line of pid
         *
         * @param pid Process identifier
         * @return std::optional<std::string> argv joined with spaces, or
         *         nullopt if /proc/<pid>/cmdline is unreadable or empty
         */
        static std::optional<std::string> read_cmdline(pid_t pid);

        /**
         * @brief Reads when pid started, in clock ticks since boot
         *
         * The value survives exec() and setproctitle(), and a later process
         * reusing the PID gets a different one.
         *
         * @param pid Process identifier
         * @return std::optional<unsigned long long> starttime from
         *         /proc/<pid>/stat, or nullopt if unreadable
         */
        static std::optional<unsigned long long> read_start_time(pid_t pid);

        /**
         * @brief Scans /proc for processes matching pattern
         *
         * Excludes the calling process and its parent so that a runctl
         * invoked with the pattern on its own command line never matches
         * itself.
         *
         * @param pattern Substring searched for in each command line
         * @return std::vector<ProcessInfo> Matches in ascending PID order
         */
        static std::vector<ProcessInfo> find_matching(const std::string& pattern);

        /**
         * @brief Checks whether cmdline contains pattern
         *
         * An empty pattern matches nothing.
         */
        static bool matches(const std::string& cmdline, const std::string& pattern);
    };

} // namespace runctl
