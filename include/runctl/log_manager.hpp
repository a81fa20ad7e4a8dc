/**
 * @file log_manager.hpp
 * @brief Manages the log destination of the supervised target
 *
 * This header provides functionality to:
 * - Open the configured log destination (append or truncate)
 * - Write a structured session header before the target starts
 * - Hand the descriptor to the launcher for stdout/stderr redirection
 * - Append a teardown footer when the target is stopped
 * - Read back the last lines of the log
 *
 * The target's own output is not interpreted; only the banners around
 * it are written by runctl.
 */

#pragma once

#include <string>
#include <filesystem>
#include <cstdio>
#include <mutex>
#include <utility>
#include <sys/types.h>

namespace runctl {

    /**
     * @brief Manages the target log file lifecycle
     *
     * Usage:
     *   LogManager lm("/srv/app/app.log", false);
     *   lm.open_session("python3 app.py", "/srv/app");
     *   int fd = lm.get_log_fd();        // dup2'd onto the child's stdout/stderr
     *   lm.note_started(pid);
     *   lm.close();
     *   ...
     *   lm.finalize("Graceful termination");  // later, from `runctl stop`
     *
     * The FILE* is opened close-on-exec; the launcher dup2()s it onto
     * the child's stdout/stderr, which clears the flag on the copies only.
     */
    class LogManager {
    public:
        /**
         * @brief Constructs LogManager for a log destination
         *
         * @param log_path Path to the log file
         * @param truncate Whether open_session() truncates instead of appending
         */
        LogManager(std::filesystem::path log_path, bool truncate = false);

        ~LogManager();

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        /**
         * @brief Opens the log destination and writes the session header
         *
         * Header fields:
         * - Start time (human-readable and Unix timestamp)
         * - Command line of the target
         * - Working directory
         *
         * @param command Target command line as displayed
         * @param workdir Directory the target runs in
         * @throws SupervisorError IO_ERROR if the log can't be opened
         */
        void open_session(const std::string& command, const std::filesystem::path& workdir);

        /**
         * @brief Gets the descriptor for process output redirection
         *
         * @return int File descriptor of the open log
         * @throws SupervisorError IO_ERROR if no session is open
         */
        int get_log_fd();

        /**
         * @brief Records the PID of the launched target in the log
         */
        void note_started(pid_t pid);

        /**
         * @brief Appends the teardown footer
         *
         * Reopens the log in append mode when no session is open (the
         * usual case: stop runs in a different invocation than start).
         * Failures are reported on stderr only and never throw.
         *
         * @param shutdown_method How the target was stopped
         */
        void finalize(const std::string& shutdown_method);

        /**
         * @brief Closes the log if open
         */
        void close();

        /**
         * @brief Gets the last n lines of the log
         *
         * @param n Number of lines to retrieve
         * @return std::string The lines, newline terminated; empty if no log
         */
        [[nodiscard]] std::string get_last_lines(size_t n = 50) const;

        [[nodiscard]] std::filesystem::path get_log_path() const { return log_path_; }

        [[nodiscard]] bool is_log_open() const { return log_file_ != nullptr; }

    private:
        std::filesystem::path log_path_;   ///< Log destination
        bool truncate_;                    ///< Empty the log before a new session
        FILE* log_file_ = nullptr;         ///< Open handle, or nullptr
        mutable std::mutex mutex_;         ///< Protects log file access

        /**
         * @brief Formats now as "YYYY-MM-DD HH:MM:SS" plus Unix seconds
         */
        static std::pair<std::string, long> now_strings();
    };

} // namespace runctl
