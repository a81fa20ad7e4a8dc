/**
 * @file errors.hpp
 * @brief Error taxonomy for supervisor operations
 *
 * Every failing supervisor operation throws a SupervisorError carrying
 * one of the ErrorKind values below. CommandHandler catches it and turns
 * it into a JSON response and a process exit code.
 *
 * "Already stopped" is deliberately absent: stop() reports it as a
 * StopOutcome, since the desired end state already holds.
 */

#pragma once

#include <string>
#include <stdexcept>
#include <sys/types.h>

namespace runctl {

    /**
     * @brief Categories of supervisor failures
     */
    enum class ErrorKind {
        ALREADY_RUNNING,  ///< start() found a live recorded process
        NOT_RUNNING,      ///< stop() found no PID Record
        LAUNCH_FAILED,    ///< executable missing, exec failed, died on startup
        SIGNAL_FAILED,    ///< kill() refused (EPERM), process still alive
        IO_ERROR,         ///< PID Record, lock or log unreadable/unwritable
        CONFIG_ERROR,     ///< invalid config file, flag or env value
        PROBE_FAILED      ///< readiness probe did not pass in time
    };

    /**
     * @brief Converts an ErrorKind to its wire name
     *
     * @param kind The kind to convert
     * @return std::string e.g. "AlreadyRunning", "LaunchFailed"
     */
    inline std::string error_kind_to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::ALREADY_RUNNING: return "AlreadyRunning";
            case ErrorKind::NOT_RUNNING:     return "NotRunning";
            case ErrorKind::LAUNCH_FAILED:   return "LaunchFailed";
            case ErrorKind::SIGNAL_FAILED:   return "SignalFailed";
            case ErrorKind::IO_ERROR:        return "IoError";
            case ErrorKind::CONFIG_ERROR:    return "ConfigError";
            case ErrorKind::PROBE_FAILED:    return "ProbeFailed";
            default:                         return "Unknown";
        }
    }

    /**
     * @brief Exception thrown by supervisor operations
     *
     * what() holds the human-readable message; kind() the category and
     * pid() the process involved, or -1 when no process is involved.
     */
    class SupervisorError : public std::runtime_error {
    public:
        SupervisorError(ErrorKind kind, const std::string& message, pid_t pid = -1)
            : std::runtime_error(message)
            , kind_(kind)
            , pid_(pid) {}

        [[nodiscard]] ErrorKind kind() const { return kind_; }
        [[nodiscard]] pid_t pid() const { return pid_; }

    private:
        ErrorKind kind_;
        pid_t pid_;
    };

} // namespace runctl
