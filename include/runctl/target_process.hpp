/**
 * @file target_process.hpp
 * @brief Launches and signals the supervised target process
 *
 * This header provides functionality to:
 * - Resolve the target executable (PATH lookup) before forking
 * - Launch the target detached from the invoking session
 * - Capture the PID of the exact process running the workload
 * - Send signals, and stop with a bounded wait and SIGKILL escalation
 *
 * Launch sequence:
 * 1. fork()            - intermediate child
 * 2. setsid()          - new session, no controlling terminal
 * 3. fork()            - workload child; intermediate reports its PID
 *                        over a pipe and exits, so init adopts the workload
 * 4. redirect stdio    - stdin from /dev/null, stdout/stderr to the log
 * 5. execv()           - replaces the workload child's image; the reported
 *                        PID is therefore the PID of the target itself
 *
 * A second close-on-exec pipe tells the launcher whether execv()
 * succeeded: EOF means exec happened, an errno record means it failed.
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <chrono>
#include <sys/types.h>

namespace runctl {

    /**
     * @brief How a stop request ended
     */
    enum class ShutdownMethod {
        GRACEFUL,         ///< Exited within the timeout after the stop signal
        FORCE_KILLED,     ///< Ignored the stop signal, SIGKILL sent
        SIGNAL_SENT,      ///< Signal delivered, exit not awaited (timeout 0)
        ALREADY_STOPPED   ///< No such process when the signal was sent
    };

    /**
     * @brief Converts a ShutdownMethod to a human-readable string
     *
     * @return std::string "Graceful termination", "Force killed", ...
     */
    inline std::string shutdown_method_to_string(ShutdownMethod method) {
        switch (method) {
            case ShutdownMethod::GRACEFUL:        return "Graceful termination";
            case ShutdownMethod::FORCE_KILLED:    return "Force killed";
            case ShutdownMethod::SIGNAL_SENT:     return "Signal sent";
            case ShutdownMethod::ALREADY_STOPPED: return "Already stopped";
            default:                              return "Unknown";
        }
    }

    /**
     * @brief Handle on one target process, by PID
     *
     * The target is never a child of the invoking runctl, so it can't be
     * waited for with waitpid(); exit is detected by polling liveness.
     *
     * Example:
     *   TargetProcess tp = TargetProcess::launch({"python3", "app.py"}, "/srv/app", log_fd);
     *   // ... later, possibly in another invocation ...
     *   TargetProcess(pid).terminate(SIGTERM, std::chrono::seconds(5));
     */
    class TargetProcess {
    public:
        explicit TargetProcess(pid_t pid);

        /**
         * @brief Launches argv detached, with output going to log_fd
         *
         * @param argv Target command; argv[0] is resolved via PATH if it
         *        contains no '/'
         * @param workdir Working directory of the target
         * @param log_fd Descriptor duplicated onto the target's stdout/stderr
         * @return TargetProcess Handle on the running target
         * @throws SupervisorError LAUNCH_FAILED if the executable can't be
         *         found or executed, or fork/setsid/chdir fails
         */
        static TargetProcess launch(const std::vector<std::string>& argv,
                                    const std::filesystem::path& workdir,
                                    int log_fd);

        /**
         * @brief Resolves an executable name to a path
         *
         * Names containing '/' are taken relative to workdir; others are
         * looked up in $PATH (default "/usr/local/bin:/usr/bin:/bin").
         *
         * @throws SupervisorError LAUNCH_FAILED if not found or not executable
         */
        static std::filesystem::path resolve_executable(const std::string& name,
                                                        const std::filesystem::path& workdir);

        /**
         * @brief Checks if the process is still alive
         */
        [[nodiscard]] bool is_alive() const;

        /**
         * @brief Sends sig to the process
         *
         * @return true if delivered, false if the process does not exist
         * @throws SupervisorError SIGNAL_FAILED if delivery was refused
         */
        bool send_signal(int sig) const;

        /**
         * @brief Stops the process
         *
         * 1. Send sig (ALREADY_STOPPED if the process is gone)
         * 2. timeout == 0: return SIGNAL_SENT without waiting
         * 3. Poll every 100ms up to timeout for exit (GRACEFUL)
         * 4. Still alive: SIGKILL and wait up to 2s more (FORCE_KILLED)
         *
         * @throws SupervisorError SIGNAL_FAILED if sig was refused, or if
         *         the process survives SIGKILL
         */
        ShutdownMethod terminate(int sig, std::chrono::milliseconds timeout) const;

        /**
         * @brief Polls until the process exits or timeout expires
         *
         * @return true if the process exited
         */
        bool wait_for_exit(std::chrono::milliseconds timeout) const;

        [[nodiscard]] pid_t get_pid() const { return pid_; }

    private:
        pid_t pid_;
    };

} // namespace runctl
