/**
 * @file supervisor.hpp
 * @brief Single-instance start/stop/status of one target process
 *
 * Identity of the target comes from the PID Record, which is the only
 * source of truth. The process-table scan is used as a diagnostic: it
 * reports "unmanaged instances" (matching processes that are not the
 * recorded PID, e.g. started by hand) but never decides whether the
 * target is running. Such instances are a known gap and are neither
 * adopted nor killed.
 *
 * Every operation holds an exclusive advisory lock on "<pidfile>.lock"
 * for its check-and-act sequence, so concurrent invocations serialize:
 * two racing start() calls launch exactly one process.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <sys/types.h>

#include "runctl/config_manager.hpp"
#include "runctl/pid_record.hpp"
#include "runctl/process_table.hpp"
#include "runctl/target_process.hpp"

namespace runctl {

    class AuditLogger;
    class FileLock;

    /**
     * @brief Observed state of the target
     */
    enum class RunState {
        RUNNING,
        NOT_RUNNING
    };

    /**
     * @brief Formats a run state the way `runctl status` prints it
     *
     * @return std::string "Running(<pid>)" or "NotRunning"
     */
    inline std::string run_state_to_string(RunState state, pid_t pid) {
        if (state == RunState::RUNNING) {
            return "Running(" + std::to_string(pid) + ")";
        }
        return "NotRunning";
    }

    struct StartResult {
        pid_t pid = -1;
        std::filesystem::path log_file;
        std::vector<ProcessInfo> unmanaged;   ///< Matching processes not started by runctl
        bool ready_checked = false;           ///< A readiness wait was performed and passed
    };

    struct StopResult {
        pid_t pid = -1;                       ///< Recorded PID, -1 if the record was corrupt
        ShutdownMethod method = ShutdownMethod::ALREADY_STOPPED;
    };

    struct StatusReport {
        RunState state = RunState::NOT_RUNNING;
        pid_t pid = -1;
        std::vector<ProcessInfo> unmanaged;
        std::optional<bool> ready;            ///< Probe result, when configured and running
        std::string probe_error;
    };

    /**
     * @brief Supervises one configured target process
     *
     * Usage:
     *   AuditLogger audit(config.audit_log);
     *   Supervisor supervisor(config, audit);
     *   pid_t pid = supervisor.start().pid;
     *   auto report = supervisor.status();   // RUNNING, same pid
     *   supervisor.stop();
     *
     * Errors are thrown as SupervisorError; see errors.hpp.
     */
    class Supervisor {
    public:
        Supervisor(SupervisorConfig config, AuditLogger& audit);

        /**
         * @brief Determines whether the recorded target is alive
         *
         * Reads the PID Record and checks the process table. A record
         * naming a dead process, a process that reused the PID, or holding
         * no valid PID is stale: it is deleted with a warning.
         *
         * PID reuse is detected from the start time stored in the record.
         * The command line is not compared then, so a target that execs
         * another program or rewrites its argv stays recognised. Records
         * without a start time fall back to the command line pattern.
         *
         * @return std::optional<pid_t> The live PID, or nullopt
         * @throws SupervisorError IO_ERROR if the record exists but can't
         *         be read; this never degrades to "not running"
         */
        std::optional<pid_t> is_running();

        /**
         * @brief Launches the target unless it is already running
         *
         * @return StartResult PID of the launched target (the workload
         *         process itself, not an intermediate) and diagnostics
         * @throws SupervisorError ALREADY_RUNNING (pid set), LAUNCH_FAILED,
         *         IO_ERROR, CONFIG_ERROR, PROBE_FAILED
         */
        StartResult start();

        /**
         * @brief Signals the recorded target and removes the PID Record
         *
         * A target that no longer exists yields method ALREADY_STOPPED
         * and is not an error. The record is removed on every outcome
         * except SIGNAL_FAILED.
         *
         * @throws SupervisorError NOT_RUNNING if there is no record,
         *         SIGNAL_FAILED, IO_ERROR
         */
        StopResult stop();

        /**
         * @brief Stops the target if recorded, then starts it
         *
         * Both steps run under one lock acquisition.
         */
        StartResult restart();

        /**
         * @brief Reports the run state plus diagnostics
         *
         * Side effects are limited to stale-record cleanup.
         */
        StatusReport status();

        /**
         * @brief Lists matching processes other than managed
         *
         * @param managed The recorded live PID, if any
         */
        [[nodiscard]] std::vector<ProcessInfo> find_unmanaged(std::optional<pid_t> managed) const;

        [[nodiscard]] const SupervisorConfig& get_config() const { return config_; }

    private:
        SupervisorConfig config_;
        AuditLogger& audit_;
        PidRecord record_;

        std::optional<pid_t> check_record();
        std::optional<std::string> reused_by(const RecordContents& contents) const;
        StartResult start_locked(FileLock& lock);
        StopResult stop_locked();
        void wait_for_startup(const TargetProcess& target, StartResult& result);
        void discard_record_of(pid_t pid);
        void warn(const std::string& message, const std::string& context);
    };

} // namespace runctl
