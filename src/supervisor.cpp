//
// Created by opencode on 07/03/2026.
//

#include "runctl/supervisor.hpp"
#include "runctl/audit_logger.hpp"
#include "runctl/errors.hpp"
#include "runctl/file_lock.hpp"
#include "runctl/log_manager.hpp"
#include "runctl/readiness_probe.hpp"
#include "runctl/utils.hpp"
#include <iostream>
#include <thread>

namespace runctl {

    Supervisor::Supervisor(SupervisorConfig config, AuditLogger& audit)
        : config_(std::move(config))
        , audit_(audit)
        , record_(config_.pidfile) {}

    std::optional<pid_t> Supervisor::is_running() {
        FileLock lock(config_.lock_path(), config_.lock_timeout);
        return check_record();
    }

    StartResult Supervisor::start() {
        FileLock lock(config_.lock_path(), config_.lock_timeout);
        return start_locked(lock);
    }

    StopResult Supervisor::stop() {
        FileLock lock(config_.lock_path(), config_.lock_timeout);
        return stop_locked();
    }

    StartResult Supervisor::restart() {
        FileLock lock(config_.lock_path(), config_.lock_timeout);

        try {
            StopResult stopped = stop_locked();
            audit_.log_info("Restart: previous instance " +
                            shutdown_method_to_string(stopped.method));
        } catch (const SupervisorError& e) {
            if (e.kind() != ErrorKind::NOT_RUNNING) {
                throw;
            }
        }

        return start_locked(lock);
    }

    StatusReport Supervisor::status() {
        StatusReport report;

        {
            FileLock lock(config_.lock_path(), config_.lock_timeout);
            auto pid = check_record();
            if (pid) {
                report.state = RunState::RUNNING;
                report.pid = *pid;
            }
        }

        report.unmanaged = find_unmanaged(report.state == RunState::RUNNING
                                              ? std::optional<pid_t>(report.pid)
                                              : std::nullopt);
        for (const auto& info : report.unmanaged) {
            warn("Unmanaged instance PID " + std::to_string(info.pid) + ": " + info.cmdline,
                 "status");
        }

        if (report.state == RunState::RUNNING) {
            ReadinessProbe probe(config_.probe_tcp, config_.probe_http);
            if (probe.is_configured()) {
                report.ready = probe.check();
                report.probe_error = probe.get_last_error();
            }
        }

        return report;
    }

    std::vector<ProcessInfo> Supervisor::find_unmanaged(std::optional<pid_t> managed) const {
        std::vector<ProcessInfo> unmanaged;
        for (const auto& info : ProcessTable::find_matching(config_.match_pattern())) {
            if (managed && info.pid == *managed) {
                continue;
            }
            unmanaged.push_back(info);
        }
        return unmanaged;
    }

    std::optional<pid_t> Supervisor::check_record() {
        RecordContents contents;
        try {
            contents = record_.read();
        } catch (const SupervisorError& e) {
            audit_.log_error(e.what(), "is_running");
            throw;
        }

        if (contents.status == RecordStatus::ABSENT) {
            return std::nullopt;
        }

        if (contents.status == RecordStatus::CORRUPT) {
            warn("PID file " + record_.get_path().string() + " holds no valid PID, removing it",
                 "stale");
            record_.remove();
            return std::nullopt;
        }

        pid_t pid = contents.pid;

        if (!ProcessTable::is_alive(pid)) {
            warn("Stale PID file: process " + std::to_string(pid) + " is not running, removing " +
                 record_.get_path().string(), "stale");
            record_.remove();
            audit_.log_state_transition(run_state_to_string(RunState::RUNNING, pid),
                                        run_state_to_string(RunState::NOT_RUNNING, pid));
            return std::nullopt;
        }

        auto other = reused_by(contents);
        if (other) {
            warn("Stale PID file: PID " + std::to_string(pid) + " now belongs to " + *other +
                 ", removing " + record_.get_path().string(), "stale");
            record_.remove();
            return std::nullopt;
        }

        return pid;
    }

    std::optional<std::string> Supervisor::reused_by(const RecordContents& contents) const {
        auto cmdline = ProcessTable::read_cmdline(contents.pid);
        std::string description = "'" + cmdline.value_or("?") + "'";

        if (contents.start_time) {
            auto start_time = ProcessTable::read_start_time(contents.pid);
            if (start_time && *start_time != *contents.start_time) {
                return description + " (started at tick " + std::to_string(*start_time) +
                       ", recorded " + std::to_string(*contents.start_time) + ")";
            }
            return std::nullopt;
        }

        // An unreadable command line (hidepid, other user) is given the benefit of the doubt
        if (cmdline && !ProcessTable::matches(*cmdline, config_.match_pattern())) {
            return description;
        }
        return std::nullopt;
    }

    StartResult Supervisor::start_locked(FileLock& lock) {
        StartResult result;
        result.log_file = config_.logfile;

        auto existing = check_record();
        if (existing) {
            audit_.log_error("Already running with PID " + std::to_string(*existing), "start");
            throw SupervisorError(ErrorKind::ALREADY_RUNNING,
                "App is already running with PID " + std::to_string(*existing) + ".",
                *existing);
        }

        // Validate probe settings before anything is launched
        ReadinessProbe probe(config_.probe_tcp, config_.probe_http);

        result.unmanaged = find_unmanaged(std::nullopt);
        for (const auto& info : result.unmanaged) {
            warn("Unmanaged instance PID " + std::to_string(info.pid) + " is already running: " +
                 info.cmdline, "start");
        }

        std::string command = join_command_line(config_.target);
        LogManager log_manager(config_.logfile, config_.truncate_log);
        log_manager.open_session(command, config_.workdir);

        audit_.log_action("Launching", command + " (cwd " + config_.workdir.string() + ")");

        pid_t pid = -1;
        try {
            TargetProcess target = TargetProcess::launch(config_.target, config_.workdir,
                                                         log_manager.get_log_fd());
            pid = target.get_pid();
        } catch (const SupervisorError& e) {
            log_manager.finalize(std::string("Launch failed: ") + e.what());
            audit_.log_error(e.what(), "start");
            throw;
        }

        try {
            record_.write(pid, ProcessTable::read_start_time(pid));
        } catch (const SupervisorError& e) {
            // Never leave an instance running without a record
            audit_.log_error(e.what(), "start");
            try {
                TargetProcess(pid).terminate(SIGKILL, std::chrono::seconds(2));
            } catch (const SupervisorError& kill_error) {
                warn(std::string("Unrecorded PID ") + std::to_string(pid) + " left running: " +
                     kill_error.what(), "start");
            }
            log_manager.finalize("Killed: PID file could not be written");
            throw;
        }

        log_manager.note_started(pid);
        log_manager.close();

        result.pid = pid;
        audit_.log_state_transition(run_state_to_string(RunState::NOT_RUNNING, pid),
                                    run_state_to_string(RunState::RUNNING, pid));
        audit_.log_success("Started", "PID " + std::to_string(pid) + ", log " +
                                      config_.logfile.string());

        lock.release();

        if (config_.wait.count() > 0) {
            wait_for_startup(TargetProcess(pid), result);
        }

        return result;
    }

    void Supervisor::wait_for_startup(const TargetProcess& target, StartResult& result) {
        ReadinessProbe probe(config_.probe_tcp, config_.probe_http);
        auto still_alive = [&target]() { return target.is_alive(); };

        if (!probe.is_configured()) {
            // Grace period: the target must survive the whole wait
            auto deadline = std::chrono::steady_clock::now() + config_.wait;
            while (std::chrono::steady_clock::now() < deadline) {
                if (!target.is_alive()) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (target.is_alive()) {
                return;
            }
        } else {
            ProbeResult probe_result = probe.wait_until_ready(config_.wait, still_alive);

            if (probe_result == ProbeResult::READY) {
                result.ready_checked = true;
                audit_.log_success("Ready", probe.describe());
                return;
            }

            if (probe_result == ProbeResult::TIMED_OUT) {
                audit_.log_error(probe.get_last_error(), "start");
                throw SupervisorError(ErrorKind::PROBE_FAILED,
                    "App started with PID " + std::to_string(target.get_pid()) +
                    " but did not become ready: " + probe.get_last_error(),
                    target.get_pid());
            }
        }

        discard_record_of(target.get_pid());
        LogManager(config_.logfile).finalize("Process exited during startup");
        audit_.log_error("PID " + std::to_string(target.get_pid()) + " exited during startup", "start");
        throw SupervisorError(ErrorKind::LAUNCH_FAILED,
            "App exited during startup. Check log: " + config_.logfile.string(),
            target.get_pid());
    }

    void Supervisor::discard_record_of(pid_t pid) {
        FileLock lock(config_.lock_path(), config_.lock_timeout);
        RecordContents contents = record_.read();
        if (contents.status == RecordStatus::VALID && contents.pid == pid) {
            record_.remove();
        }
    }

    StopResult Supervisor::stop_locked() {
        StopResult result;

        RecordContents contents = record_.read();

        if (contents.status == RecordStatus::ABSENT) {
            audit_.log_error("PID file not found", "stop");
            throw SupervisorError(ErrorKind::NOT_RUNNING,
                "PID file not found. Is the app running?");
        }

        if (contents.status == RecordStatus::CORRUPT) {
            warn("PID file " + record_.get_path().string() + " holds no valid PID, removing it",
                 "stop");
            record_.remove();
            return result;
        }

        result.pid = contents.pid;
        TargetProcess target(contents.pid);

        if (target.is_alive()) {
            // Never signal a process that merely inherited a recycled PID
            auto other = reused_by(contents);
            if (other) {
                warn("PID " + std::to_string(contents.pid) + " now belongs to " + *other +
                     ", not signalling it", "stop");
                record_.remove();
                return result;
            }
        }

        audit_.log_action("Sending SIG" + ConfigManager::signal_to_string(config_.stop_signal),
                          "PID " + std::to_string(contents.pid));

        try {
            result.method = target.terminate(config_.stop_signal, config_.stop_timeout);
        } catch (const SupervisorError& e) {
            audit_.log_error(e.what(), "stop");
            throw;
        }

        record_.remove();
        LogManager(config_.logfile).finalize(shutdown_method_to_string(result.method));

        if (result.method == ShutdownMethod::ALREADY_STOPPED) {
            audit_.log_warning("PID " + std::to_string(contents.pid) + " was already stopped", "stop");
        } else {
            audit_.log_state_transition(run_state_to_string(RunState::RUNNING, contents.pid),
                                        run_state_to_string(RunState::NOT_RUNNING, contents.pid));
            audit_.log_success("Stopped", "PID " + std::to_string(contents.pid) + " (" +
                                          shutdown_method_to_string(result.method) + ")");
        }

        return result;
    }

    void Supervisor::warn(const std::string& message, const std::string& context) {
        std::cerr << "Warning: " << message << std::endl;
        audit_.log_warning(message, context);
    }

} // namespace runctl
