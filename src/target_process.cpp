//
// Created by opencode on 05/03/2026.
//

#include "runctl/target_process.hpp"
#include "runctl/errors.hpp"
#include "runctl/process_table.hpp"
#include <thread>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace runctl {

    namespace {

        enum LaunchStage : int {
            STAGE_SETSID = 1,
            STAGE_FORK,
            STAGE_STDIO,
            STAGE_CHDIR,
            STAGE_EXEC
        };

        struct LaunchFailure {
            int stage;
            int error;
        };

        const char* stage_to_string(int stage) {
            switch (stage) {
                case STAGE_SETSID: return "setsid";
                case STAGE_FORK:   return "fork";
                case STAGE_STDIO:  return "redirect stdio";
                case STAGE_CHDIR:  return "chdir";
                case STAGE_EXEC:   return "exec";
                default:           return "launch";
            }
        }

        // Runs in a forked child: async-signal-safe calls only
        [[noreturn]] void fail_child(int fd, int stage) {
            LaunchFailure failure{stage, errno};
            ssize_t written = write(fd, &failure, sizeof(failure));
            (void)written;
            _exit(127);
        }

        void close_pipe(int fds[2]) {
            if (fds[0] >= 0) close(fds[0]);
            if (fds[1] >= 0) close(fds[1]);
            fds[0] = fds[1] = -1;
        }

        ssize_t read_full(int fd, void* buffer, size_t size) {
            size_t total = 0;
            auto* bytes = static_cast<char*>(buffer);
            while (total < size) {
                ssize_t n = read(fd, bytes + total, size - total);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return -1;
                }
                if (n == 0) {
                    break;
                }
                total += static_cast<size_t>(n);
            }
            return static_cast<ssize_t>(total);
        }

        bool is_executable_file(const std::filesystem::path& path) {
            struct stat st{};
            if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
                return false;
            }
            return access(path.c_str(), X_OK) == 0;
        }

    } // namespace

    TargetProcess::TargetProcess(pid_t pid)
        : pid_(pid) {}

    std::filesystem::path TargetProcess::resolve_executable(const std::string& name,
                                                            const std::filesystem::path& workdir) {
        if (name.empty()) {
            throw SupervisorError(ErrorKind::LAUNCH_FAILED, "Target command is empty");
        }

        if (name.find('/') != std::string::npos) {
            std::filesystem::path path(name);
            if (path.is_relative()) {
                path = workdir / path;
            }
            if (!std::filesystem::exists(path)) {
                throw SupervisorError(ErrorKind::LAUNCH_FAILED,
                    "Executable not found: " + path.string());
            }
            if (!is_executable_file(path)) {
                throw SupervisorError(ErrorKind::LAUNCH_FAILED,
                    "Permission denied: " + path.string() + " is not an executable file");
            }
            return path;
        }

        const char* env_path = std::getenv("PATH");
        std::string search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";

        size_t start = 0;
        while (start <= search.length()) {
            size_t end = search.find(':', start);
            if (end == std::string::npos) {
                end = search.length();
            }
            std::string dir = search.substr(start, end - start);
            std::filesystem::path candidate = (dir.empty() ? workdir : std::filesystem::path(dir)) / name;
            if (is_executable_file(candidate)) {
                return candidate;
            }
            start = end + 1;
        }

        throw SupervisorError(ErrorKind::LAUNCH_FAILED,
            "Executable not found in PATH: " + name);
    }

    TargetProcess TargetProcess::launch(const std::vector<std::string>& argv,
                                        const std::filesystem::path& workdir,
                                        int log_fd) {
        if (argv.empty()) {
            throw SupervisorError(ErrorKind::LAUNCH_FAILED, "Target command is empty");
        }

        // Everything the children touch is prepared before fork()
        std::filesystem::path exe = resolve_executable(argv[0], workdir);
        std::string exe_str = exe.string();
        std::string workdir_str = workdir.string();

        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 0 || max_fd > 65536) {
            max_fd = 65536;
        }

        std::vector<char*> c_argv;
        c_argv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        c_argv.push_back(nullptr);

        int pid_pipe[2] = {-1, -1};
        int exec_pipe[2] = {-1, -1};
        if (pipe2(pid_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
            std::string error = std::strerror(errno);
            close_pipe(pid_pipe);
            close_pipe(exec_pipe);
            throw SupervisorError(ErrorKind::LAUNCH_FAILED, "Failed to create pipe: " + error);
        }

        pid_t child = fork();

        if (child < 0) {
            std::string error = std::strerror(errno);
            close_pipe(pid_pipe);
            close_pipe(exec_pipe);
            throw SupervisorError(ErrorKind::LAUNCH_FAILED, "Failed to fork: " + error);
        }

        if (child == 0) {
            // Intermediate child: new session, then fork the workload
            close(pid_pipe[0]);
            close(exec_pipe[0]);

            if (setsid() < 0) {
                fail_child(exec_pipe[1], STAGE_SETSID);
            }

            pid_t workload = fork();
            if (workload < 0) {
                fail_child(exec_pipe[1], STAGE_FORK);
            }

            if (workload > 0) {
                ssize_t written = write(pid_pipe[1], &workload, sizeof(workload));
                _exit(written == static_cast<ssize_t>(sizeof(workload)) ? 0 : 1);
            }

            // Workload child
            close(pid_pipe[1]);

            struct sigaction default_action{};
            default_action.sa_handler = SIG_DFL;
            sigemptyset(&default_action.sa_mask);
            const int reset_signals[] = {SIGPIPE, SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGCHLD};
            for (int sig : reset_signals) {
                sigaction(sig, &default_action, nullptr);
            }
            sigset_t empty_mask;
            sigemptyset(&empty_mask);
            sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

            int dev_null = open("/dev/null", O_RDONLY);
            if (dev_null < 0 ||
                dup2(dev_null, STDIN_FILENO) < 0 ||
                dup2(log_fd, STDOUT_FILENO) < 0 ||
                dup2(log_fd, STDERR_FILENO) < 0) {
                fail_child(exec_pipe[1], STAGE_STDIO);
            }
            if (dev_null > STDERR_FILENO) {
                close(dev_null);
            }

            if (chdir(workdir_str.c_str()) < 0) {
                fail_child(exec_pipe[1], STAGE_CHDIR);
            }

            // Descriptors opened without O_CLOEXEC (audit log streams) stay behind
            for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
                if (fd != exec_pipe[1]) {
                    close(fd);
                }
            }

            execv(exe_str.c_str(), c_argv.data());

            fail_child(exec_pipe[1], STAGE_EXEC);
        }

        // Parent
        close(pid_pipe[1]);
        close(exec_pipe[1]);

        int status = 0;
        while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }

        pid_t workload = -1;
        ssize_t pid_bytes = read_full(pid_pipe[0], &workload, sizeof(workload));
        close(pid_pipe[0]);

        // Blocks until the workload execs (EOF) or reports a failure
        LaunchFailure failure{0, 0};
        ssize_t failure_bytes = read_full(exec_pipe[0], &failure, sizeof(failure));
        close(exec_pipe[0]);

        if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
            throw SupervisorError(ErrorKind::LAUNCH_FAILED,
                std::string("Failed to launch ") + exe_str + " (" +
                stage_to_string(failure.stage) + "): " + std::strerror(failure.error));
        }

        if (pid_bytes != static_cast<ssize_t>(sizeof(workload)) || workload <= 0) {
            throw SupervisorError(ErrorKind::LAUNCH_FAILED,
                "Failed to launch " + exe_str + ": intermediate process did not report a PID");
        }

        return TargetProcess(workload);
    }

    bool TargetProcess::is_alive() const {
        return ProcessTable::is_alive(pid_);
    }

    bool TargetProcess::send_signal(int sig) const {
        if (pid_ <= 0) {
            return false;
        }

        if (kill(pid_, sig) == 0) {
            return true;
        }

        if (errno == ESRCH) {
            return false;
        }

        throw SupervisorError(ErrorKind::SIGNAL_FAILED,
            "Failed to signal PID " + std::to_string(pid_) + ": " + std::strerror(errno),
            pid_);
    }

    ShutdownMethod TargetProcess::terminate(int sig, std::chrono::milliseconds timeout) const {
        if (!send_signal(sig)) {
            return ShutdownMethod::ALREADY_STOPPED;
        }

        if (timeout.count() <= 0) {
            return ShutdownMethod::SIGNAL_SENT;
        }

        if (wait_for_exit(timeout)) {
            return ShutdownMethod::GRACEFUL;
        }

        if (!send_signal(SIGKILL)) {
            // Exited between the last poll and SIGKILL
            return ShutdownMethod::GRACEFUL;
        }

        if (!wait_for_exit(std::chrono::seconds(2))) {
            throw SupervisorError(ErrorKind::SIGNAL_FAILED,
                "PID " + std::to_string(pid_) + " still alive after SIGKILL", pid_);
        }

        return ShutdownMethod::FORCE_KILLED;
    }

    bool TargetProcess::wait_for_exit(std::chrono::milliseconds timeout) const {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (is_alive()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return true;
    }

} // namespace runctl
