#pragma once

#include "runctl/config_manager.hpp"
#include "runctl/process_table.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace runctl::test {

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "runctl_test_XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Supervisor settings rooted in `dir`, audit log disabled, short timeouts.
inline SupervisorConfig
make_config(const std::filesystem::path &dir,
            std::vector<std::string> target = {"/bin/sleep", "4321"}) {
  SupervisorConfig config;
  config.target = std::move(target);
  config.workdir = dir;
  config.pidfile = dir / "app.pid";
  config.logfile = dir / "app.log";
  config.audit_log.clear();
  config.stop_timeout = std::chrono::seconds(2);
  config.lock_timeout = std::chrono::seconds(5);
  return config;
}

inline std::string read_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  return std::string(std::istreambuf_iterator<char>(file),
                     std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path &path,
                       const std::string &content) {
  std::ofstream file(path, std::ios::trunc);
  file << content;
}

// Direct child running argv; reap it with kill_child().
inline pid_t spawn_child(const std::vector<std::string> &argv) {
  std::vector<char *> c_argv;
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == 0) {
    execv(c_argv[0], c_argv.data());
    _exit(127);
  }
  return pid;
}

inline void kill_child(pid_t pid) {
  if (pid <= 0) {
    return;
  }
  kill(pid, SIGKILL);
  waitpid(pid, nullptr, 0);
}

// For processes runctl launched: they are not our children.
inline void kill_detached(pid_t pid) {
  if (pid <= 0) {
    return;
  }
  kill(pid, SIGKILL);
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (ProcessTable::is_alive(pid) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

// A PID that belonged to a process which has exited and been reaped.
inline pid_t dead_pid() {
  pid_t pid = fork();
  if (pid == 0) {
    _exit(0);
  }
  waitpid(pid, nullptr, 0);
  return pid;
}

inline bool wait_until(const std::function<bool()> &condition,
                       std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return condition();
}

// Loopback listener on an ephemeral port; connections queue in the backlog.
class Listener {
public:
  Listener() {
    fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
      throw std::runtime_error("socket failed");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        listen(fd_, 16) != 0 ||
        getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
      close(fd_);
      throw std::runtime_error("listen failed");
    }
    port_ = ntohs(addr.sin_port);
  }

  ~Listener() { close(fd_); }

  Listener(const Listener &) = delete;
  Listener &operator=(const Listener &) = delete;

  [[nodiscard]] int port() const { return port_; }
  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_ = -1;
  int port_ = 0;
};

// An ephemeral port with nothing listening on it.
inline int closed_port() {
  int port = 0;
  {
    Listener listener;
    port = listener.port();
  }
  return port;
}

} // namespace runctl::test
