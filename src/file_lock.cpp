//
// Created by opencode on 03/03/2026.
//

#include "runctl/file_lock.hpp"
#include "runctl/errors.hpp"
#include <thread>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

namespace runctl {

    FileLock::FileLock(std::filesystem::path path, std::chrono::milliseconds timeout)
        : path_(std::move(path)) {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Failed to create lock directory: " + ec.message());
            }
        }

        int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to open lock file " + path_.string() + ": " + std::strerror(errno));
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
                fd_ = fd;
                return;
            }

            int saved_errno = errno;
            if (saved_errno == EINTR) {
                continue;
            }
            if (saved_errno != EWOULDBLOCK) {
                close(fd);
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Failed to lock " + path_.string() + ": " + std::strerror(saved_errno));
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                close(fd);
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Timed out waiting for lock " + path_.string() +
                    " (another runctl invocation is in progress)");
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    FileLock::~FileLock() {
        release();
    }

    void FileLock::release() {
        if (fd_ < 0) {
            return;
        }
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }

} // namespace runctl
