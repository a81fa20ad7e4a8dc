//
// Created by opencode on 04/03/2026.
//

#include "runctl/log_manager.hpp"
#include "runctl/errors.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <cerrno>
#include <cstring>

namespace runctl {

    namespace {
        const char* const RULE =
            "================================================================================\n";
    }

    LogManager::LogManager(std::filesystem::path log_path, bool truncate)
        : log_path_(std::move(log_path))
        , truncate_(truncate) {}

    LogManager::~LogManager() {
        close();
    }

    void LogManager::open_session(const std::string& command,
                                  const std::filesystem::path& workdir) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (log_file_) {
            fclose(log_file_);
            log_file_ = nullptr;
        }

        std::error_code ec;
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path(), ec);
            if (ec) {
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Failed to create log directory: " + ec.message());
            }
        }

        // Always append once open: the target and runctl both write to it
        if (truncate_) {
            FILE* emptied = fopen(log_path_.c_str(), "we");
            if (emptied) {
                fclose(emptied);
            }
        }

        // "e" sets O_CLOEXEC
        log_file_ = fopen(log_path_.c_str(), "ae");
        if (!log_file_) {
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to open log file " + log_path_.string() + ": " + std::strerror(errno));
        }

        // Enable line buffering for real-time writes
        setvbuf(log_file_, nullptr, _IOLBF, BUFSIZ);

        auto [time_str, timestamp] = now_strings();

        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "runctl session\n");
        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "Start Time: %s\n", time_str.c_str());
        fprintf(log_file_, "Unix Timestamp: %ld\n", timestamp);
        fprintf(log_file_, "Command: %s\n", command.c_str());
        fprintf(log_file_, "Working Directory: %s\n", workdir.c_str());
        fprintf(log_file_, "\nProcess Output:\n");
        fprintf(log_file_, "%s", RULE);

        if (fflush(log_file_) != 0) {
            int saved_errno = errno;
            fclose(log_file_);
            log_file_ = nullptr;
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to write log file " + log_path_.string() + ": " + std::strerror(saved_errno));
        }
    }

    int LogManager::get_log_fd() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!log_file_) {
            throw SupervisorError(ErrorKind::IO_ERROR, "No log file is currently open");
        }
        // Nothing buffered may be duplicated into the child
        fflush(log_file_);
        return fileno(log_file_);
    }

    void LogManager::note_started(pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!log_file_) {
            return;
        }
        fprintf(log_file_, "[runctl] Started PID %d\n", static_cast<int>(pid));
        fflush(log_file_);
    }

    void LogManager::finalize(const std::string& shutdown_method) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!log_file_) {
            if (!std::filesystem::exists(log_path_)) {
                return;
            }
            log_file_ = fopen(log_path_.c_str(), "ae");
            if (!log_file_) {
                std::cerr << "Warning: could not append to log " << log_path_
                          << ": " << std::strerror(errno) << std::endl;
                return;
            }
        }

        auto [time_str, timestamp] = now_strings();

        fprintf(log_file_, "\n%s", RULE);
        fprintf(log_file_, "runctl teardown\n");
        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "Stop Time: %s\n", time_str.c_str());
        fprintf(log_file_, "Unix Timestamp: %ld\n", timestamp);
        fprintf(log_file_, "Shutdown Method: %s\n", shutdown_method.c_str());
        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "End of session\n");
        fprintf(log_file_, "%s", RULE);

        fclose(log_file_);
        log_file_ = nullptr;
    }

    void LogManager::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_) {
            fclose(log_file_);
            log_file_ = nullptr;
        }
    }

    std::string LogManager::get_last_lines(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream file(log_path_);
        if (!file.is_open()) {
            return "";
        }

        std::deque<std::string> lines;
        std::string line;

        while (std::getline(file, line)) {
            lines.push_back(line);
            if (lines.size() > n) {
                lines.pop_front();
            }
        }

        std::string result;
        for (const auto& l : lines) {
            result += l + "\n";
        }

        return result;
    }

    std::pair<std::string, long> LogManager::now_strings() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        long timestamp = static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count());

        std::tm local_time{};
        localtime_r(&time_t_now, &local_time);
        std::ostringstream time_stream;
        time_stream << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");

        return {time_stream.str(), timestamp};
    }

} // namespace runctl
