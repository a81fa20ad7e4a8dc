//
// Created by opencode on 03/03/2026.
//

#include "runctl/pid_record.hpp"
#include "runctl/errors.hpp"
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <climits>
#include <unistd.h>

namespace runctl {

    PidRecord::PidRecord(std::filesystem::path path)
        : path_(std::move(path)) {}

    bool PidRecord::exists() const {
        std::error_code ec;
        return std::filesystem::exists(path_, ec);
    }

    RecordContents PidRecord::read() const {
        RecordContents contents;

        std::error_code ec;
        auto file_status = std::filesystem::status(path_, ec);
        if (file_status.type() == std::filesystem::file_type::not_found) {
            return contents;
        }
        if (ec) {
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to read PID file " + path_.string() + ": " + ec.message());
        }
        if (!std::filesystem::is_regular_file(file_status)) {
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to read PID file " + path_.string() + ": not a regular file");
        }

        std::ifstream file(path_);
        if (!file.is_open()) {
            int saved_errno = errno;
            if (!exists()) {
                return contents;
            }
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to read PID file " + path_.string() + ": " +
                std::strerror(saved_errno));
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to read PID file " + path_.string());
        }

        contents.raw = buffer.str();
        contents.status = RecordStatus::CORRUPT;

        // First line: PID. Optional second line: start time of that process.
        size_t newline = contents.raw.find('\n');
        pid_t pid = parse(contents.raw.substr(0, newline));
        if (pid <= 0) {
            return contents;
        }

        if (newline != std::string::npos) {
            std::string rest = contents.raw.substr(newline + 1);
            size_t begin = rest.find_first_not_of(" \t\r\n");
            if (begin != std::string::npos) {
                size_t end = rest.find_last_not_of(" \t\r\n");
                std::string digits = rest.substr(begin, end - begin + 1);
                if (digits.length() > 19 ||
                    digits.find_first_not_of("0123456789") != std::string::npos) {
                    return contents;
                }
                contents.start_time = std::stoull(digits);
            }
        }

        contents.pid = pid;
        contents.status = RecordStatus::VALID;
        return contents;
    }

    void PidRecord::write(pid_t pid, std::optional<unsigned long long> start_time) const {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Failed to create PID directory: " + ec.message());
            }
        }

        std::filesystem::path tmp_path = path_;
        tmp_path += ".tmp." + std::to_string(getpid());

        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out) {
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Failed to write PID file " + tmp_path.string() + ": " +
                    std::strerror(errno));
            }
            out << pid << "\n";
            if (start_time) {
                out << *start_time << "\n";
            }
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(tmp_path, ec);
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Failed to write PID file " + tmp_path.string());
            }
        }

        std::filesystem::rename(tmp_path, path_, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to install PID file " + path_.string() + ": " + ec.message());
        }
    }

    bool PidRecord::remove() const {
        std::error_code ec;
        bool removed = std::filesystem::remove(path_, ec);
        if (ec) {
            throw SupervisorError(ErrorKind::IO_ERROR,
                "Failed to remove PID file " + path_.string() + ": " + ec.message());
        }
        return removed;
    }

    pid_t PidRecord::parse(const std::string& text) {
        size_t begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return -1;
        }
        size_t end = text.find_last_not_of(" \t\r\n");
        std::string digits = text.substr(begin, end - begin + 1);

        if (digits.empty() || digits.length() > 10) {
            return -1;
        }

        long long value = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') {
                return -1;
            }
            value = value * 10 + (c - '0');
        }

        if (value <= 0 || value > INT_MAX) {
            return -1;
        }
        return static_cast<pid_t>(value);
    }

} // namespace runctl
