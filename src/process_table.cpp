//
// Created by opencode on 04/03/2026.
//

#include "runctl/process_table.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <signal.h>
#include <unistd.h>

namespace runctl {

    namespace {

        /**
         * @brief Reads the fields of /proc/<pid>/stat that follow the comm field
         *
         * The comm field is parenthesised and may itself contain spaces or
         * parentheses, so the fields start after the last ')'. Element 0 is
         * the state (field 3 in proc(5) numbering).
         */
        std::vector<std::string> read_stat_fields(pid_t pid) {
            std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
            if (!stat_file.is_open()) {
                return {};
            }

            std::string line;
            std::getline(stat_file, line);

            size_t close_paren = line.rfind(')');
            if (close_paren == std::string::npos) {
                return {};
            }

            std::istringstream rest(line.substr(close_paren + 1));
            std::vector<std::string> fields;
            std::string field;
            while (rest >> field) {
                fields.push_back(field);
            }
            return fields;
        }

        char read_proc_state(pid_t pid) {
            auto fields = read_stat_fields(pid);
            if (fields.empty() || fields[0].empty()) {
                return '?';
            }
            return fields[0][0];
        }

    } // namespace

    bool ProcessTable::is_alive(pid_t pid) {
        if (pid <= 0) {
            return false;
        }

        if (kill(pid, 0) != 0 && errno != EPERM) {
            return false;
        }

        // Exited but not yet reaped by its parent
        return read_proc_state(pid) != 'Z';
    }

    std::optional<std::string> ProcessTable::read_cmdline(pid_t pid) {
        std::ifstream file("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
        if (!file.is_open()) {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        std::string cmdline = buffer.str();

        // Arguments are NUL separated, with a trailing NUL
        while (!cmdline.empty() && cmdline.back() == '\0') {
            cmdline.pop_back();
        }
        if (cmdline.empty()) {
            return std::nullopt;
        }

        std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
        return cmdline;
    }

    std::optional<unsigned long long> ProcessTable::read_start_time(pid_t pid) {
        if (pid <= 0) {
            return std::nullopt;
        }

        // starttime is field 22
        auto fields = read_stat_fields(pid);
        if (fields.size() < 20) {
            return std::nullopt;
        }

        const std::string& ticks = fields[19];
        if (ticks.empty() || ticks.length() > 19 ||
            ticks.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        return std::stoull(ticks);
    }

    std::vector<ProcessInfo> ProcessTable::find_matching(const std::string& pattern) {
        std::vector<ProcessInfo> found;
        if (pattern.empty()) {
            return found;
        }

        pid_t self = getpid();
        pid_t parent = getppid();

        std::error_code ec;
        std::filesystem::directory_iterator it("/proc", ec);
        if (ec) {
            return found;
        }

        for (const auto& entry : it) {
            std::string name = entry.path().filename().string();
            if (name.empty() || !std::all_of(name.begin(), name.end(),
                                               [](unsigned char c) { return std::isdigit(c) != 0; })) {
                continue;
            }

            pid_t pid = 0;
            try {
                pid = static_cast<pid_t>(std::stol(name));
            } catch (const std::exception&) {
                continue;
            }

            if (pid == self || pid == parent) {
                continue;
            }

            // Processes can exit between readdir and read
            auto cmdline = read_cmdline(pid);
            if (!cmdline || !matches(*cmdline, pattern)) {
                continue;
            }
            if (read_proc_state(pid) == 'Z') {
                continue;
            }

            found.push_back({pid, *cmdline});
        }

        std::sort(found.begin(), found.end(),
                  [](const ProcessInfo& a, const ProcessInfo& b) { return a.pid < b.pid; });
        return found;
    }

    bool ProcessTable::matches(const std::string& cmdline, const std::string& pattern) {
        if (pattern.empty()) {
            return false;
        }
        return cmdline.find(pattern) != std::string::npos;
    }

} // namespace runctl
