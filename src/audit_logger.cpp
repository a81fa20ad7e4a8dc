//
// Created by opencode on 22/02/2026.
//

#include "runctl/audit_logger.hpp"
#include <iostream>
#include <deque>
#include <unistd.h>

namespace runctl {

    AuditLogger::AuditLogger(std::filesystem::path log_path)
        : audit_log_path_(std::move(log_path)) {
        if (audit_log_path_.empty()) {
            return;
        }

        std::error_code ec;
        if (audit_log_path_.has_parent_path()) {
            std::filesystem::create_directories(audit_log_path_.parent_path(), ec);
        }

        log_file_.open(audit_log_path_, std::ios::app);

        if (!log_file_.is_open()) {
            std::cerr << "[runctl] Failed to open audit log: " << audit_log_path_ << std::endl;
            audit_log_path_.clear();
        }
    }

    AuditLogger::~AuditLogger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    void AuditLogger::log_command(const std::string& command, const std::string& source) {
        std::string message = "Command received: " + command;
        if (!source.empty()) {
            message += " from " + source;
        }
        write_log(AuditCategory::CMD, message);
    }

    void AuditLogger::log_state_transition(const std::string& from_state, const std::string& to_state) {
        write_log(AuditCategory::STATE, from_state + " -> " + to_state);
    }

    void AuditLogger::log_action(const std::string& action, const std::string& details) {
        std::string message = action;
        if (!details.empty()) {
            message += ": " + details;
        }
        write_log(AuditCategory::ACTION, message);
    }

    void AuditLogger::log_warning(const std::string& warning, const std::string& context) {
        std::string message = warning;
        if (!context.empty()) {
            message = "[" + context + "] " + warning;
        }
        write_log(AuditCategory::WARN, message);
    }

    void AuditLogger::log_error(const std::string& error, const std::string& context) {
        std::string message = error;
        if (!context.empty()) {
            message = "[" + context + "] " + error;
        }
        write_log(AuditCategory::ERROR, message);
    }

    void AuditLogger::log_success(const std::string& operation, const std::string& details) {
        std::string message = operation;
        if (!details.empty()) {
            message += ": " + details;
        }
        write_log(AuditCategory::SUCCESS, message);
    }

    void AuditLogger::log_info(const std::string& message) {
        write_log(AuditCategory::INFO, message);
    }

    std::string AuditLogger::get_last_lines(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);

        if (audit_log_path_.empty() || !std::filesystem::exists(audit_log_path_)) {
            return "";
        }

        std::ifstream file(audit_log_path_);
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

    std::string AuditLogger::get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);

        std::tm local_time{};
        localtime_r(&time, &local_time);

        std::stringstream ss;
        ss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string AuditLogger::category_to_string(AuditCategory category) {
        switch (category) {
            case AuditCategory::CMD:     return "[CMD]";
            case AuditCategory::STATE:   return "[STATE]";
            case AuditCategory::ACTION:  return "[ACTION]";
            case AuditCategory::WARN:    return "[WARN]";
            case AuditCategory::ERROR:   return "[ERROR]";
            case AuditCategory::SUCCESS: return "[SUCCESS]";
            case AuditCategory::INFO:    return "[INFO]";
            default:                     return "[UNKNOWN]";
        }
    }

    void AuditLogger::write_log(AuditCategory category, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (audit_log_path_.empty()) {
            return;
        }

        ensure_open();

        if (log_file_.is_open()) {
            // pid distinguishes concurrent runctl invocations sharing the log
            log_file_ << "[" << get_timestamp() << "] "
                      << "[" << getpid() << "] "
                      << category_to_string(category) << " "
                      << message << std::endl;
        }
    }

    void AuditLogger::ensure_open() {
        if (!log_file_.is_open()) {
            log_file_.open(audit_log_path_, std::ios::app);
        }
    }

} // namespace runctl
