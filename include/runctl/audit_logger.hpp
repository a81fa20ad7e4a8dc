/**
 * @file audit_logger.hpp
 * @brief Audit logging system for runctl
 *
 * Tracks every command, PID Record change and signal runctl performs.
 * Logs are appended to ~/.runctl/audit.log unless configured otherwise;
 * many runctl invocations share one audit log over time.
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace runctl {

    /**
     * @brief Categories of audit log entries
     */
    enum class AuditCategory {
        CMD,        // Command received
        STATE,      // Target state observed or changed
        ACTION,     // Action performed
        WARN,       // Recoverable anomaly (stale record, unmanaged instance)
        ERROR,      // Error occurred
        SUCCESS,    // Successful operation
        INFO        // General information
    };

    /**
     * @brief Thread-safe audit logger for runctl
     *
     * Records all significant events including:
     * - Commands received (with effective target)
     * - Launches, signals and PID Record changes
     * - Stale record repairs and unmanaged instances
     * - Errors
     *
     * An empty path disables the logger: every call becomes a no-op.
     */
    class AuditLogger {
    public:
        /**
         * @brief Constructs audit logger
         *
         * Creates the parent directory and opens the log in append mode.
         * Failure to open is reported once on stderr; logging then does
         * nothing rather than failing the command.
         *
         * @param log_path Path to the audit log, or empty to disable
         */
        explicit AuditLogger(std::filesystem::path log_path);

        /**
         * @brief Destructor - closes log file
         */
        ~AuditLogger();

        AuditLogger(const AuditLogger&) = delete;
        AuditLogger& operator=(const AuditLogger&) = delete;

        /**
         * @brief Log a command received
         *
         * @param command The command name (start, stop, ...)
         * @param source Source of command (e.g. "cli pid 4242")
         */
        void log_command(const std::string& command, const std::string& source);

        /**
         * @brief Log an observed or changed target state
         *
         * @param from_state Previous state name
         * @param to_state New state name
         */
        void log_state_transition(const std::string& from_state, const std::string& to_state);

        void log_action(const std::string& action, const std::string& details = "");

        void log_warning(const std::string& warning, const std::string& context = "");

        void log_error(const std::string& error, const std::string& context = "");

        void log_success(const std::string& operation, const std::string& details = "");

        void log_info(const std::string& message);

        [[nodiscard]] std::filesystem::path get_log_path() const { return audit_log_path_; }

        [[nodiscard]] bool is_enabled() const { return !audit_log_path_.empty(); }

        /**
         * @brief Get last N lines of the audit log
         *
         * @param n Number of lines to retrieve
         * @return std::string The last N lines
         */
        [[nodiscard]] std::string get_last_lines(size_t n = 50) const;

    private:
        std::filesystem::path audit_log_path_;
        std::ofstream log_file_;
        mutable std::mutex mutex_;

        /**
         * @brief Get current timestamp string
         *
         * @return std::string Formatted timestamp YYYY-MM-DD HH:MM:SS
         */
        [[nodiscard]] static std::string get_timestamp();

        /**
         * @brief Get category string representation
         *
         * @param category Audit category
         * @return std::string String representation (e.g., "[CMD]")
         */
        [[nodiscard]] static std::string category_to_string(AuditCategory category);

        void write_log(AuditCategory category, const std::string& message);

        void ensure_open();
    };

} // namespace runctl
