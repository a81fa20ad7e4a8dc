/**
 * @file command_handler.hpp
 * @brief Executes runctl commands and renders their responses
 *
 * Every command produces the same response envelope:
 *   {"CMD": "start", "result": {...} | null, "error": null | "message"}
 *
 * Failed commands additionally carry "error_kind" (e.g. "AlreadyRunning")
 * and, where one is known, "pid". The envelope is printed verbatim with
 * --json, otherwise rendered as the human-readable text of format_text().
 *
 * Commands:
 * 1. start    - Launch the target
 * 2. stop     - Signal the target and remove its PID file
 * 3. restart  - Stop (if recorded) then start
 * 4. status   - Running(pid) / NotRunning plus diagnostics
 * 5. logs     - Tail of the target log
 * 6. config   - Effective configuration
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <sys/types.h>

#include "runctl/arg_parser.hpp"
#include "runctl/errors.hpp"

namespace runctl {

    class Supervisor;
    class AuditLogger;

    /**
     * @brief Maps CLI commands onto Supervisor calls
     */
    class CommandHandler {
    public:
        /**
         * @brief Constructs command handler with dependencies
         *
         * @param supervisor Supervisor for the configured target
         * @param audit Audit log receiving one CMD entry per command
         */
        CommandHandler(Supervisor& supervisor, AuditLogger& audit);

        /**
         * @brief Executes a command and returns the JSON response
         *
         * Never throws; failures become the "error" of the envelope.
         *
         * @param command Command to run
         * @param lines Number of lines for Command::LOGS
         * @return nlohmann::json Response envelope
         */
        nlohmann::json execute(Command command, size_t lines = 50);

        /**
         * @brief Builds a failure envelope
         *
         * @param cmd Command name echoed in "CMD"
         * @param kind Error classification
         * @param message Human-readable error
         * @param pid Related PID, omitted when negative
         */
        static nlohmann::json make_error(const std::string& cmd, ErrorKind kind,
                                         const std::string& message, pid_t pid = -1);

        /**
         * @brief Process exit code for a response
         *
         * @return int 0 on success, 2 for configuration errors, 1 otherwise
         */
        static int exit_code(const nlohmann::json& response);

        /**
         * @brief Renders a response as the text printed without --json
         */
        static std::string format_text(const nlohmann::json& response);

        /**
         * @brief Serializes JSON for printing
         *
         * Bytes that are not valid UTF-8 are replaced with U+FFFD instead
         * of failing the whole response.
         *
         * @param value JSON to serialize
         * @param indent Indentation as for nlohmann::json::dump, -1 for compact
         */
        static std::string to_json_text(const nlohmann::json& value, int indent = -1);

    private:
        Supervisor& supervisor_;
        AuditLogger& audit_;

        nlohmann::json handle_start();
        nlohmann::json handle_stop();
        nlohmann::json handle_restart();
        nlohmann::json handle_status();
        nlohmann::json handle_logs(size_t lines);
        nlohmann::json handle_config();
    };

} // namespace runctl
