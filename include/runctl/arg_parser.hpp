/**
 * @file arg_parser.hpp
 * @brief Command-line argument parser for runctl
 *
 * Parses the subcommand and its options:
 *   runctl [OPTIONS] <start|stop|restart|status|logs|config> [-- TARGET...]
 */

#pragma once

#include <string>
#include <vector>
#include <map>

namespace runctl {

    /**
     * @brief Subcommands of runctl
     */
    enum class Command {
        NONE,      // No subcommand given
        START,     // Launch the target
        STOP,      // Signal the target
        RESTART,   // Stop (if recorded) then start
        STATUS,    // Report Running(pid) / NotRunning
        LOGS,      // Print the tail of the target log
        CONFIG     // Print the effective configuration
    };

    /**
     * @brief Parsed command-line arguments
     */
    struct ParsedArgs {
        Command command = Command::NONE;
        std::map<std::string, std::string> options;   // Config key → value from flags
        std::string config_file;                      // --config
        std::vector<std::string> target_argv;         // Everything after "--"
        size_t lines = 50;                            // logs [n]
        bool json = false;
        bool show_help = false;
        bool show_version = false;
        std::vector<std::string> errors;              // Usage errors, empty if none
    };

    /**
     * @brief Command-line argument parser
     *
     * Supports:
     *   -c, --config <file>    JSON config file
     *   --pidfile <path>       PID Record location
     *   --logfile <path>       Target log destination
     *   --target "<cmd>"       Target command line
     *   --match <pattern>      Process-table match pattern
     *   --workdir <dir>        Target working directory
     *   --audit-log <path>     Audit log ("" disables)
     *   --timeout <sec>        Stop timeout before SIGKILL (0 = don't wait)
     *   --signal <name>        Graceful stop signal
     *   --lock-timeout <sec>   Max wait for a concurrent runctl
     *   --truncate-log         Empty the log on start
     *   --probe-tcp <h:p>      TCP readiness probe
     *   --probe-http <url>     HTTP readiness probe
     *   --wait <sec>           Readiness wait after start
     *   -n, --lines <n>        Lines for `logs`
     *   --json                 Print JSON responses
     *   --help, -h             Show help
     *   --version, -v          Show version
     *
     * Options accept "--opt value" and "--opt=value".
     */
    class ArgParser {
    public:
        /**
         * @brief Parse command-line arguments
         *
         * Never throws; problems are collected in ParsedArgs::errors.
         *
         * @param argc Argument count
         * @param argv Argument values
         * @return ParsedArgs Parsed arguments structure
         */
        static ParsedArgs parse(int argc, char* argv[]);

        /**
         * @brief Get help message string
         */
        static std::string get_help_message();

        /**
         * @brief Get version string
         */
        static std::string get_version_string();

        /**
         * @brief Convert command to its CLI name
         *
         * @return std::string e.g. Command::START → "start"
         */
        static std::string command_to_string(Command command);

    private:
        static Command command_from_string(const std::string& name);
    };

} // namespace runctl
