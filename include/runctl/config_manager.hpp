/**
 * @file config_manager.hpp
 * @brief Layered configuration for the supervised target
 *
 * Settings are resolved from, lowest to highest precedence:
 * 1. Built-in defaults (python3 app.py, app.pid, app.log)
 * 2. A JSON config file (--config, or RUNCTL_CONFIG)
 * 3. Environment variables RUNCTL_<KEY>, e.g. RUNCTL_PIDFILE
 * 4. Command-line flags
 * 5. Target argv given after "--"
 *
 * Example config file:
 *   {
 *     "target": ["python3", "app.py"],
 *     "pidfile": "app.pid",
 *     "logfile": "app.log",
 *     "stop_timeout": 5,
 *     "probe_http": "http://127.0.0.1:5000/signals",
 *     "wait_seconds": 10
 *   }
 *
 * Relative pidfile, logfile and audit_log paths are resolved against
 * workdir, which itself defaults to the current directory.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <csignal>
#include <optional>
#include <functional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace runctl {

    /**
     * @brief Fully resolved supervisor settings
     */
    struct SupervisorConfig {
        std::vector<std::string> target{"python3", "app.py"};  ///< Target argv
        std::string match;                       ///< Process-table pattern; empty = joined target
        std::filesystem::path workdir;           ///< Target working directory
        std::filesystem::path pidfile;           ///< PID Record location
        std::filesystem::path logfile;           ///< Target stdout/stderr destination
        std::filesystem::path audit_log;         ///< Audit log; empty disables it
        bool truncate_log = false;               ///< Empty logfile on each start
        std::chrono::milliseconds stop_timeout{5000};   ///< Wait for exit before SIGKILL; 0 = don't wait
        int stop_signal = SIGTERM;               ///< Graceful termination signal
        std::chrono::milliseconds lock_timeout{10000};  ///< Max wait for the advisory lock
        std::string probe_tcp;                   ///< "host:port" readiness probe
        std::string probe_http;                  ///< URL readiness probe
        std::chrono::milliseconds wait{0};       ///< Readiness wait after start; 0 = skip

        /**
         * @brief Lock file path, derived from the PID Record path
         *
         * @return std::filesystem::path "<pidfile>.lock"
         */
        [[nodiscard]] std::filesystem::path lock_path() const;

        /**
         * @brief Pattern used for the process-table scan and identity check
         *
         * @return std::string match if set, else the joined target argv
         */
        [[nodiscard]] std::string match_pattern() const;
    };

    /**
     * @brief Lookup function for environment variables
     *
     * Returns nullopt when the variable is unset. Injectable for tests.
     */
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Resolves SupervisorConfig from file, environment and flags
     *
     * Usage:
     *   ConfigManager cm;
     *   SupervisorConfig cfg = cm.load(args.config_file, args.options, args.target_argv);
     */
    class ConfigManager {
    public:
        /**
         * @brief Constructs ConfigManager
         *
         * @param env Environment lookup (defaults to std::getenv)
         * @param cwd Directory relative paths are resolved against when no
         *        workdir is configured (defaults to the current directory)
         */
        explicit ConfigManager(EnvLookup env = nullptr, std::filesystem::path cwd = {});

        /**
         * @brief Resolves the effective configuration
         *
         * @param config_file JSON file from --config; empty falls back to RUNCTL_CONFIG
         * @param flag_options Settings given as flags, keyed by config key
         * @param target_argv Target argv given after "--"; empty if none
         * @return SupervisorConfig The resolved settings
         * @throws SupervisorError CONFIG_ERROR on unreadable or invalid input
         */
        SupervisorConfig load(const std::string& config_file,
                              const std::map<std::string, std::string>& flag_options,
                              const std::vector<std::string>& target_argv) const;

        /**
         * @brief Serializes a resolved configuration
         *
         * @return nlohmann::json Object using the config file key names
         */
        static nlohmann::json to_json(const SupervisorConfig& config);

        /**
         * @brief Lists the recognized config keys
         */
        static const std::vector<std::string>& known_keys();

        /**
         * @brief Environment variable name for a config key
         *
         * @return std::string e.g. "pidfile" → "RUNCTL_PIDFILE"
         */
        static std::string env_var_for(const std::string& key);

        /**
         * @brief Parses a signal name or number
         *
         * Accepts "TERM", "SIGTERM", "term" and "15" alike.
         *
         * @return int Signal number
         * @throws SupervisorError CONFIG_ERROR on unknown names
         */
        static int parse_signal(const std::string& name);

        /**
         * @brief Converts a signal number back to its short name
         *
         * @return std::string e.g. 15 → "TERM"; unknown numbers as digits
         */
        static std::string signal_to_string(int sig);

    private:
        /**
         * @brief Reads and parses the JSON config file
         *
         * @throws SupervisorError CONFIG_ERROR if unreadable, not JSON, not
         *         an object, or containing unknown keys
         */
        nlohmann::json read_config_file(const std::filesystem::path& path) const;

        /**
         * @brief Converts the merged raw settings into a SupervisorConfig
         */
        SupervisorConfig resolve(const nlohmann::json& raw) const;

        EnvLookup env_;
        std::filesystem::path cwd_;
    };

} // namespace runctl
