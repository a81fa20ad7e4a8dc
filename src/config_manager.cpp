//
// Created by opencode on 06/03/2026.
//

#include "runctl/config_manager.hpp"
#include "runctl/errors.hpp"
#include "runctl/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace runctl {

    namespace {

        const std::map<std::string, int>& signal_names() {
            static const std::map<std::string, int> names = {
                {"HUP", SIGHUP},
                {"INT", SIGINT},
                {"QUIT", SIGQUIT},
                {"KILL", SIGKILL},
                {"USR1", SIGUSR1},
                {"USR2", SIGUSR2},
                {"ALRM", SIGALRM},
                {"TERM", SIGTERM}
            };
            return names;
        }

        std::string to_upper(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return value;
        }

        [[noreturn]] void invalid(const std::string& key, const std::string& expected,
                                  const nlohmann::json& value) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR,
                "Invalid value for '" + key + "': expected " + expected + ", got " +
                value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        }

        std::string as_string(const std::string& key, const nlohmann::json& value) {
            if (!value.is_string()) {
                invalid(key, "a string", value);
            }
            return value.get<std::string>();
        }

        std::chrono::milliseconds as_seconds(const std::string& key, const nlohmann::json& value) {
            double seconds = 0.0;
            if (value.is_number()) {
                seconds = value.get<double>();
            } else if (value.is_string()) {
                const std::string text = value.get<std::string>();
                try {
                    size_t consumed = 0;
                    seconds = std::stod(text, &consumed);
                    if (consumed != text.length()) {
                        invalid(key, "a number of seconds", value);
                    }
                } catch (const std::logic_error&) {
                    invalid(key, "a number of seconds", value);
                }
            } else {
                invalid(key, "a number of seconds", value);
            }

            if (!std::isfinite(seconds) || seconds < 0) {
                invalid(key, "a non-negative number of seconds", value);
            }
            return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
        }

        bool as_bool(const std::string& key, const nlohmann::json& value) {
            if (value.is_boolean()) {
                return value.get<bool>();
            }
            if (value.is_string()) {
                std::string text = to_upper(value.get<std::string>());
                if (text == "TRUE" || text == "1" || text == "YES" || text == "ON") {
                    return true;
                }
                if (text == "FALSE" || text == "0" || text == "NO" || text == "OFF") {
                    return false;
                }
            }
            invalid(key, "a boolean", value);
        }

        std::vector<std::string> as_command(const std::string& key, const nlohmann::json& value) {
            std::vector<std::string> argv;

            if (value.is_string()) {
                try {
                    argv = split_command_line(value.get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw SupervisorError(ErrorKind::CONFIG_ERROR,
                        "Invalid value for '" + key + "': " + e.what());
                }
            } else if (value.is_array()) {
                for (const auto& item : value) {
                    if (!item.is_string()) {
                        invalid(key, "an array of strings", value);
                    }
                    argv.push_back(item.get<std::string>());
                }
            } else {
                invalid(key, "a command string or an array of strings", value);
            }

            if (argv.empty() || argv[0].empty()) {
                invalid(key, "a non-empty command", value);
            }
            return argv;
        }

    } // namespace

    std::filesystem::path SupervisorConfig::lock_path() const {
        std::filesystem::path path = pidfile;
        path += ".lock";
        return path;
    }

    std::string SupervisorConfig::match_pattern() const {
        return match.empty() ? join_command_line(target) : match;
    }

    ConfigManager::ConfigManager(EnvLookup env, std::filesystem::path cwd)
        : env_(std::move(env))
        , cwd_(std::move(cwd)) {
        if (!env_) {
            env_ = [](const std::string& name) -> std::optional<std::string> {
                const char* value = std::getenv(name.c_str());
                if (!value) {
                    return std::nullopt;
                }
                return std::string(value);
            };
        }
        if (cwd_.empty()) {
            std::error_code ec;
            cwd_ = std::filesystem::current_path(ec);
            if (ec) {
                throw SupervisorError(ErrorKind::IO_ERROR,
                    "Cannot determine the current directory: " + ec.message());
            }
        }
    }

    const std::vector<std::string>& ConfigManager::known_keys() {
        static const std::vector<std::string> keys = {
            "target", "match", "workdir", "pidfile", "logfile", "audit_log",
            "truncate_log", "stop_timeout", "stop_signal", "lock_timeout",
            "probe_tcp", "probe_http", "wait_seconds"
        };
        return keys;
    }

    std::string ConfigManager::env_var_for(const std::string& key) {
        return "RUNCTL_" + to_upper(key);
    }

    SupervisorConfig ConfigManager::load(const std::string& config_file,
                                         const std::map<std::string, std::string>& flag_options,
                                         const std::vector<std::string>& target_argv) const {
        nlohmann::json raw = nlohmann::json::object();

        std::string file = config_file;
        if (file.empty()) {
            file = env_("RUNCTL_CONFIG").value_or("");
        }
        if (!file.empty()) {
            raw = read_config_file(resolve_path(file, cwd_));
        }

        for (const auto& key : known_keys()) {
            auto value = env_(env_var_for(key));
            if (value) {
                raw[key] = *value;
            }
        }

        for (const auto& [key, value] : flag_options) {
            if (std::find(known_keys().begin(), known_keys().end(), key) == known_keys().end()) {
                throw SupervisorError(ErrorKind::CONFIG_ERROR, "Unknown setting: " + key);
            }
            raw[key] = value;
        }

        if (!target_argv.empty()) {
            raw["target"] = target_argv;
        }

        return resolve(raw);
    }

    nlohmann::json ConfigManager::read_config_file(const std::filesystem::path& path) const {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR,
                "Failed to open config file: " + path.string());
        }

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR,
                "Failed to parse config file " + path.string() + ": " + e.what());
        }

        if (!parsed.is_object()) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR,
                "Config file " + path.string() + " must contain a JSON object");
        }

        for (const auto& item : parsed.items()) {
            if (std::find(known_keys().begin(), known_keys().end(), item.key()) == known_keys().end()) {
                throw SupervisorError(ErrorKind::CONFIG_ERROR,
                    "Unknown key '" + item.key() + "' in config file " + path.string());
            }
        }

        // Relative workdir in a config file is relative to the file itself
        if (parsed.contains("workdir") && parsed["workdir"].is_string()) {
            std::filesystem::path workdir = expand_tilde(parsed["workdir"].get<std::string>());
            if (workdir.is_relative()) {
                parsed["workdir"] = (path.parent_path() / workdir).lexically_normal().string();
            }
        }

        return parsed;
    }

    SupervisorConfig ConfigManager::resolve(const nlohmann::json& raw) const {
        SupervisorConfig config;

        config.workdir = cwd_;
        if (raw.contains("workdir")) {
            config.workdir = resolve_path(as_string("workdir", raw["workdir"]), cwd_);
        }

        if (raw.contains("target")) {
            config.target = as_command("target", raw["target"]);
        }
        if (raw.contains("match")) {
            config.match = as_string("match", raw["match"]);
        }

        std::string pidfile = raw.contains("pidfile") ? as_string("pidfile", raw["pidfile"]) : "app.pid";
        std::string logfile = raw.contains("logfile") ? as_string("logfile", raw["logfile"]) : "app.log";
        if (pidfile.empty()) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR, "pidfile must not be empty");
        }
        if (logfile.empty()) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR, "logfile must not be empty");
        }
        config.pidfile = resolve_path(pidfile, config.workdir);
        config.logfile = resolve_path(logfile, config.workdir);

        if (raw.contains("audit_log")) {
            std::string audit_log = as_string("audit_log", raw["audit_log"]);
            if (!audit_log.empty()) {
                config.audit_log = resolve_path(audit_log, config.workdir);
            }
        } else {
            config.audit_log = get_runctl_dir() / "audit.log";
        }

        if (raw.contains("truncate_log")) {
            config.truncate_log = as_bool("truncate_log", raw["truncate_log"]);
        }
        if (raw.contains("stop_timeout")) {
            config.stop_timeout = as_seconds("stop_timeout", raw["stop_timeout"]);
        }
        if (raw.contains("lock_timeout")) {
            config.lock_timeout = as_seconds("lock_timeout", raw["lock_timeout"]);
        }
        if (raw.contains("wait_seconds")) {
            config.wait = as_seconds("wait_seconds", raw["wait_seconds"]);
        }
        if (raw.contains("stop_signal")) {
            const auto& value = raw["stop_signal"];
            if (value.is_number_integer()) {
                config.stop_signal = parse_signal(std::to_string(value.get<int>()));
            } else {
                config.stop_signal = parse_signal(as_string("stop_signal", value));
            }
        }
        if (raw.contains("probe_tcp")) {
            config.probe_tcp = as_string("probe_tcp", raw["probe_tcp"]);
        }
        if (raw.contains("probe_http")) {
            config.probe_http = as_string("probe_http", raw["probe_http"]);
        }

        return config;
    }

    nlohmann::json ConfigManager::to_json(const SupervisorConfig& config) {
        auto seconds = [](std::chrono::milliseconds ms) {
            return static_cast<double>(ms.count()) / 1000.0;
        };

        return {
            {"target", config.target},
            {"match", config.match_pattern()},
            {"workdir", config.workdir.string()},
            {"pidfile", config.pidfile.string()},
            {"logfile", config.logfile.string()},
            {"audit_log", config.audit_log.string()},
            {"truncate_log", config.truncate_log},
            {"stop_timeout", seconds(config.stop_timeout)},
            {"stop_signal", signal_to_string(config.stop_signal)},
            {"lock_timeout", seconds(config.lock_timeout)},
            {"probe_tcp", config.probe_tcp},
            {"probe_http", config.probe_http},
            {"wait_seconds", seconds(config.wait)}
        };
    }

    int ConfigManager::parse_signal(const std::string& name) {
        if (!name.empty() && std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            int number = 0;
            try {
                number = std::stoi(name);
            } catch (const std::exception&) {
                number = 0;
            }
            if (number <= 0 || number >= NSIG) {
                throw SupervisorError(ErrorKind::CONFIG_ERROR, "Invalid signal number: " + name);
            }
            return number;
        }

        std::string upper = to_upper(name);
        if (upper.rfind("SIG", 0) == 0) {
            upper = upper.substr(3);
        }

        auto it = signal_names().find(upper);
        if (it == signal_names().end()) {
            throw SupervisorError(ErrorKind::CONFIG_ERROR, "Unknown signal: " + name);
        }
        return it->second;
    }

    std::string ConfigManager::signal_to_string(int sig) {
        for (const auto& [name, number] : signal_names()) {
            if (number == sig) {
                return name;
            }
        }
        return std::to_string(sig);
    }

} // namespace runctl
