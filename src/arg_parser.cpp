//
// Created by opencode on 22/02/2026.
//

#include "runctl/arg_parser.hpp"
#include <exception>

#ifndef RUNCTL_VERSION
#define RUNCTL_VERSION "0.0.0"
#endif

namespace runctl {

    namespace {

        // Flags that map one-to-one onto a config key and take a value
        const std::map<std::string, std::string>& value_flags() {
            static const std::map<std::string, std::string> flags = {
                {"--pidfile", "pidfile"},
                {"--logfile", "logfile"},
                {"--target", "target"},
                {"--match", "match"},
                {"--workdir", "workdir"},
                {"--audit-log", "audit_log"},
                {"--timeout", "stop_timeout"},
                {"--signal", "stop_signal"},
                {"--lock-timeout", "lock_timeout"},
                {"--probe-tcp", "probe_tcp"},
                {"--probe-http", "probe_http"},
                {"--wait", "wait_seconds"}
            };
            return flags;
        }

    } // namespace

    ParsedArgs ArgParser::parse(int argc, char* argv[]) {
        ParsedArgs args;
        bool lines_given = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--") {
                for (int j = i + 1; j < argc; ++j) {
                    args.target_argv.push_back(argv[j]);
                }
                if (args.target_argv.empty()) {
                    args.errors.push_back("No target command after --");
                }
                break;
            }

            // Split "--opt=value"
            std::string inline_value;
            bool has_inline_value = false;
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    inline_value = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                    has_inline_value = true;
                }
            }

            auto take_value = [&](std::string& out) {
                if (has_inline_value) {
                    out = inline_value;
                    return true;
                }
                if (i + 1 < argc) {
                    out = argv[++i];
                    return true;
                }
                args.errors.push_back("Missing value for " + arg);
                return false;
            };

            auto flag = value_flags().find(arg);
            if (flag != value_flags().end()) {
                std::string value;
                if (take_value(value)) {
                    args.options[flag->second] = value;
                }
            } else if (arg == "--config" || arg == "-c") {
                take_value(args.config_file);
            } else if (arg == "--truncate-log") {
                args.options["truncate_log"] = has_inline_value ? inline_value : "true";
            } else if (arg == "--lines" || arg == "-n") {
                std::string value;
                if (take_value(value)) {
                    try {
                        args.lines = static_cast<size_t>(std::stoul(value));
                        lines_given = true;
                    } catch (const std::exception&) {
                        args.errors.push_back("Invalid line count: " + value);
                    }
                }
            } else if (arg == "--json") {
                args.json = true;
            } else if (arg == "--help" || arg == "-h") {
                args.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                args.show_version = true;
            } else if (!arg.empty() && arg[0] == '-') {
                args.errors.push_back("Unknown option: " + arg);
            } else if (args.command == Command::NONE) {
                args.command = command_from_string(arg);
                if (args.command == Command::NONE) {
                    args.errors.push_back("Unknown command: " + arg);
                }
            } else if (args.command == Command::LOGS && !lines_given) {
                // logs [n]
                try {
                    args.lines = static_cast<size_t>(std::stoul(arg));
                    lines_given = true;
                } catch (const std::exception&) {
                    args.errors.push_back("Invalid line count: " + arg);
                }
            } else {
                args.errors.push_back("Unexpected argument: " + arg);
            }
        }

        return args;
    }

    std::string ArgParser::get_help_message() {
        return R"(runctl - single-instance process supervisor

Usage: runctl [OPTIONS] <command> [-- TARGET ARGS...]

Commands:
  start                Launch the target unless it is already running
  stop                 Signal the target and remove its PID file
  restart              Stop the target if recorded, then start it
  status               Print Running(<pid>) or NotRunning
  logs [n]             Show last n lines of the target log (default: 50)
  config               Show the effective configuration

Options:
  -c, --config <file>      JSON config file (env RUNCTL_CONFIG)
      --pidfile <path>     PID file (default: app.pid)
      --logfile <path>     Target output log (default: app.log)
      --target "<cmd>"     Target command (default: "python3 app.py")
      --match <pattern>    Command-line pattern for the process scan
      --workdir <dir>      Working directory of the target (default: .)
      --audit-log <path>   Audit log (default: ~/.runctl/audit.log, "" disables)
      --timeout <sec>      Wait before SIGKILL on stop, 0 = don't wait (default: 5)
      --signal <name>      Stop signal (default: TERM)
      --lock-timeout <sec> Wait for a concurrent runctl (default: 10)
      --truncate-log       Empty the log on each start (default: append, so
                           earlier sessions are kept)
      --probe-tcp <h:p>    TCP readiness probe, e.g. 127.0.0.1:5000
      --probe-http <url>   HTTP readiness probe
      --wait <sec>         Wait for readiness after start (default: 0)
  -n, --lines <n>          Lines for logs
      --json               Print JSON responses
  -h, --help               Show this help message
  -v, --version            Show version information

Every setting can also come from the environment as RUNCTL_<KEY>
(e.g. RUNCTL_PIDFILE) or from the config file. Flags win over the
environment, which wins over the config file.

Exit codes:
  0  success (stop: signalled or already stopped)
  1  already running, not running, launch/signal/probe failure, IO error
  2  usage or configuration error

Examples:
  runctl start                               # python3 app.py > app.log
  runctl status
  runctl stop --timeout 10
  runctl --pidfile /run/bot.pid start -- python3 telegram_bot.py
  runctl --probe-http http://127.0.0.1:5000/signals --wait 10 start
)";
    }

    std::string ArgParser::get_version_string() {
        return std::string("runctl version ") + RUNCTL_VERSION;
    }

    std::string ArgParser::command_to_string(Command command) {
        switch (command) {
            case Command::START:   return "start";
            case Command::STOP:    return "stop";
            case Command::RESTART: return "restart";
            case Command::STATUS:  return "status";
            case Command::LOGS:    return "logs";
            case Command::CONFIG:  return "config";
            case Command::NONE:
            default:               return "none";
        }
    }

    Command ArgParser::command_from_string(const std::string& name) {
        if (name == "start")   return Command::START;
        if (name == "stop")    return Command::STOP;
        if (name == "restart") return Command::RESTART;
        if (name == "status")  return Command::STATUS;
        if (name == "logs")    return Command::LOGS;
        if (name == "config")  return Command::CONFIG;
        return Command::NONE;
    }

} // namespace runctl
