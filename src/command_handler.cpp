//
// Created by opencode on 12/03/2026.
//

#include "runctl/command_handler.hpp"
#include "runctl/audit_logger.hpp"
#include "runctl/config_manager.hpp"
#include "runctl/log_manager.hpp"
#include "runctl/supervisor.hpp"
#include <sstream>

namespace runctl {

    namespace {

        nlohmann::json processes_to_json(const std::vector<ProcessInfo>& processes) {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& info : processes) {
                list.push_back({{"pid", info.pid}, {"cmdline", info.cmdline}});
            }
            return list;
        }

    } // namespace

    CommandHandler::CommandHandler(Supervisor& supervisor, AuditLogger& audit)
        : supervisor_(supervisor)
        , audit_(audit) {}

    nlohmann::json CommandHandler::execute(Command command, size_t lines) {
        std::string cmd = ArgParser::command_to_string(command);
        audit_.log_command(cmd, "cli");

        try {
            switch (command) {
                case Command::START:   return handle_start();
                case Command::STOP:    return handle_stop();
                case Command::RESTART: return handle_restart();
                case Command::STATUS:  return handle_status();
                case Command::LOGS:    return handle_logs(lines);
                case Command::CONFIG:  return handle_config();
                case Command::NONE:
                default:
                    return make_error(cmd, ErrorKind::CONFIG_ERROR, "No command given");
            }
        } catch (const SupervisorError& e) {
            return make_error(cmd, e.kind(), e.what(), e.pid());
        } catch (const std::exception& e) {
            audit_.log_error(e.what(), cmd);
            return make_error(cmd, ErrorKind::IO_ERROR, e.what());
        }
    }

    nlohmann::json CommandHandler::make_error(const std::string& cmd, ErrorKind kind,
                                              const std::string& message, pid_t pid) {
        nlohmann::json response = {
            {"CMD", cmd},
            {"result", nullptr},
            {"error", message},
            {"error_kind", error_kind_to_string(kind)}
        };
        if (pid > 0) {
            response["pid"] = pid;
        }
        return response;
    }

    int CommandHandler::exit_code(const nlohmann::json& response) {
        if (!response.contains("error") || response["error"].is_null()) {
            return 0;
        }
        if (response.value("error_kind", "") == error_kind_to_string(ErrorKind::CONFIG_ERROR)) {
            return 2;
        }
        return 1;
    }

    std::string CommandHandler::to_json_text(const nlohmann::json& value, int indent) {
        // Command lines from /proc and argv are not guaranteed to be UTF-8
        return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string CommandHandler::format_text(const nlohmann::json& response) {
        if (response.contains("error") && !response["error"].is_null()) {
            return response["error"].get<std::string>();
        }

        const std::string cmd = response.value("CMD", "");
        const nlohmann::json& result = response["result"];
        std::ostringstream out;

        if (cmd == "start" || cmd == "restart") {
            out << "App started with PID " << result["pid"].get<pid_t>()
                << ". Logs are in " << result["log_file"].get<std::string>() << ".";
            if (result.value("ready", false)) {
                out << "\nApp is ready.";
            }
        } else if (cmd == "stop") {
            if (result["status"] == "already_stopped") {
                out << "App was already stopped.";
            } else {
                out << "App stopped (" << result["method"].get<std::string>() << ").";
            }
        } else if (cmd == "status") {
            out << result["state"].get<std::string>();
            if (result.contains("ready")) {
                out << "\nReady: " << (result["ready"].get<bool>() ? "yes" : "no");
                if (!result.value("probe_error", "").empty()) {
                    out << " (" << result["probe_error"].get<std::string>() << ")";
                }
            }
        } else if (cmd == "logs") {
            std::string lines = result["lines"].get<std::string>();
            if (!lines.empty() && lines.back() == '\n') {
                lines.pop_back();
            }
            out << lines;
        } else {
            out << to_json_text(result, 2);
        }

        return out.str();
    }

    nlohmann::json CommandHandler::handle_start() {
        StartResult started = supervisor_.start();

        nlohmann::json result = {
            {"status", "running"},
            {"pid", started.pid},
            {"log_file", started.log_file.string()},
            {"unmanaged", processes_to_json(started.unmanaged)}
        };
        if (started.ready_checked) {
            result["ready"] = true;
        }

        return {
            {"CMD", "start"},
            {"result", result},
            {"error", nullptr}
        };
    }

    nlohmann::json CommandHandler::handle_stop() {
        StopResult stopped = supervisor_.stop();

        nlohmann::json result = {
            {"status", stopped.method == ShutdownMethod::ALREADY_STOPPED ? "already_stopped"
                                                                         : "stopped"},
            {"method", shutdown_method_to_string(stopped.method)},
            {"pid", stopped.pid > 0 ? nlohmann::json(stopped.pid) : nlohmann::json(nullptr)}
        };

        return {
            {"CMD", "stop"},
            {"result", result},
            {"error", nullptr}
        };
    }

    nlohmann::json CommandHandler::handle_restart() {
        StartResult started = supervisor_.restart();

        nlohmann::json result = {
            {"status", "running"},
            {"pid", started.pid},
            {"log_file", started.log_file.string()},
            {"unmanaged", processes_to_json(started.unmanaged)}
        };
        if (started.ready_checked) {
            result["ready"] = true;
        }

        return {
            {"CMD", "restart"},
            {"result", result},
            {"error", nullptr}
        };
    }

    nlohmann::json CommandHandler::handle_status() {
        StatusReport report = supervisor_.status();
        bool running = report.state == RunState::RUNNING;

        nlohmann::json result = {
            {"running", running},
            {"state", run_state_to_string(report.state, report.pid)},
            {"pid", running ? nlohmann::json(report.pid) : nlohmann::json(nullptr)},
            {"pidfile", supervisor_.get_config().pidfile.string()},
            {"unmanaged", processes_to_json(report.unmanaged)}
        };
        if (report.ready) {
            result["ready"] = *report.ready;
            result["probe_error"] = report.probe_error;
        }

        return {
            {"CMD", "status"},
            {"result", result},
            {"error", nullptr}
        };
    }

    nlohmann::json CommandHandler::handle_logs(size_t lines) {
        const auto& log_file = supervisor_.get_config().logfile;
        LogManager log_manager(log_file);

        return {
            {"CMD", "logs"},
            {"result", {
                {"log_file", log_file.string()},
                {"lines", log_manager.get_last_lines(lines)}
            }},
            {"error", nullptr}
        };
    }

    nlohmann::json CommandHandler::handle_config() {
        return {
            {"CMD", "config"},
            {"result", ConfigManager::to_json(supervisor_.get_config())},
            {"error", nullptr}
        };
    }

} // namespace runctl
