/**
 * @file main.cpp
 * @brief Entry point for runctl
 *
 * runctl starts, stops and reports one configured background process.
 * Each invocation performs a single command and exits:
 * - start / restart: launch the target detached, record its PID
 * - stop: signal the recorded PID, remove the record
 * - status: print Running(pid) or NotRunning
 * - logs / config: inspect the target log and the effective settings
 *
 * Components:
 * - ArgParser: Parses the command line
 * - ConfigManager: Resolves defaults, config file, environment and flags
 * - AuditLogger: Tracks all supervisor actions
 * - Supervisor: PID Record, lock, launch and signal logic
 * - CommandHandler: Runs the command and renders the response
 */

#include <iostream>
#include <csignal>

#include "runctl/arg_parser.hpp"
#include "runctl/audit_logger.hpp"
#include "runctl/command_handler.hpp"
#include "runctl/config_manager.hpp"
#include "runctl/errors.hpp"
#include "runctl/supervisor.hpp"

using namespace runctl;

/**
 * @brief Print a response as JSON or text
 *
 * @param response Response envelope from CommandHandler
 * @param json Print the raw envelope
 * @return int Exit code for the response
 */
int print_response(const nlohmann::json& response, bool json) {
    int code = CommandHandler::exit_code(response);

    if (json) {
        std::cout << CommandHandler::to_json_text(response) << std::endl;
    } else if (code == 0) {
        std::cout << CommandHandler::format_text(response) << std::endl;
    } else {
        std::cerr << CommandHandler::format_text(response) << std::endl;
    }

    return code;
}

/**
 * @brief Run one supervisor command
 *
 * Resolves the configuration, then executes the command against the
 * configured target.
 *
 * @param args Parsed command line
 * @return int Exit code (0 success, 1 failure, 2 configuration error)
 */
int run_command(const ParsedArgs& args) {
    std::string cmd = ArgParser::command_to_string(args.command);

    SupervisorConfig config;
    try {
        ConfigManager config_manager;
        config = config_manager.load(args.config_file, args.options, args.target_argv);
    } catch (const SupervisorError& e) {
        return print_response(CommandHandler::make_error(cmd, e.kind(), e.what(), e.pid()),
                              args.json);
    }

    AuditLogger audit_logger(config.audit_log);
    Supervisor supervisor(config, audit_logger);
    CommandHandler command_handler(supervisor, audit_logger);

    return print_response(command_handler.execute(args.command, args.lines), args.json);
}

/**
 * @brief Main entry point
 *
 * Parses command-line arguments and dispatches the command.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code
 */
int main(int argc, char* argv[]) {
    // Probe connections must not kill runctl on a reset peer
    signal(SIGPIPE, SIG_IGN);

    ParsedArgs args = ArgParser::parse(argc, argv);

    if (args.show_help) {
        std::cout << ArgParser::get_help_message() << std::endl;
        return 0;
    }

    if (args.show_version) {
        std::cout << ArgParser::get_version_string() << std::endl;
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cerr << "Use --help for usage information" << std::endl;
        return 2;
    }

    if (args.command == Command::NONE) {
        std::cerr << ArgParser::get_help_message() << std::endl;
        return 2;
    }

    try {
        return run_command(args);
    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        return 1;
    }
}
