/**
 * @file utils.hpp
 * @brief Utility functions for path expansion and command-line handling
 *
 * This header provides helper functions for:
 * - Expanding tilde (~) to user's home directory
 * - Resolving relative paths against a base directory
 * - Splitting a target command string into argv words
 * - Joining argv back into a single display / match string
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdlib>
#include <iostream>

namespace runctl {

    /**
     * @brief Expands a tilde (~) in a path to the user's home directory
     *
     * Examples:
     *   "~/.runctl"      → "/home/username/.runctl"
     *   "/absolute/path" → "/absolute/path" (unchanged)
     *   "relative/path"  → "relative/path" (unchanged)
     *
     * @param path The path string that may contain a tilde
     * @return std::filesystem::path The expanded path
     *
     * @note If HOME environment variable is not set, returns the original path
     */
    inline std::filesystem::path expand_tilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }

        const char* home = std::getenv("HOME");
        if (!home) {
            std::cerr << "HOME environment variable not set" << std::endl;
            return path;
        }

        // Skip "~/" to avoid treating the rest as an absolute path
        std::string rest = path.substr(1);
        if (!rest.empty() && rest[0] == '/') {
            rest = rest.substr(1);
        }

        return std::filesystem::path(home) / rest;
    }

    /**
     * @brief Gets the runctl state directory path
     *
     * @return std::filesystem::path Path to ~/.runctl
     */
    inline std::filesystem::path get_runctl_dir() {
        return expand_tilde("~/.runctl");
    }

    /**
     * @brief Expands a tilde and anchors a relative path at base
     *
     * @param path Path as written by the user (may be relative or use ~)
     * @param base Directory relative paths are resolved against
     * @return std::filesystem::path Absolute, lexically normalized path
     */
    inline std::filesystem::path resolve_path(const std::string& path,
                                              const std::filesystem::path& base) {
        std::filesystem::path expanded = expand_tilde(path);
        if (expanded.is_relative()) {
            expanded = base / expanded;
        }
        return expanded.lexically_normal();
    }

    /**
     * @brief Splits a command string into words
     *
     * Handles single quotes (literal), double quotes (backslash escapes
     * \" and \\ only) and backslash escapes outside quotes. No variable
     * expansion or globbing is done; the result is passed to exec directly.
     *
     * Examples:
     *   "python3 app.py"            → ["python3", "app.py"]
     *   "sh -c 'echo hi; sleep 1'"  → ["sh", "-c", "echo hi; sleep 1"]
     *
     * @param command The command string
     * @return std::vector<std::string> Argument vector
     * @throws std::invalid_argument on an unterminated quote
     */
    std::vector<std::string> split_command_line(const std::string& command);

    /**
     * @brief Joins argv with single spaces
     *
     * This is the form /proc/<pid>/cmdline takes once its NUL separators
     * are replaced, so it doubles as the default match pattern.
     */
    std::string join_command_line(const std::vector<std::string>& argv);

} // namespace runctl
