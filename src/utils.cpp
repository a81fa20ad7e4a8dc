//
// Created by opencode on 03/03/2026.
//

#include "runctl/utils.hpp"
#include <stdexcept>

namespace runctl {

    std::vector<std::string> split_command_line(const std::string& command) {
        std::vector<std::string> words;
        std::string current;
        bool in_word = false;

        enum class Quote { NONE, SINGLE, DOUBLE };
        Quote quote = Quote::NONE;

        for (size_t i = 0; i < command.length(); ++i) {
            char c = command[i];

            if (quote == Quote::SINGLE) {
                if (c == '\'') {
                    quote = Quote::NONE;
                } else {
                    current += c;
                }
                continue;
            }

            if (quote == Quote::DOUBLE) {
                if (c == '"') {
                    quote = Quote::NONE;
                } else if (c == '\\' && i + 1 < command.length() &&
                           (command[i + 1] == '"' || command[i + 1] == '\\')) {
                    current += command[++i];
                } else {
                    current += c;
                }
                continue;
            }

            if (c == ' ' || c == '\t' || c == '\n') {
                if (in_word) {
                    words.push_back(current);
                    current.clear();
                    in_word = false;
                }
            } else if (c == '\'') {
                quote = Quote::SINGLE;
                in_word = true;
            } else if (c == '"') {
                quote = Quote::DOUBLE;
                in_word = true;
            } else if (c == '\\' && i + 1 < command.length()) {
                current += command[++i];
                in_word = true;
            } else {
                current += c;
                in_word = true;
            }
        }

        if (quote != Quote::NONE) {
            throw std::invalid_argument("Unterminated quote in command: " + command);
        }

        if (in_word) {
            words.push_back(current);
        }

        return words;
    }

    std::string join_command_line(const std::vector<std::string>& argv) {
        std::string joined;
        for (const auto& arg : argv) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += arg;
        }
        return joined;
    }

} // namespace runctl
