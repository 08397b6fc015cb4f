#pragma once

#include <string>
#include <utility>
#include <vector>

namespace redactor {

struct CommandLine {
    std::string config_file;
    std::string command;
    std::string target;
    std::string out;        // --out (redact, patch)
    std::string out_dir;    // --out-dir (scan-dir)
    bool samples = false;   // --samples (scan)
    bool in_place = false;  // --in-place (patch)
};

/**
 * @brief Command-line parser for the redactor CLI
 *
 * Each flag is accepted only by the commands it belongs to. A failed parse
 * with an empty error_message is a help request.
 */
class CommandLineParser {
public:
    struct ParseResult {
        bool success;
        std::string error_message;
        CommandLine command_line;

        static ParseResult ok(CommandLine cl) {
            ParseResult result;
            result.success = true;
            result.command_line = std::move(cl);
            return result;
        }

        static ParseResult error(std::string message) {
            ParseResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /// Arguments after the program name
    [[nodiscard]] static ParseResult parse(const std::vector<std::string>& args);

    [[nodiscard]] static ParseResult parse(int argc, char* argv[]);
};

} // namespace redactor
