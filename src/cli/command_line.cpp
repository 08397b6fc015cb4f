#include "cli/command_line.hpp"

#include <format>

namespace redactor {

CommandLineParser::ParseResult CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CommandLineParser::ParseResult CommandLineParser::parse(const std::vector<std::string>& args) {
    CommandLine cl;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--config" || arg == "--out" || arg == "--out-dir") {
            if (i + 1 >= args.size()) {
                return ParseResult::error(std::format("{} requires a value", arg));
            }
            const std::string& value = args[++i];
            if (arg == "--config") {
                cl.config_file = value;
            } else if (arg == "--out") {
                cl.out = value;
            } else {
                cl.out_dir = value;
            }
        } else if (arg == "--samples") {
            cl.samples = true;
        } else if (arg == "--in-place") {
            cl.in_place = true;
        } else if (arg == "-h" || arg == "--help") {
            return ParseResult::error("");
        } else if (arg.size() > 1 && arg[0] == '-') {
            return ParseResult::error(std::format("Unknown option: {}", arg));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return ParseResult::error(positional.empty() ? "" : "Expected a command and one path");
    }
    cl.command = positional[0];
    cl.target = positional[1];

    const bool known = cl.command == "scan" || cl.command == "redact" || cl.command == "patch" ||
                       cl.command == "verify" || cl.command == "scan-dir";
    if (!known) {
        return ParseResult::error(std::format("Unknown command: {}", cl.command));
    }
    if (cl.samples && cl.command != "scan") {
        return ParseResult::error("--samples only applies to scan");
    }
    if (cl.in_place && cl.command != "patch") {
        return ParseResult::error("--in-place only applies to patch");
    }
    if (!cl.out.empty() && cl.command != "redact" && cl.command != "patch") {
        return ParseResult::error(std::format("--out does not apply to {}", cl.command));
    }
    if (!cl.out_dir.empty() && cl.command != "scan-dir") {
        return ParseResult::error(std::format("--out-dir does not apply to {}", cl.command));
    }
    if (cl.command == "patch" && cl.in_place == !cl.out.empty()) {
        return ParseResult::error("patch requires exactly one of --out FILE or --in-place");
    }
    return ParseResult::ok(std::move(cl));
}

} // namespace redactor
