#include "cli/command_line.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <iostream>
#include <string>

using namespace redactor;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage:\n"
        "  redactor [--config FILE] scan <file> [--samples]\n"
        "  redactor [--config FILE] redact <file> [--out FILE]\n"
        "  redactor [--config FILE] patch <file> (--out FILE | --in-place)\n"
        "  redactor [--config FILE] verify <file>\n"
        "  redactor [--config FILE] scan-dir <dir> [--out-dir DIR]\n"
        "\n"
        "Exit codes: 0 success, 1 operation failed, 2 usage error\n";
}

void apply_logging(const LoggingConfig& logging) {
    utils::log::Level level = utils::log::Level::INFO;
    if (utils::log::parse_level(logging.level, level)) {
        utils::log::set_level(level);
    }
    if (!logging.file.empty() && !utils::log::set_file(logging.file)) {
        utils::log::warn(std::format("Cannot open log file {}; logging to stderr only", logging.file));
    }
}

template<typename T>
int report_failure(const std::string& command, const Result<T>& result) {
    utils::log::error(std::format("{} failed: [{}] {}", command,
        error_category_to_string(result.error_category()), result.error_message()));
    return kExitFailure;
}

int run(const CommandLine& cl, const RedactionPipeline& pipeline) {
    if (cl.command == "scan") {
        auto preview = pipeline.preview(cl.target, cl.samples);
        if (preview.is_error()) return report_failure(cl.command, preview);
        std::cout << preview.value().dump(2) << '\n';
        return kExitOk;
    }

    if (cl.command == "redact") {
        auto redacted = pipeline.redact(cl.target, cl.out);
        if (redacted.is_error()) return report_failure(cl.command, redacted);
        const auto& r = redacted.value();

        nlohmann::json counts = nlohmann::json::object();
        for (const auto category : kAllCategories) {
            counts[category_to_string(category)] = r.assessment.count(category);
        }
        counts["total"] = r.assessment.total;

        const nlohmann::json summary = {
            {"file_identity", r.file_identity},
            {"output", r.output_path},
            {"manifest", pipeline.config().manifest.manifest_path},
            {"substitutions", r.substitutions},
            {"distinct_values", r.entries.size()},
            {"counts", std::move(counts)},
        };
        std::cout << summary.dump(2) << '\n';
        return kExitOk;
    }

    if (cl.command == "patch") {
        auto patched = pipeline.patch(cl.target, cl.out, cl.in_place);
        if (patched.is_error()) return report_failure(cl.command, patched);
        const auto& p = patched.value();

        const nlohmann::json summary = {
            {"file_identity", p.file_identity},
            {"output", p.output_path},
            {"state", patch_state_to_string(p.state)},
            {"substitutions", p.substitutions},
        };
        std::cout << summary.dump(2) << '\n';
        return kExitOk;
    }

    if (cl.command == "verify") {
        auto verified = pipeline.verify(cl.target);
        if (verified.is_error()) return report_failure(cl.command, verified);
        std::cout << verify_report_to_json(verified.value()).dump(2) << '\n';
        return verified.value().ok ? kExitOk : kExitFailure;
    }

    // scan-dir
    auto scanned = pipeline.redact_directory(cl.target, cl.out_dir);
    if (scanned.is_error()) return report_failure(cl.command, scanned);
    const auto& d = scanned.value();

    const nlohmann::json summary = {
        {"dir", cl.target},
        {"files_scanned", d.files_scanned},
        {"files_with_findings", d.files_with_findings},
        {"files_skipped", d.files_skipped},
        {"files_ignored", d.files_ignored},
        {"total_redactions", d.total_redactions},
        {"manifest", pipeline.config().manifest.manifest_path},
    };
    std::cout << summary.dump(2) << '\n';
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto parsed = CommandLineParser::parse(argc, argv);
    if (!parsed.success) {
        if (!parsed.error_message.empty()) {
            std::cerr << parsed.error_message << '\n';
        }
        print_usage();
        return kExitUsage;
    }
    const CommandLine& cl = parsed.command_line;

    try {
        RedactorConfig config;
        if (!cl.config_file.empty()) {
            auto config_result = ConfigLoader::load_from_file(cl.config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitFailure;
            }
            config = std::move(config_result.config);
        }
        apply_logging(config.logging);
        utils::log::debug(std::format("Manifest: {}, policy: {}, keyword lines: {}",
            config.manifest.manifest_path, config.manifest.policy,
            keyword_line_mode_to_string(config.detector.keyword_line_mode)));

        const RedactionPipeline pipeline(config);
        return run(cl, pipeline);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}
